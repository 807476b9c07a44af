// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/image.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace trackio
{

Camera camera_from_id(int32_t id)
{
    switch (id)
    {
    case 0:
        return Camera::Left;
    case 1:
        return Camera::Right;
    default:
        throw std::invalid_argument("Invalid camera image id: " + std::to_string(id));
    }
}

uint8_t ImageData::pixel(size_t x, size_t y) const
{
    if (x >= width_ || y >= height_)
    {
        throw std::out_of_range("ImageData::pixel: (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") is outside the image");
    }
    return (*buffer_)[y * width_ + x];
}

const uint8_t* ImageData::row(size_t y) const
{
    if (y >= height_)
    {
        throw std::out_of_range("ImageData::row: " + std::to_string(y) + " is outside the image");
    }
    return buffer_->data() + y * width_;
}

DistortionEntry DistortionData::entry(size_t x, size_t y) const
{
    if (x >= width() || y >= height_)
    {
        throw std::out_of_range("DistortionData::entry: (" + std::to_string(x) + ", " + std::to_string(y) +
                                ") is outside the map");
    }
    const float* e = map_->data() + y * stride_ + x * 2;
    return DistortionEntry{ e[0], e[1] };
}

Image::Image(int64_t sequence_id,
             Camera camera,
             Timestamp timestamp,
             size_t width,
             size_t height,
             size_t bytes_per_pixel,
             std::shared_ptr<const std::vector<uint8_t>> pixels,
             std::shared_ptr<const std::vector<float>> distortion)
    : sequence_id_(sequence_id),
      camera_(camera),
      timestamp_(timestamp),
      width_(width),
      height_(height),
      bytes_per_pixel_(bytes_per_pixel),
      pixels_(std::move(pixels)),
      distortion_(std::move(distortion))
{
    if (!pixels_ || pixels_->size() != width_ * height_ * bytes_per_pixel_)
    {
        throw std::invalid_argument("Image: pixel buffer does not match " + std::to_string(width_) + "x" +
                                    std::to_string(height_) + "x" + std::to_string(bytes_per_pixel_));
    }
    if (!distortion_ || distortion_->size() != kDistortionStride * kDistortionHeight)
    {
        throw std::invalid_argument("Image: distortion map must hold " +
                                    std::to_string(kDistortionStride * kDistortionHeight) + " floats");
    }
}

} // namespace trackio
