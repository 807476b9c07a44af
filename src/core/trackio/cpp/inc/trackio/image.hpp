// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "timestamp.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace trackio
{

// Identifies one of the two cameras on the device
enum class Camera
{
    Left,
    Right,
};

// Maps the service's raw image id (0 or 1) to a Camera.
// Throws std::invalid_argument for any other id.
Camera camera_from_id(int32_t id);

/**
 * @brief An entry in the distortion map.
 *
 * Holds the u/v texture coordinates used to look up the corresponding pixel in
 * the raw camera image. The map is smaller than the image, so entries need to
 * be interpolated.
 */
struct DistortionEntry
{
    float u = 0.0f;
    float v = 0.0f;

    // False when there is no valid camera data for this area of the image
    bool is_valid() const
    {
        return u >= 0.0f && u <= 1.0f && v >= 0.0f && v <= 1.0f;
    }
};

// Read-only view of the pixel data of an Image. Shares ownership of the
// pixel buffer, so it stays valid after the Image or ImageList it came from
// has been replaced or destroyed.
class ImageData
{
public:
    ImageData(std::shared_ptr<const std::vector<uint8_t>> buffer, size_t width, size_t height)
        : buffer_(std::move(buffer)), width_(width), height_(height)
    {
    }

    const uint8_t* raw() const
    {
        return buffer_->data();
    }

    size_t size() const
    {
        return width_ * height_;
    }

    // Throws std::out_of_range outside the image
    uint8_t pixel(size_t x, size_t y) const;

    // Pointer to the first byte of row y (width() bytes long), valid while this view lives
    const uint8_t* row(size_t y) const;

    size_t width() const
    {
        return width_;
    }
    size_t height() const
    {
        return height_;
    }

private:
    std::shared_ptr<const std::vector<uint8_t>> buffer_;
    size_t width_;
    size_t height_;
};

// Read-only view of the distortion calibration map of an Image. Shares
// ownership of the map like ImageData.
class DistortionData
{
public:
    DistortionData(std::shared_ptr<const std::vector<float>> map, size_t stride, size_t height)
        : map_(std::move(map)), stride_(stride), height_(height)
    {
    }

    // Number of entries per row (each entry is a u/v pair)
    size_t width() const
    {
        return stride_ / 2;
    }

    size_t height() const
    {
        return height_;
    }

    // Throws std::out_of_range outside the map
    DistortionEntry entry(size_t x, size_t y) const;

    const float* raw() const
    {
        return map_->data();
    }

private:
    std::shared_ptr<const std::vector<float>> map_;
    size_t stride_;
    size_t height_;
};

/**
 * @brief A raw camera image, alongside its calibration data.
 *
 * Pixel and distortion buffers are shared between copies, so copying an Image
 * or an ImageList is cheap.
 */
class Image
{
public:
    static constexpr size_t kDistortionWidth = 64;
    static constexpr size_t kDistortionHeight = 64;
    static constexpr size_t kDistortionStride = kDistortionWidth * 2;

    /**
     * @throws std::invalid_argument if @p pixels does not hold width * height * bytes_per_pixel
     *         bytes, or @p distortion does not hold kDistortionStride * kDistortionHeight floats.
     */
    Image(int64_t sequence_id,
          Camera camera,
          Timestamp timestamp,
          size_t width,
          size_t height,
          size_t bytes_per_pixel,
          std::shared_ptr<const std::vector<uint8_t>> pixels,
          std::shared_ptr<const std::vector<float>> distortion);

    bool is_valid() const
    {
        return pixels_ != nullptr;
    }

    int64_t sequence_id() const
    {
        return sequence_id_;
    }

    Camera camera() const
    {
        return camera_;
    }

    Timestamp timestamp() const
    {
        return timestamp_;
    }

    size_t width() const
    {
        return width_;
    }
    size_t height() const
    {
        return height_;
    }
    size_t bytes_per_pixel() const
    {
        return bytes_per_pixel_;
    }

    const std::vector<uint8_t>& raw_data() const
    {
        return *pixels_;
    }

    ImageData data() const
    {
        return ImageData(pixels_, width_ * bytes_per_pixel_, height_);
    }

    const std::vector<float>& raw_distortion() const
    {
        return *distortion_;
    }

    DistortionData distortion() const
    {
        return DistortionData(distortion_, kDistortionStride, kDistortionHeight);
    }

private:
    int64_t sequence_id_;
    Camera camera_;
    Timestamp timestamp_;
    size_t width_;
    size_t height_;
    size_t bytes_per_pixel_;
    std::shared_ptr<const std::vector<uint8_t>> pixels_;
    std::shared_ptr<const std::vector<float>> distortion_;
};

// The most recent set of images captured by the device
class ImageList
{
public:
    ImageList() = default;
    explicit ImageList(std::vector<Image> images) : images_(std::move(images))
    {
    }

    size_t size() const
    {
        return images_.size();
    }

    bool empty() const
    {
        return images_.empty();
    }

    // Throws std::out_of_range for an invalid index
    const Image& operator[](size_t index) const
    {
        return images_.at(index);
    }

    std::vector<Image>::const_iterator begin() const
    {
        return images_.begin();
    }
    std::vector<Image>::const_iterator end() const
    {
        return images_.end();
    }

private:
    std::vector<Image> images_;
};

} // namespace trackio
