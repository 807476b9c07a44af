// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Unit tests for Image, ImageList and their data views

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <trackio/image.hpp>

#include <memory>
#include <stdexcept>
#include <vector>

using namespace trackio;

namespace
{

std::shared_ptr<const std::vector<float>> identity_distortion()
{
    auto map = std::make_shared<std::vector<float>>(Image::kDistortionStride * Image::kDistortionHeight, 0.5f);
    // Mark the top-left entry as outside the camera's view
    (*map)[0] = -1.0f;
    return map;
}

Image make_image(size_t width, size_t height, size_t bpp)
{
    auto pixels = std::make_shared<std::vector<uint8_t>>(width * height * bpp);
    for (size_t i = 0; i < pixels->size(); ++i)
    {
        (*pixels)[i] = static_cast<uint8_t>(i % 256);
    }
    return Image(7, Camera::Right, Timestamp::from_raw(1000), width, height, bpp, pixels, identity_distortion());
}

} // anonymous namespace

TEST_CASE("camera_from_id maps known ids", "[image]")
{
    CHECK(camera_from_id(0) == Camera::Left);
    CHECK(camera_from_id(1) == Camera::Right);
    CHECK_THROWS_AS(camera_from_id(2), std::invalid_argument);
    CHECK_THROWS_AS(camera_from_id(-1), std::invalid_argument);
}

TEST_CASE("Image exposes its metadata", "[image]")
{
    const Image image = make_image(8, 4, 1);

    CHECK(image.is_valid());
    CHECK(image.sequence_id() == 7);
    CHECK(image.camera() == Camera::Right);
    CHECK(image.timestamp() == Timestamp::from_raw(1000));
    CHECK(image.width() == 8);
    CHECK(image.height() == 4);
    CHECK(image.raw_data().size() == 32);
}

TEST_CASE("Image rejects mismatched buffers", "[image]")
{
    auto pixels = std::make_shared<std::vector<uint8_t>>(10);

    SECTION("pixel buffer too small")
    {
        CHECK_THROWS_AS(Image(0, Camera::Left, Timestamp(), 8, 4, 1, pixels, identity_distortion()),
                        std::invalid_argument);
    }

    SECTION("distortion map too small")
    {
        auto distortion = std::make_shared<std::vector<float>>(16);
        CHECK_THROWS_AS(Image(0, Camera::Left, Timestamp(), 5, 2, 1, pixels, distortion), std::invalid_argument);
    }

    SECTION("null pixel buffer")
    {
        CHECK_THROWS_AS(Image(0, Camera::Left, Timestamp(), 0, 0, 1, nullptr, identity_distortion()),
                        std::invalid_argument);
    }
}

TEST_CASE("ImageData addresses rows including bytes per pixel", "[image]")
{
    const Image image = make_image(4, 3, 2);
    const ImageData data = image.data();

    CHECK(data.width() == 8);
    CHECK(data.height() == 3);
    CHECK(data.size() == 24);

    CHECK(data.pixel(0, 0) == 0);
    CHECK(data.pixel(7, 0) == 7);
    CHECK(data.pixel(1, 2) == 17);
    CHECK(data.row(1)[0] == 8);

    CHECK_THROWS_AS(data.pixel(8, 0), std::out_of_range);
    CHECK_THROWS_AS(data.pixel(0, 3), std::out_of_range);
    CHECK_THROWS_AS(data.row(3), std::out_of_range);
}

TEST_CASE("DistortionData entries", "[image]")
{
    const Image image = make_image(2, 2, 1);
    const DistortionData distortion = image.distortion();

    CHECK(distortion.width() == Image::kDistortionWidth);
    CHECK(distortion.height() == Image::kDistortionHeight);

    const DistortionEntry corner = distortion.entry(0, 0);
    CHECK_FALSE(corner.is_valid());

    const DistortionEntry inside = distortion.entry(10, 10);
    CHECK(inside.is_valid());
    CHECK(inside.u == Catch::Approx(0.5f));
    CHECK(inside.v == Catch::Approx(0.5f));

    CHECK_THROWS_AS(distortion.entry(Image::kDistortionWidth, 0), std::out_of_range);
    CHECK_THROWS_AS(distortion.entry(0, Image::kDistortionHeight), std::out_of_range);
}

TEST_CASE("Data views outlive the image they came from", "[image]")
{
    std::unique_ptr<ImageData> data;
    std::unique_ptr<DistortionData> distortion;
    {
        ImageList list({ make_image(4, 2, 1) });
        data = std::make_unique<ImageData>(list[0].data());
        distortion = std::make_unique<DistortionData>(ImageList(list)[0].distortion());
    }

    CHECK(data->pixel(3, 1) == 7);
    CHECK(data->row(1)[0] == 4);
    CHECK_FALSE(distortion->entry(0, 0).is_valid());
    CHECK(distortion->entry(1, 1).u == Catch::Approx(0.5f));
}

TEST_CASE("ImageList indexing", "[image]")
{
    ImageList empty;
    CHECK(empty.empty());
    CHECK(empty.size() == 0);
    CHECK_THROWS_AS(empty[0], std::out_of_range);

    ImageList list({ make_image(2, 2, 1), make_image(2, 2, 1) });
    CHECK(list.size() == 2);

    size_t visited = 0;
    for (const Image& image : list)
    {
        CHECK(image.width() == 2);
        ++visited;
    }
    CHECK(visited == 2);
}
