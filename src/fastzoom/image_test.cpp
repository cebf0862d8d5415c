// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fastzoom/image.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fastzoom {

class ImageTest : public ::testing::Test {
 protected:
  void SetUp() override {}

  void TearDown() override {}
};

// Test basic image creation and properties
TEST_F(ImageTest, BasicImageCreation) {
  ImageDimensions dims{100, 50};
  Image rgb_image(dims, ImageFormat::kRGB);

  EXPECT_EQ(rgb_image.GetWidth(), 100u);
  EXPECT_EQ(rgb_image.GetHeight(), 50u);
  EXPECT_EQ(rgb_image.GetChannels(), 3u);
  EXPECT_EQ(rgb_image.GetFormat(), ImageFormat::kRGB);
  EXPECT_FALSE(rgb_image.HasAlpha());
  EXPECT_FALSE(rgb_image.Empty());
  EXPECT_EQ(rgb_image.SizeBytes(), 100u * 50u * 3u);
  EXPECT_EQ(rgb_image.GetStride(), 300u);
}

TEST_F(ImageTest, DifferentFormats) {
  ImageDimensions dims{10, 10};

  Image gray_image(dims, ImageFormat::kGray);
  EXPECT_EQ(gray_image.GetChannels(), 1u);
  EXPECT_EQ(gray_image.SizeBytes(), 100u);

  Image rgba_image(dims, ImageFormat::kRGBA);
  EXPECT_EQ(rgba_image.GetChannels(), 4u);
  EXPECT_TRUE(rgba_image.HasAlpha());
  EXPECT_EQ(rgba_image.SizeBytes(), 400u);
}

TEST_F(ImageTest, NewImageIsZeroFilled) {
  Image image(ImageDimensions{3, 2}, ImageFormat::kRGBA);
  for (size_t i = 0; i < image.SizeBytes(); ++i) {
    EXPECT_EQ(image.GetData()[i], 0);
  }
}

TEST_F(ImageTest, PixelAccess) {
  Image image(ImageDimensions{4, 3}, ImageFormat::kRGB);
  image.At(2, 1, 0) = 10;
  image.At(2, 1, 2) = 30;

  EXPECT_EQ(image.At(2, 1, 0), 10);
  EXPECT_EQ(image.At(2, 1, 1), 0);
  EXPECT_EQ(image.At(2, 1, 2), 30);
  // Row 2 starts 2 * stride bytes in; pixel 1 adds 3 samples.
  EXPECT_EQ(image.GetRow(2)[3], 10);
}

TEST_F(ImageTest, BoundsChecking) {
  Image image(ImageDimensions{4, 3}, ImageFormat::kRGB);
  EXPECT_THROW((void)image.At(3, 0, 0), std::out_of_range);
  EXPECT_THROW((void)image.At(0, 4, 0), std::out_of_range);
  EXPECT_THROW((void)image.At(0, 0, 3), std::out_of_range);
  EXPECT_NO_THROW((void)image.At(2, 3, 2));
}

TEST_F(ImageTest, Fill) {
  Image image(ImageDimensions{5, 5}, ImageFormat::kRGBA);
  image.Fill({1, 2, 3, 4});
  EXPECT_EQ(image.At(4, 4, 0), 1);
  EXPECT_EQ(image.At(4, 4, 3), 4);
  EXPECT_EQ(image.At(0, 2, 2), 3);

  EXPECT_THROW(image.Fill({1, 2, 3}), std::invalid_argument);
}

TEST_F(ImageTest, PasteClipsToDestination) {
  Image dest(ImageDimensions{4, 4}, ImageFormat::kGray);
  Image src(ImageDimensions{3, 3}, ImageFormat::kGray);
  src.Fill({9});

  dest.Paste(src, 2, 2);
  EXPECT_EQ(dest.At(1, 1, 0), 0);
  EXPECT_EQ(dest.At(2, 2, 0), 9);
  EXPECT_EQ(dest.At(3, 3, 0), 9);
  EXPECT_EQ(dest.At(2, 1, 0), 0);

  // Entirely outside: no-op
  dest.Paste(src, 10, 0);
  EXPECT_EQ(dest.At(0, 3, 0), 0);
}

TEST_F(ImageTest, PasteClipsNegativeOffsets) {
  Image dest(ImageDimensions{3, 3}, ImageFormat::kGray);
  Image src(ImageDimensions{4, 4}, ImageFormat::kGray);
  for (uint32_t y = 0; y < 4; ++y) {
    for (uint32_t x = 0; x < 4; ++x) {
      src.At(y, x, 0) = static_cast<uint8_t>(10 * y + x);
    }
  }

  dest.Paste(src, -2, -1);
  EXPECT_EQ(dest.At(0, 0, 0), 12);
  EXPECT_EQ(dest.At(0, 1, 0), 13);
  EXPECT_EQ(dest.At(2, 1, 0), 33);
  // Source column 4 does not exist.
  EXPECT_EQ(dest.At(0, 2, 0), 0);

  // Entirely before the destination: no-op
  Image untouched(ImageDimensions{3, 3}, ImageFormat::kGray);
  untouched.Paste(src, -4, 0);
  EXPECT_EQ(untouched.At(1, 0, 0), 0);
}

TEST_F(ImageTest, PasteRejectsFormatMismatch) {
  Image dest(ImageDimensions{4, 4}, ImageFormat::kRGB);
  Image src(ImageDimensions{2, 2}, ImageFormat::kRGBA);
  EXPECT_THROW(dest.Paste(src, 0, 0), std::invalid_argument);
}

TEST_F(ImageTest, EmptyImageHandling) {
  Image empty;
  EXPECT_TRUE(empty.Empty());
  EXPECT_EQ(empty.SizeBytes(), 0u);

  Image zero_width(ImageDimensions{0, 10}, ImageFormat::kRGB);
  EXPECT_TRUE(zero_width.Empty());
}

TEST_F(ImageTest, DescriptionString) {
  Image image(ImageDimensions{256, 128}, ImageFormat::kRGBA);
  EXPECT_EQ(image.GetDescription(), "RGBA 256x128");

  std::ostringstream os;
  os << image;
  EXPECT_EQ(os.str(), "RGBA 256x128");
}

}  // namespace fastzoom
