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

#include "fastzoom/sources/memory_slide_source.h"

#include <gtest/gtest.h>

#include <vector>

namespace fastzoom {

namespace {

/// RGB image where pixel (x, y) = (x, y, 7)
Image Coordinates(uint32_t width, uint32_t height) {
  Image image(ImageDimensions{width, height}, ImageFormat::kRGB);
  for (uint32_t y = 0; y < height; ++y) {
    for (uint32_t x = 0; x < width; ++x) {
      image.At(y, x, 0) = static_cast<uint8_t>(x);
      image.At(y, x, 1) = static_cast<uint8_t>(y);
      image.At(y, x, 2) = 7;
    }
  }
  return image;
}

}  // namespace

// ============================================================================
// Construction Tests
// ============================================================================

TEST(MemorySlideSourceTest, SingleTier) {
  auto source = MemorySlideSource::Create(Coordinates(10, 6));
  ASSERT_TRUE(source.ok()) << source.status();

  EXPECT_EQ((*source)->GetTierCount(), 1);
  auto tier = (*source)->GetTierInfo(0);
  ASSERT_TRUE(tier.ok());
  EXPECT_EQ(tier->dimensions, (ImageDimensions{10, 6}));
  EXPECT_DOUBLE_EQ(tier->downsample, 1.0);
  EXPECT_EQ((*source)->GetTierImage(0).GetFormat(), ImageFormat::kRGBA);
}

TEST(MemorySlideSourceTest, TierDimensionsRoundDown) {
  auto source = MemorySlideSource::Create(Coordinates(10, 6), {1.0, 4.0, 32.0});
  ASSERT_TRUE(source.ok()) << source.status();

  auto tiers = (*source)->GetTiers();
  ASSERT_TRUE(tiers.ok());
  ASSERT_EQ(tiers->size(), 3u);
  EXPECT_EQ((*tiers)[1].dimensions, (ImageDimensions{2, 1}));
  EXPECT_EQ((*tiers)[2].dimensions, (ImageDimensions{1, 1}));
  EXPECT_EQ((*source)->GetTierImage(1).GetDimensions(),
            (ImageDimensions{2, 1}));
}

TEST(MemorySlideSourceTest, EmptyDownsamplesMeansSingleTier) {
  auto source = MemorySlideSource::Create(Coordinates(4, 4), {});
  ASSERT_TRUE(source.ok());
  EXPECT_EQ((*source)->GetTierCount(), 1);
}

TEST(MemorySlideSourceTest, RejectsBadConfiguration) {
  EXPECT_EQ(MemorySlideSource::Create(Image()).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(MemorySlideSource::Create(Coordinates(4, 4), {2.0}).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(
      MemorySlideSource::Create(Coordinates(4, 4), {1.0, 4.0, 2.0})
          .status()
          .code(),
      absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(
      MemorySlideSource::Create(Coordinates(4, 4), {1.0, 1.0}).status().code(),
      absl::StatusCode::kInvalidArgument);
}

TEST(MemorySlideSourceTest, TierOutOfRange) {
  auto source = MemorySlideSource::Create(Coordinates(4, 4));
  ASSERT_TRUE(source.ok());
  EXPECT_EQ((*source)->GetTierInfo(1).status().code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ((*source)->GetTierInfo(-1).status().code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ((*source)
                ->ReadRegion(RegionLocation{0, 0}, 3, ImageDimensions{1, 1})
                .status()
                .code(),
            absl::StatusCode::kOutOfRange);
}

TEST(MemorySlideSourceTest, Properties) {
  SlideProperties properties;
  properties.background_color = "#ff0000";
  auto source =
      MemorySlideSource::Create(Coordinates(4, 4), {1.0}, properties);
  ASSERT_TRUE(source.ok());
  EXPECT_EQ((*source)->GetProperties().background_color, "#ff0000");
}

// ============================================================================
// ReadRegion Tests
// ============================================================================

TEST(MemorySlideSourceTest, ReadInsideImage) {
  auto source = MemorySlideSource::Create(Coordinates(10, 6));
  ASSERT_TRUE(source.ok());

  auto region =
      (*source)->ReadRegion(RegionLocation{3, 2}, 0, ImageDimensions{4, 3});
  ASSERT_TRUE(region.ok()) << region.status();
  EXPECT_EQ(region->GetFormat(), ImageFormat::kRGBA);
  EXPECT_EQ(region->GetDimensions(), (ImageDimensions{4, 3}));
  EXPECT_EQ(region->At(0, 0, 0), 3);
  EXPECT_EQ(region->At(0, 0, 1), 2);
  EXPECT_EQ(region->At(2, 3, 0), 6);
  EXPECT_EQ(region->At(2, 3, 1), 4);
  EXPECT_EQ(region->At(2, 3, 3), 255);
}

TEST(MemorySlideSourceTest, ReadOutsideIsTransparent) {
  auto source = MemorySlideSource::Create(Coordinates(4, 4));
  ASSERT_TRUE(source.ok());

  auto region =
      (*source)->ReadRegion(RegionLocation{-2, -2}, 0, ImageDimensions{4, 4});
  ASSERT_TRUE(region.ok());
  EXPECT_EQ(region->At(0, 0, 3), 0);
  EXPECT_EQ(region->At(1, 3, 3), 0);
  EXPECT_EQ(region->At(2, 2, 0), 0);
  EXPECT_EQ(region->At(2, 2, 3), 255);
  EXPECT_EQ(region->At(3, 3, 0), 1);
  EXPECT_EQ(region->At(3, 3, 1), 1);

  auto beyond =
      (*source)->ReadRegion(RegionLocation{100, 100}, 0, ImageDimensions{2, 2});
  ASSERT_TRUE(beyond.ok());
  EXPECT_EQ(beyond->At(1, 1, 3), 0);

  auto before =
      (*source)->ReadRegion(RegionLocation{-10, 1}, 0, ImageDimensions{3, 3});
  ASSERT_TRUE(before.ok());
  EXPECT_EQ(before->At(0, 2, 3), 0);
}

TEST(MemorySlideSourceTest, ReadLargerThanImage) {
  auto source = MemorySlideSource::Create(Coordinates(4, 4));
  ASSERT_TRUE(source.ok());

  auto region =
      (*source)->ReadRegion(RegionLocation{-1, -1}, 0, ImageDimensions{6, 6});
  ASSERT_TRUE(region.ok());
  for (uint32_t i = 0; i < 6; ++i) {
    EXPECT_EQ(region->At(0, i, 3), 0);
    EXPECT_EQ(region->At(5, i, 3), 0);
    EXPECT_EQ(region->At(i, 0, 3), 0);
    EXPECT_EQ(region->At(i, 5, 3), 0);
  }
  EXPECT_EQ(region->At(1, 1, 0), 0);
  EXPECT_EQ(region->At(4, 4, 0), 3);
  EXPECT_EQ(region->At(4, 4, 1), 3);
  EXPECT_EQ(region->At(4, 4, 3), 255);
}

TEST(MemorySlideSourceTest, LocationIsInTierZeroCoordinates) {
  Image image(ImageDimensions{8, 8}, ImageFormat::kRGB);
  image.Fill({50, 60, 70});
  auto source = MemorySlideSource::Create(image, {1.0, 2.0});
  ASSERT_TRUE(source.ok());

  // Tier-0 location (6, 6) is tier-1 pixel (3, 3), the last one.
  auto region =
      (*source)->ReadRegion(RegionLocation{6, 6}, 1, ImageDimensions{2, 2});
  ASSERT_TRUE(region.ok());
  EXPECT_EQ(region->At(0, 0, 0), 50);
  EXPECT_EQ(region->At(0, 0, 3), 255);
  EXPECT_EQ(region->At(1, 1, 3), 0);
  EXPECT_EQ(region->At(0, 1, 3), 0);
}

TEST(MemorySlideSourceTest, RejectsEmptyRead) {
  auto source = MemorySlideSource::Create(Coordinates(4, 4));
  ASSERT_TRUE(source.ok());
  EXPECT_EQ((*source)
                ->ReadRegion(RegionLocation{0, 0}, 0, ImageDimensions{0, 2})
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(MemorySlideSourceTest, DefaultBestTier) {
  auto source = MemorySlideSource::Create(Coordinates(64, 64), {1.0, 4.0});
  ASSERT_TRUE(source.ok());
  auto tiers = (*source)->GetTiers();
  ASSERT_TRUE(tiers.ok());
  EXPECT_EQ((*source)->GetBestTierForDownsample(*tiers, 1.0), 0);
  EXPECT_EQ((*source)->GetBestTierForDownsample(*tiers, 2.0), 0);
  EXPECT_EQ((*source)->GetBestTierForDownsample(*tiers, 4.0), 1);
  EXPECT_EQ((*source)->GetBestTierForDownsample(*tiers, 64.0), 1);
}

TEST(MemorySlideSourceTest, BestTierUsesGivenTable) {
  auto source = MemorySlideSource::Create(Coordinates(64, 64), {1.0, 4.0});
  ASSERT_TRUE(source.ok());
  const std::vector<SourceTier> table = {
      SourceTier(ImageDimensions{64, 64}, 1.0),
      SourceTier(ImageDimensions{32, 32}, 2.0),
      SourceTier(ImageDimensions{8, 8}, 8.0)};
  EXPECT_EQ((*source)->GetBestTierForDownsample(table, 2.0), 1);
  EXPECT_EQ((*source)->GetBestTierForDownsample(table, 16.0), 2);
}

// ============================================================================
// ToRGBA Tests
// ============================================================================

TEST(ToRGBATest, ExpandsGrayAndRGB) {
  Image gray(ImageDimensions{1, 1}, ImageFormat::kGray);
  gray.Fill({42});
  auto from_gray = ToRGBA(gray);
  ASSERT_TRUE(from_gray.ok());
  EXPECT_EQ(from_gray->At(0, 0, 0), 42);
  EXPECT_EQ(from_gray->At(0, 0, 2), 42);
  EXPECT_EQ(from_gray->At(0, 0, 3), 255);

  Image rgb(ImageDimensions{1, 1}, ImageFormat::kRGB);
  rgb.Fill({1, 2, 3});
  auto from_rgb = ToRGBA(rgb);
  ASSERT_TRUE(from_rgb.ok());
  EXPECT_EQ(from_rgb->At(0, 0, 2), 3);
  EXPECT_EQ(from_rgb->At(0, 0, 3), 255);
}

}  // namespace fastzoom
