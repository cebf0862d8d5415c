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

#include "fastzoom/resample/area.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace fastzoom::resample {

namespace {

Image GrayRow(const std::vector<uint8_t>& values) {
  Image image(ImageDimensions{static_cast<uint32_t>(values.size()), 1},
              ImageFormat::kGray);
  for (size_t i = 0; i < values.size(); ++i) {
    image.At(0, static_cast<uint32_t>(i), 0) = values[i];
  }
  return image;
}

}  // namespace

// ============================================================================
// Tap Computation Tests
// ============================================================================

TEST(AreaTapsTest, IntegerFactor) {
  const auto taps = detail::ComputeAreaTaps(4, 2);
  ASSERT_EQ(taps.size(), 2u);
  ASSERT_EQ(taps[0].size(), 2u);
  EXPECT_EQ(taps[0][0].index, 0u);
  EXPECT_EQ(taps[0][1].index, 1u);
  EXPECT_DOUBLE_EQ(taps[0][0].weight, 0.5);
  EXPECT_EQ(taps[1][0].index, 2u);
}

TEST(AreaTapsTest, WeightsSumToOne) {
  for (uint32_t in : {1u, 3u, 7u, 300u}) {
    for (uint32_t out : {1u, 2u, 5u, 301u}) {
      const auto taps = detail::ComputeAreaTaps(in, out);
      for (const auto& output : taps) {
        double sum = 0.0;
        for (const auto& tap : output) {
          EXPECT_LT(tap.index, in);
          sum += tap.weight;
        }
        EXPECT_NEAR(sum, 1.0, 1e-12);
      }
    }
  }
}

// ============================================================================
// AreaResample Tests
// ============================================================================

TEST(AreaResampleTest, SameSizeIsIdentity) {
  const Image input = GrayRow({1, 2, 3});
  const Image output = AreaResample(input, input.GetDimensions());
  EXPECT_EQ(output.GetDimensions(), input.GetDimensions());
  EXPECT_EQ(output.At(0, 2, 0), 3);
}

TEST(AreaResampleTest, HalvesByAveraging) {
  const Image output = AreaResample(GrayRow({10, 30, 50, 70}),
                                    ImageDimensions{2, 1});
  EXPECT_EQ(output.At(0, 0, 0), 20);
  EXPECT_EQ(output.At(0, 1, 0), 60);
}

TEST(AreaResampleTest, FractionalFactor) {
  // Output pixels cover 1.5 input pixels each.
  const Image output = AreaResample(GrayRow({30, 60, 90}),
                                    ImageDimensions{2, 1});
  EXPECT_EQ(output.At(0, 0, 0), 40);
  EXPECT_EQ(output.At(0, 1, 0), 80);
}

TEST(AreaResampleTest, SlightEnlargement) {
  const Image output = AreaResample(GrayRow({0, 90}), ImageDimensions{3, 1});
  EXPECT_EQ(output.At(0, 0, 0), 0);
  EXPECT_EQ(output.At(0, 1, 0), 45);
  EXPECT_EQ(output.At(0, 2, 0), 90);
}

TEST(AreaResampleTest, ConstantImageStaysConstant) {
  Image input(ImageDimensions{7, 5}, ImageFormat::kRGBA);
  input.Fill({10, 20, 30, 40});

  const Image output = AreaResample(input, ImageDimensions{3, 2});
  EXPECT_EQ(output.GetFormat(), ImageFormat::kRGBA);
  for (uint32_t y = 0; y < 2; ++y) {
    for (uint32_t x = 0; x < 3; ++x) {
      EXPECT_EQ(output.At(y, x, 0), 10);
      EXPECT_EQ(output.At(y, x, 1), 20);
      EXPECT_EQ(output.At(y, x, 2), 30);
      EXPECT_EQ(output.At(y, x, 3), 40);
    }
  }
}

TEST(AreaResampleTest, TwoDimensionalBlocks) {
  Image input(ImageDimensions{2, 2}, ImageFormat::kRGB);
  input.At(0, 0, 0) = 0;
  input.At(0, 1, 0) = 100;
  input.At(1, 0, 0) = 200;
  input.At(1, 1, 0) = 100;

  const Image output = AreaResample(input, ImageDimensions{1, 1});
  EXPECT_EQ(output.At(0, 0, 0), 100);
  EXPECT_EQ(output.At(0, 0, 1), 0);
}

TEST(AreaResampleTest, RejectsEmpty) {
  EXPECT_THROW(AreaResample(Image(), ImageDimensions{1, 1}),
               std::invalid_argument);
  EXPECT_THROW(AreaResample(GrayRow({1}), ImageDimensions{0, 1}),
               std::invalid_argument);
}

}  // namespace fastzoom::resample
