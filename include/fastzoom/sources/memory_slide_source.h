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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_SOURCES_MEMORY_SLIDE_SOURCE_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_SOURCES_MEMORY_SLIDE_SOURCE_H_

#include <memory>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastzoom/image.h"
#include "fastzoom/slide_source.h"

namespace fastzoom {

/// @brief SlideSource backed by images held in memory
///
/// Tier 0 is the given image; every further tier is an area-averaged copy
/// of size max(1, floor(dimension / downsample)). All tiers are stored as
/// RGBA. Reads never mutate state, so concurrent ReadRegion calls are safe.
class MemorySlideSource final : public SlideSource {
 public:
  /// @brief Build a source and its tiers
  ///
  /// @param image Full resolution image (RGB or RGBA, non-empty)
  /// @param downsamples Tier factors; must start at 1.0 and increase
  ///        strictly. Empty means a single tier.
  /// @param properties Descriptive properties (background hint)
  static absl::StatusOr<std::unique_ptr<MemorySlideSource>> Create(
      const Image& image, std::vector<double> downsamples = {1.0},
      SlideProperties properties = {});

  [[nodiscard]] int GetTierCount() const override {
    return static_cast<int>(tiers_.size());
  }

  [[nodiscard]] absl::StatusOr<SourceTier> GetTierInfo(
      int tier) const override;

  [[nodiscard]] absl::StatusOr<Image> ReadRegion(
      const RegionLocation& location, int tier,
      const ImageDimensions& size) const override;

  [[nodiscard]] const SlideProperties& GetProperties() const override {
    return properties_;
  }

  /// @brief Stored pixels of a tier (RGBA); the caller validates the index
  [[nodiscard]] const Image& GetTierImage(int tier) const {
    return images_[static_cast<size_t>(tier)];
  }

 private:
  MemorySlideSource(std::vector<SourceTier> tiers, std::vector<Image> images,
                    SlideProperties properties)
      : tiers_(std::move(tiers)),
        images_(std::move(images)),
        properties_(std::move(properties)) {}

  std::vector<SourceTier> tiers_;
  std::vector<Image> images_;
  SlideProperties properties_;
};

/// @brief Convert an RGB or gray image to RGBA with opaque alpha
absl::StatusOr<Image> ToRGBA(const Image& image);

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_SOURCES_MEMORY_SLIDE_SOURCE_H_
