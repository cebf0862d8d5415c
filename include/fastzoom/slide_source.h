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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_SLIDE_SOURCE_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_SLIDE_SOURCE_H_

#include <span>
#include <vector>

#include "absl/status/statusor.h"
#include "fastzoom/core/size.h"
#include "fastzoom/core/source_descriptor.h"
#include "fastzoom/image.h"

namespace fastzoom {

/// @brief Abstract multi-resolution image the generator renders from
///
/// Implementations wrap a concrete image store (a slide file, an in-memory
/// pyramid, a remote service). The generator only needs the tier table, a
/// region read and the background hint.
///
/// ReadRegion may be called from several threads at once; implementations
/// must be safe for concurrent reads.
class SlideSource {
 public:
  SlideSource() = default;
  virtual ~SlideSource() = default;

  SlideSource(const SlideSource&) = delete;
  SlideSource& operator=(const SlideSource&) = delete;

  SlideSource(SlideSource&&) = delete;
  SlideSource& operator=(SlideSource&&) = delete;

  /// @brief Number of stored resolution tiers (at least 1)
  [[nodiscard]] virtual int GetTierCount() const = 0;

  /// @brief Dimensions and downsample of a tier
  /// @return kOutOfRange for a tier outside [0, GetTierCount())
  [[nodiscard]] virtual absl::StatusOr<SourceTier> GetTierInfo(
      int tier) const = 0;

  /// @brief Read a region
  ///
  /// @param location Top-left corner in tier-0 coordinates; may lie partly
  ///        outside the image
  /// @param tier Tier to read pixels from
  /// @param size Region size in pixels of @p tier
  /// @return RGBA (or RGB) image of exactly @p size. Pixels outside the
  ///         image are transparent.
  [[nodiscard]] virtual absl::StatusOr<Image> ReadRegion(
      const RegionLocation& location, int tier,
      const ImageDimensions& size) const = 0;

  [[nodiscard]] virtual const SlideProperties& GetProperties() const = 0;

  /// @brief Tier to render a downsample factor from
  ///
  /// @param tiers This source's tier table, as returned by GetTiers()
  /// @param downsample Requested downsample relative to tier 0
  ///
  /// The default picks the coarsest tier whose downsample does not exceed
  /// @p downsample (see core::BestTierForDownsample).
  [[nodiscard]] virtual int GetBestTierForDownsample(
      std::span<const SourceTier> tiers, double downsample) const;

  /// @brief All tiers, finest first
  [[nodiscard]] absl::StatusOr<std::vector<SourceTier>> GetTiers() const;
};

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_SLIDE_SOURCE_H_
