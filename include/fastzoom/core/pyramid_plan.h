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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_PYRAMID_PLAN_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_PYRAMID_PLAN_H_

#include <cstdint>
#include <span>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/status/statusor.h"
#include "fastzoom/core/size.h"
#include "fastzoom/core/source_descriptor.h"

/**
 * @file pyramid_plan.h
 * @brief Deep Zoom level layout
 *
 * A Deep Zoom pyramid is built by halving the full image (rounding up) until
 * it is 1x1. Level 0 is that 1x1 image and the last level is full
 * resolution, so level L is downsampled by 2^(level_count - 1 - L). Every
 * level is cut into square tiles of tile_size pixels, with the last row and
 * column of tiles possibly smaller.
 *
 * The plan is computed once and never changes afterwards; it is safe to share
 * between threads.
 */

namespace fastzoom {
namespace core {

/// @brief Precomputed parameters of one Deep Zoom level
struct PyramidLevel {
  ImageDimensions dimensions;  ///< Level size in pixels
  ImageDimensions tiles;       ///< Tile grid [columns, rows]
  double downsample = 1.0;     ///< Downsample relative to full resolution
  int preferred_tier = 0;      ///< Source tier the level is rendered from
  double tier_downsample = 1.0;  ///< Downsample relative to preferred_tier
};

/// @brief Selection rule mapping a downsample factor to a source tier
using TierSelector = absl::FunctionRef<int(double)>;

/// @brief Level dimensions, coarsest (1x1) first, full resolution last
///
/// Uses the recurrence d -> max(1, ceil(d / 2)) on each axis independently.
/// @param full Full resolution dimensions (both non-zero)
std::vector<ImageDimensions> ComputeLevelDimensions(
    const ImageDimensions& full);

/// @brief Number of tiles along each axis: ceil(dimension / tile_size)
ImageDimensions ComputeTileGrid(const ImageDimensions& dimensions,
                                uint32_t tile_size);

/// @brief Immutable Deep Zoom layout for one source and tile configuration
class PyramidPlan {
 public:
  /// @brief Build a plan choosing tiers with BestTierForDownsample
  static absl::StatusOr<PyramidPlan> Build(std::span<const SourceTier> tiers,
                                           uint32_t tile_size,
                                           uint32_t overlap);

  /// @brief Build a plan with a custom tier selection rule
  ///
  /// @param tiers Source tiers, finest first; tier 0 is full resolution
  /// @param tile_size Tile edge length without overlap (> 0)
  /// @param overlap Extra pixels added on interior tile edges
  /// @param select_tier Returns the tier index for a downsample factor
  /// @return The plan, or kInvalidArgument for unusable parameters or a
  ///         selector returning an index outside the tier table
  static absl::StatusOr<PyramidPlan> Build(std::span<const SourceTier> tiers,
                                           uint32_t tile_size,
                                           uint32_t overlap,
                                           TierSelector select_tier);

  PyramidPlan() = default;

  [[nodiscard]] int GetLevelCount() const {
    return static_cast<int>(levels_.size());
  }

  [[nodiscard]] const std::vector<PyramidLevel>& GetLevels() const {
    return levels_;
  }

  /// @brief Level by index; the caller validates the index
  [[nodiscard]] const PyramidLevel& GetLevel(int level) const {
    return levels_[static_cast<size_t>(level)];
  }

  [[nodiscard]] bool IsValidLevel(int level) const {
    return level >= 0 && level < GetLevelCount();
  }

  [[nodiscard]] uint32_t GetTileSize() const { return tile_size_; }
  [[nodiscard]] uint32_t GetOverlap() const { return overlap_; }

  /// @brief Full resolution dimensions (same as the last level)
  [[nodiscard]] ImageDimensions GetFullDimensions() const {
    return tiers_.front().dimensions;
  }

  /// @brief Total number of tiles over all levels
  [[nodiscard]] uint64_t GetTileCount() const { return tile_count_; }

  [[nodiscard]] const std::vector<SourceTier>& GetTiers() const {
    return tiers_;
  }

 private:
  std::vector<PyramidLevel> levels_;
  std::vector<SourceTier> tiers_;
  uint32_t tile_size_ = 0;
  uint32_t overlap_ = 0;
  uint64_t tile_count_ = 0;
};

}  // namespace core

using core::PyramidLevel;
using core::PyramidPlan;

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_PYRAMID_PLAN_H_
