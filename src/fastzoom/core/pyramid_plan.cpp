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

#include "fastzoom/core/pyramid_plan.h"

#include <algorithm>
#include <cmath>
#include <span>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom {
namespace core {

namespace {

uint32_t HalfRoundedUp(uint32_t value) {
  return std::max<uint32_t>(1, value / 2 + value % 2);
}

uint32_t DivideRoundingUp(uint32_t value, uint32_t divisor) {
  return value / divisor + (value % divisor != 0 ? 1 : 0);
}

}  // namespace

std::vector<ImageDimensions> ComputeLevelDimensions(
    const ImageDimensions& full) {
  std::vector<ImageDimensions> dims{full};
  ImageDimensions current = full;
  while (current[0] > 1 || current[1] > 1) {
    current = ImageDimensions{HalfRoundedUp(current[0]),
                              HalfRoundedUp(current[1])};
    dims.push_back(current);
  }
  std::reverse(dims.begin(), dims.end());
  return dims;
}

ImageDimensions ComputeTileGrid(const ImageDimensions& dimensions,
                                uint32_t tile_size) {
  return ImageDimensions{DivideRoundingUp(dimensions[0], tile_size),
                         DivideRoundingUp(dimensions[1], tile_size)};
}

absl::StatusOr<PyramidPlan> PyramidPlan::Build(
    std::span<const SourceTier> tiers, uint32_t tile_size, uint32_t overlap) {
  return Build(tiers, tile_size, overlap, [tiers](double downsample) {
    return BestTierForDownsample(tiers, downsample);
  });
}

absl::StatusOr<PyramidPlan> PyramidPlan::Build(
    std::span<const SourceTier> tiers, uint32_t tile_size, uint32_t overlap,
    TierSelector select_tier) {
  if (tile_size == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Tile size must be positive");
  }
  RETURN_IF_ERROR(ValidateTiers(tiers), "Cannot plan pyramid");

  PyramidPlan plan;
  plan.tiers_.assign(tiers.begin(), tiers.end());
  plan.tile_size_ = tile_size;
  plan.overlap_ = overlap;

  const std::vector<ImageDimensions> level_dims =
      ComputeLevelDimensions(tiers.front().dimensions);
  const int level_count = static_cast<int>(level_dims.size());
  plan.levels_.reserve(level_dims.size());

  for (int level = 0; level < level_count; ++level) {
    PyramidLevel info;
    info.dimensions = level_dims[static_cast<size_t>(level)];
    info.tiles = ComputeTileGrid(info.dimensions, tile_size);
    info.downsample = std::ldexp(1.0, level_count - 1 - level);

    const int tier = select_tier(info.downsample);
    if (tier < 0 || tier >= static_cast<int>(tiers.size())) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("Tier selector returned %d for downsample %f "
                          "(tier count %d)",
                          tier, info.downsample, tiers.size()));
    }
    info.preferred_tier = tier;
    info.tier_downsample =
        info.downsample / tiers[static_cast<size_t>(tier)].downsample;

    plan.tile_count_ += info.tiles.Product();
    plan.levels_.push_back(info);
  }

  VLOG(1) << "Planned " << level_count << " levels for "
          << plan.GetFullDimensions() << " with tile size " << tile_size
          << " and overlap " << overlap << " (" << plan.tile_count_
          << " tiles)";
  return plan;
}

}  // namespace core
}  // namespace fastzoom
