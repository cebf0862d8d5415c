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

#include "fastzoom/core/tile_mapper.h"

#include <algorithm>
#include <cmath>

#include "absl/strings/str_format.h"
#include "fastzoom/core/errors.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom {
namespace core {

namespace {

/// Per-axis result of the mapping
struct AxisRegion {
  int64_t read_location = 0;
  int64_t read_size = 0;
  int64_t final_size = 0;
};

AxisRegion MapAxis(int64_t tile, uint32_t tile_count, uint32_t level_extent,
                   uint32_t tier_extent, uint32_t tile_size, uint32_t overlap,
                   double tier_downsample, double read_downsample) {
  const int64_t size = tile_size;
  const int64_t overlap_before = tile != 0 ? overlap : 0;
  const int64_t overlap_after =
      tile != static_cast<int64_t>(tile_count) - 1 ? overlap : 0;

  const int64_t level_start = size * tile;
  AxisRegion axis;
  axis.final_size =
      std::min<int64_t>(size, static_cast<int64_t>(level_extent) - level_start) +
      overlap_before + overlap_after;

  // Tier coordinate of the tile's first pixel, before rounding.
  const double tier_start =
      tier_downsample * static_cast<double>(level_start - overlap_before);
  axis.read_location =
      static_cast<int64_t>(std::floor(read_downsample * tier_start));

  const int64_t wanted = static_cast<int64_t>(
      std::ceil(tier_downsample * static_cast<double>(axis.final_size)));
  const int64_t available =
      static_cast<int64_t>(tier_extent) -
      static_cast<int64_t>(std::ceil(tier_start));
  axis.read_size = std::min(wanted, available);
  return axis;
}

}  // namespace

absl::Status ValidateTileAddress(const PyramidPlan& plan,
                                 const TileAddress& address) {
  if (!plan.IsValidLevel(address.level)) {
    return InvalidLevelError(address.level, plan.GetLevelCount());
  }
  const ImageDimensions& tiles = plan.GetLevel(address.level).tiles;
  if (address.column < 0 || address.row < 0 ||
      address.column >= static_cast<int64_t>(tiles[0]) ||
      address.row >= static_cast<int64_t>(tiles[1])) {
    return InvalidAddressError(address.level, address.column, address.row,
                               tiles[0], tiles[1]);
  }
  return absl::OkStatus();
}

absl::StatusOr<TileRegion> MapTile(const PyramidPlan& plan,
                                   const TileAddress& address) {
  RETURN_IF_ERROR(ValidateTileAddress(plan, address), "");

  const PyramidLevel& level = plan.GetLevel(address.level);
  const SourceTier& tier =
      plan.GetTiers()[static_cast<size_t>(level.preferred_tier)];

  const int64_t tile[2] = {address.column, address.row};
  TileRegion region;
  region.read_tier = level.preferred_tier;

  for (size_t axis = 0; axis < 2; ++axis) {
    const AxisRegion mapped =
        MapAxis(tile[axis], level.tiles[axis], level.dimensions[axis],
                tier.dimensions[axis], plan.GetTileSize(), plan.GetOverlap(),
                level.tier_downsample, tier.downsample);
    if (mapped.read_size <= 0) {
      return MAKE_STATUS(
          absl::StatusCode::kInternal,
          absl::StrFormat("Tile (%d, %d, %d) maps to an empty read on axis %d",
                          address.level, address.column, address.row, axis));
    }
    region.read_location[axis] = mapped.read_location;
    region.read_size[axis] = static_cast<uint32_t>(mapped.read_size);
    region.final_size[axis] = static_cast<uint32_t>(mapped.final_size);
  }
  return region;
}

}  // namespace core
}  // namespace fastzoom
