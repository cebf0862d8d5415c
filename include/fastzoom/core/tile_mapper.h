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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_TILE_MAPPER_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_TILE_MAPPER_H_

#include <cstdint>
#include <ostream>

#include "absl/status/statusor.h"
#include "fastzoom/core/pyramid_plan.h"
#include "fastzoom/core/size.h"

namespace fastzoom {
namespace core {

/// @brief Tile address in the Deep Zoom pyramid
struct TileAddress {
  int level = 0;
  int64_t column = 0;
  int64_t row = 0;

  bool operator==(const TileAddress& other) const {
    return level == other.level && column == other.column && row == other.row;
  }

  friend std::ostream& operator<<(std::ostream& os, const TileAddress& addr) {
    return os << "(" << addr.level << ", " << addr.column << ", " << addr.row
              << ")";
  }
};

/// @brief Source read needed to render one tile
///
/// The region is read from tier read_tier at read_size (tier pixels), located
/// at read_location in full-resolution coordinates. The result is then scaled
/// to final_size, which includes overlap.
struct TileRegion {
  RegionLocation read_location;
  int read_tier = 0;
  ImageDimensions read_size;
  ImageDimensions final_size;

  /// @brief Whether the read has to be rescaled to produce the tile
  [[nodiscard]] bool NeedsResample() const { return read_size != final_size; }

  bool operator==(const TileRegion& other) const {
    return read_location == other.read_location &&
           read_tier == other.read_tier && read_size == other.read_size &&
           final_size == other.final_size;
  }
};

/// @brief Map a tile address to the source region that renders it
///
/// Interior tile edges get @c overlap extra pixels; image borders get none.
/// The read location is rounded down and the read size rounded up, and the
/// read is clipped to the tier's extent.
///
/// @return The region, or an error tagged InvalidLevel / InvalidAddress
///         (kOutOfRange) when the address is outside the pyramid
absl::StatusOr<TileRegion> MapTile(const PyramidPlan& plan,
                                   const TileAddress& address);

/// @brief Check an address without computing its region
absl::Status ValidateTileAddress(const PyramidPlan& plan,
                                 const TileAddress& address);

}  // namespace core

using core::TileAddress;
using core::TileRegion;

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_TILE_MAPPER_H_
