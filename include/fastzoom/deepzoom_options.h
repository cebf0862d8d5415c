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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_DEEPZOOM_OPTIONS_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_DEEPZOOM_OPTIONS_H_

#include <cstdint>
#include <optional>

#include "absl/status/status.h"
#include "fastzoom/utilities/colors.h"

namespace fastzoom {

/// @brief Configuration of a DeepZoomGenerator
struct DeepZoomOptions {
  /// Tile edge length in pixels, excluding overlap.
  uint32_t tile_size = 256;

  /// Extra pixels added to each interior tile edge.
  uint32_t overlap = 1;

  /// Overrides the source's background hint when set.
  std::optional<ColorRGB> background_color;

  /// @brief Fluent setters
  DeepZoomOptions& WithTileSize(uint32_t size) {
    tile_size = size;
    return *this;
  }

  DeepZoomOptions& WithOverlap(uint32_t pixels) {
    overlap = pixels;
    return *this;
  }

  DeepZoomOptions& WithBackground(const ColorRGB& color) {
    background_color = color;
    return *this;
  }

  /// @brief kInvalidArgument if tile_size is zero
  [[nodiscard]] absl::Status Validate() const;
};

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_DEEPZOOM_OPTIONS_H_
