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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_DEEPZOOM_GENERATOR_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_DEEPZOOM_GENERATOR_H_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "fastzoom/core/pyramid_plan.h"
#include "fastzoom/core/size.h"
#include "fastzoom/core/tile_mapper.h"
#include "fastzoom/deepzoom_options.h"
#include "fastzoom/image.h"
#include "fastzoom/slide_source.h"
#include "fastzoom/utilities/colors.h"

namespace fastzoom {

/**
 * @brief Serves Deep Zoom tiles and descriptors for a SlideSource
 *
 * The pyramid layout and background color are fixed at construction. Every
 * query is const and the generator holds no mutable state, so one instance
 * can serve tiles to many threads as long as the source's ReadRegion is
 * thread-safe.
 *
 * @code
 * auto source = MemorySlideSource::Create(image).value();
 * auto generator = DeepZoomGenerator::Create(std::move(source), {}).value();
 * auto tile = generator->GetTile(generator->GetLevelCount() - 1, 0, 0);
 * auto dzi = generator->GetDzi("jpeg");
 * @endcode
 */
class DeepZoomGenerator {
 public:
  /// @brief Plan the pyramid for @p source
  /// @return The generator, or kInvalidArgument for bad options or an
  ///         unusable tier table; source errors propagate
  static absl::StatusOr<std::unique_ptr<DeepZoomGenerator>> Create(
      std::shared_ptr<const SlideSource> source,
      const DeepZoomOptions& options);

  DeepZoomGenerator(const DeepZoomGenerator&) = delete;
  DeepZoomGenerator& operator=(const DeepZoomGenerator&) = delete;

  [[nodiscard]] int GetLevelCount() const { return plan_.GetLevelCount(); }

  /// @brief Tile grid [columns, rows] of every level, coarsest first
  [[nodiscard]] std::vector<ImageDimensions> GetLevelTiles() const;

  /// @brief Pixel dimensions of every level, coarsest first
  [[nodiscard]] std::vector<ImageDimensions> GetLevelDimensions() const;

  /// @brief Total number of tiles over all levels
  [[nodiscard]] uint64_t GetTileCount() const { return plan_.GetTileCount(); }

  /// @brief Source read for a tile (see core::MapTile)
  [[nodiscard]] absl::StatusOr<TileRegion> GetTileRegion(int level,
                                                         int64_t column,
                                                         int64_t row) const;

  /// @brief Final pixel size of a tile, overlap included
  [[nodiscard]] absl::StatusOr<ImageDimensions> GetTileDimensions(
      int level, int64_t column, int64_t row) const;

  /// @brief Render a tile as an opaque RGB image
  [[nodiscard]] absl::StatusOr<Image> GetTile(int level, int64_t column,
                                              int64_t row) const;

  /// @brief Descriptor document for this pyramid
  /// @param format Tile image format token, e.g. "jpeg" or "png"
  [[nodiscard]] absl::StatusOr<std::string> GetDzi(
      std::string_view format) const;

  [[nodiscard]] const PyramidPlan& GetPlan() const { return plan_; }

  [[nodiscard]] const ColorRGB& GetBackgroundColor() const {
    return background_;
  }

  [[nodiscard]] const SlideSource& GetSource() const { return *source_; }

 private:
  DeepZoomGenerator(std::shared_ptr<const SlideSource> source,
                    PyramidPlan plan, ColorRGB background)
      : source_(std::move(source)),
        plan_(std::move(plan)),
        background_(background) {}

  std::shared_ptr<const SlideSource> source_;
  PyramidPlan plan_;
  ColorRGB background_;
};

/// @brief Background a generator uses for @p source under @p options
///
/// Precedence: options.background_color, then the source's hint, then
/// white. A hint that does not parse is logged and ignored.
ColorRGB ResolveBackgroundColor(const SlideSource& source,
                                const DeepZoomOptions& options);

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_DEEPZOOM_GENERATOR_H_
