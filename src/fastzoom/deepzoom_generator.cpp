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

#include "fastzoom/deepzoom_generator.h"

#include <fmt/format.h>

#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "fastzoom/compositor/tile_compositor.h"
#include "fastzoom/descriptor/dzi.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom {

ColorRGB ResolveBackgroundColor(const SlideSource& source,
                                const DeepZoomOptions& options) {
  if (options.background_color.has_value()) {
    return *options.background_color;
  }

  const auto& hint = source.GetProperties().background_color;
  if (!hint.has_value()) {
    return kWhite;
  }

  auto parsed = ParseHexColor(*hint);
  if (!parsed.ok()) {
    LOG(WARNING) << "Ignoring unparseable background color \"" << *hint
                 << "\", using white: "
                 << status::RootMessage(parsed.status().message());
    return kWhite;
  }
  return *parsed;
}

absl::StatusOr<std::unique_ptr<DeepZoomGenerator>> DeepZoomGenerator::Create(
    std::shared_ptr<const SlideSource> source,
    const DeepZoomOptions& options) {
  if (source == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Source must not be null");
  }
  RETURN_IF_ERROR(options.Validate(), "Invalid Deep Zoom options");

  DECLARE_ASSIGN_OR_RETURN(std::vector<SourceTier>, tiers, source->GetTiers(),
                           "Cannot list source tiers");

  const SlideSource* raw_source = source.get();
  DECLARE_ASSIGN_OR_RETURN(
      PyramidPlan, plan,
      PyramidPlan::Build(tiers, options.tile_size, options.overlap,
                         [raw_source, &tiers](double downsample) {
                           return raw_source->GetBestTierForDownsample(
                               tiers, downsample);
                         }));

  const ColorRGB background = ResolveBackgroundColor(*source, options);
  VLOG(1) << fmt::format(
      "Deep Zoom generator: {} levels, {} tiles, full size {}, background {}",
      plan.GetLevelCount(), plan.GetTileCount(), plan.GetFullDimensions(),
      ToHexString(background));

  return std::unique_ptr<DeepZoomGenerator>(new DeepZoomGenerator(
      std::move(source), std::move(plan), background));
}

std::vector<ImageDimensions> DeepZoomGenerator::GetLevelTiles() const {
  std::vector<ImageDimensions> tiles;
  tiles.reserve(plan_.GetLevels().size());
  for (const PyramidLevel& level : plan_.GetLevels()) {
    tiles.push_back(level.tiles);
  }
  return tiles;
}

std::vector<ImageDimensions> DeepZoomGenerator::GetLevelDimensions() const {
  std::vector<ImageDimensions> dims;
  dims.reserve(plan_.GetLevels().size());
  for (const PyramidLevel& level : plan_.GetLevels()) {
    dims.push_back(level.dimensions);
  }
  return dims;
}

absl::StatusOr<TileRegion> DeepZoomGenerator::GetTileRegion(
    int level, int64_t column, int64_t row) const {
  return core::MapTile(plan_, TileAddress{level, column, row});
}

absl::StatusOr<ImageDimensions> DeepZoomGenerator::GetTileDimensions(
    int level, int64_t column, int64_t row) const {
  DECLARE_ASSIGN_OR_RETURN(TileRegion, region,
                           GetTileRegion(level, column, row));
  return region.final_size;
}

absl::StatusOr<Image> DeepZoomGenerator::GetTile(int level, int64_t column,
                                                 int64_t row) const {
  DECLARE_ASSIGN_OR_RETURN(TileRegion, region,
                           GetTileRegion(level, column, row));

  VLOG(1) << fmt::format(
      "Tile ({}, {}, {}): read {} at {} from tier {}, final {}", level, column,
      row, region.read_size, region.read_location, region.read_tier,
      region.final_size);

  DECLARE_ASSIGN_OR_RETURN(
      Image, raw,
      source_->ReadRegion(region.read_location, region.read_tier,
                          region.read_size),
      "Source read failed");

  return compositor::CompositeTile(raw, region.final_size, background_);
}

absl::StatusOr<std::string> DeepZoomGenerator::GetDzi(
    std::string_view format) const {
  return descriptor::WriteDzi(descriptor::MakeDescriptor(plan_, format));
}

}  // namespace fastzoom
