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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_SOURCE_DESCRIPTOR_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_SOURCE_DESCRIPTOR_H_

#include <optional>
#include <span>
#include <string>

#include "absl/status/status.h"
#include "fastzoom/core/size.h"

/**
 * @file source_descriptor.h
 * @brief Domain models describing a multi-resolution source
 *
 * A source stores its image as a stack of resolution tiers. Tier 0 is full
 * resolution; later tiers are coarser, pre-downsampled copies. These types
 * carry no I/O and are shared by the planner and by SlideSource
 * implementations.
 */

namespace fastzoom {
namespace core {

/// @brief One natively stored resolution tier
struct SourceTier {
  ImageDimensions dimensions;  ///< Tier dimensions in pixels
  double downsample = 1.0;     ///< Downsample factor relative to tier 0

  SourceTier() = default;

  SourceTier(ImageDimensions dims, double factor)
      : dimensions(dims), downsample(factor) {}
};

/// @brief Optional descriptive properties of a source
struct SlideProperties {
  /// @brief Background color hint as hex ("ffffff" or "#ffffff")
  ///
  /// Pixels outside the source's valid area are composited onto this color.
  /// Absent means white.
  std::optional<std::string> background_color;
};

/// @brief Pick the tier to render a given downsample from
///
/// Returns the coarsest tier whose downsample does not exceed @p downsample,
/// so a level reads the least source data that still has enough detail. If
/// no tier qualifies the coarsest tier is returned.
///
/// @param tiers Tier table ordered from finest to coarsest (non-empty)
/// @param downsample Target downsample relative to tier 0
/// @return Tier index, or -1 if @p tiers is empty
[[nodiscard]] int BestTierForDownsample(std::span<const SourceTier> tiers,
                                        double downsample);

/// @brief Check that a tier table is usable for planning
///
/// Requires at least one tier, non-zero dimensions, positive downsamples
/// and non-decreasing downsample order.
[[nodiscard]] absl::Status ValidateTiers(std::span<const SourceTier> tiers);

}  // namespace core

using core::SlideProperties;
using core::SourceTier;

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_SOURCE_DESCRIPTOR_H_
