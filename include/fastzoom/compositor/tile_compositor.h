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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_COMPOSITOR_TILE_COMPOSITOR_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_COMPOSITOR_TILE_COMPOSITOR_H_

#include "absl/status/statusor.h"
#include "fastzoom/core/size.h"
#include "fastzoom/image.h"
#include "fastzoom/utilities/colors.h"

namespace fastzoom::compositor {

/// @brief Composite an RGBA image over an opaque background
///
/// out = (src * a + bg * (255 - a) + 127) / 255 per color channel, so fully
/// transparent pixels become the background and opaque pixels are unchanged.
/// @param rgba Image in ImageFormat::kRGBA
/// @return Opaque ImageFormat::kRGB image of the same size
absl::StatusOr<Image> FlattenAlpha(const Image& rgba,
                                   const ColorRGB& background);

/// @brief Turn a raw source read into a finished tile
///
/// Flattens transparency onto @p background (RGBA input only; RGB input is
/// used as is) and area-resamples to @p final_size when the read size
/// differs.
absl::StatusOr<Image> CompositeTile(const Image& raw,
                                    const ImageDimensions& final_size,
                                    const ColorRGB& background);

}  // namespace fastzoom::compositor

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_COMPOSITOR_TILE_COMPOSITOR_H_
