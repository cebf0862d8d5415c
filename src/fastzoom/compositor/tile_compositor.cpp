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

#include "fastzoom/compositor/tile_compositor.h"

#include <cstdint>
#include <utility>

#include "absl/strings/str_format.h"
#include "fastzoom/resample/area.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom::compositor {

absl::StatusOr<Image> FlattenAlpha(const Image& rgba,
                                   const ColorRGB& background) {
  if (rgba.GetFormat() != ImageFormat::kRGBA) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("FlattenAlpha expects RGBA input, got %s",
                        rgba.GetDescription()));
  }

  // Opaque background of the raw size, then the source over it.
  Image out(rgba.GetDimensions(), ImageFormat::kRGB);
  out.Fill({background.r, background.g, background.b});

  const size_t pixels = rgba.GetPixelCount();
  const uint8_t* src = rgba.GetData();
  uint8_t* dst = out.GetData();

  for (size_t i = 0; i < pixels; ++i, src += 4, dst += 3) {
    const uint32_t alpha = src[3];
    const uint32_t inverse = 255U - alpha;
    for (size_t c = 0; c < 3; ++c) {
      dst[c] = static_cast<uint8_t>(
          (src[c] * alpha + dst[c] * inverse + 127U) / 255U);
    }
  }
  return out;
}

absl::StatusOr<Image> CompositeTile(const Image& raw,
                                    const ImageDimensions& final_size,
                                    const ColorRGB& background) {
  if (raw.Empty() || final_size[0] == 0 || final_size[1] == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Cannot composite %s into %ux%u",
                                       raw.GetDescription(), final_size[0],
                                       final_size[1]));
  }

  Image flat;
  switch (raw.GetFormat()) {
    case ImageFormat::kRGBA:
      ASSIGN_OR_RETURN(flat, FlattenAlpha(raw, background));
      break;
    case ImageFormat::kRGB:
      flat = raw;
      break;
    default:
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("Unsupported tile source format %s",
                          GetName(raw.GetFormat())));
  }

  if (flat.GetDimensions() == final_size) {
    return flat;
  }
  return resample::AreaResample(flat, final_size);
}

}  // namespace fastzoom::compositor
