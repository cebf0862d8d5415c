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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_DESCRIPTOR_DZI_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_DESCRIPTOR_DZI_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "fastzoom/core/pyramid_plan.h"
#include "fastzoom/core/size.h"

/**
 * @file dzi.h
 * @brief Deep Zoom image descriptor (.dzi) documents
 *
 * A descriptor tells a viewer how a pyramid is laid out:
 *
 * @code
 * <?xml version="1.0" encoding="UTF-8"?>
 * <Image TileSize="256" Overlap="1" Format="jpeg"
 *        xmlns="http://schemas.microsoft.com/deepzoom/2008">
 *   <Size Width="300" Height="300"/>
 * </Image>
 * @endcode
 *
 * Format is whatever token the caller encodes tiles with; it is not
 * interpreted here.
 */

namespace fastzoom::descriptor {

/// @brief XML namespace of Deep Zoom 2008 descriptors
inline constexpr std::string_view kDeepZoomNamespace =
    "http://schemas.microsoft.com/deepzoom/2008";

/// @brief Contents of a descriptor document
struct DziDescriptor {
  uint32_t tile_size = 0;
  uint32_t overlap = 0;
  std::string format;
  ImageDimensions size;  ///< Full resolution [width, height]

  bool operator==(const DziDescriptor& other) const {
    return tile_size == other.tile_size && overlap == other.overlap &&
           format == other.format && size == other.size;
  }
};

/// @brief Descriptor for a planned pyramid
DziDescriptor MakeDescriptor(const core::PyramidPlan& plan,
                             std::string_view format);

/// @brief Serialize a descriptor as UTF-8 XML
/// @return XML text, or kInvalidArgument for an empty format token
absl::StatusOr<std::string> WriteDzi(const DziDescriptor& descriptor);

/// @brief Parse a descriptor document
/// @return The descriptor, or kInvalidArgument if the document is not a
///         well-formed Deep Zoom descriptor
absl::StatusOr<DziDescriptor> ParseDzi(std::string_view xml);

}  // namespace fastzoom::descriptor

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_DESCRIPTOR_DZI_H_
