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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_UTILITIES_COLORS_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_UTILITIES_COLORS_H_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

namespace fastzoom {

/// @brief RGB color structure with uint8_t components
struct ColorRGB {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};

  constexpr ColorRGB() = default;

  constexpr ColorRGB(uint8_t red, uint8_t green, uint8_t blue)
      : r(red), g(green), b(blue) {}

  constexpr uint8_t operator[](std::size_t index) const {
    return index == 0 ? r : (index == 1 ? g : b);
  }

  constexpr bool operator==(const ColorRGB& other) const {
    return r == other.r && g == other.g && b == other.b;
  }

  constexpr bool operator!=(const ColorRGB& other) const {
    return !(*this == other);
  }
};

/// @brief Background used when a source does not specify one
inline constexpr ColorRGB kWhite{255, 255, 255};

/// @brief Parse a hex color such as "ffffff" or "#1A2b3C"
/// @param str Six hex digits, optionally prefixed with '#'
/// @return Parsed color or kInvalidArgument
absl::StatusOr<ColorRGB> ParseHexColor(std::string_view str);

/// @brief Format a color as lowercase "rrggbb"
std::string ToHexString(const ColorRGB& color);

inline std::ostream& operator<<(std::ostream& os, const ColorRGB& color) {
  return os << '#' << ToHexString(color);
}

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_UTILITIES_COLORS_H_
