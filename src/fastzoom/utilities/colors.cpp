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

#include "fastzoom/utilities/colors.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom {

absl::StatusOr<ColorRGB> ParseHexColor(std::string_view str) {
  std::string_view digits = absl::StripAsciiWhitespace(str);
  if (!digits.empty() && digits.front() == '#') {
    digits.remove_prefix(1);
  }

  if (digits.size() != 6 ||
      !std::all_of(digits.begin(), digits.end(),
                   [](char c) { return absl::ascii_isxdigit(c); })) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Invalid color '%s' (expected RRGGBB hex)", str));
  }

  uint32_t packed = 0;
  if (!absl::SimpleHexAtoi(digits, &packed)) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Invalid color '%s'", str));
  }

  return ColorRGB{static_cast<uint8_t>((packed >> 16) & 0xFF),
                  static_cast<uint8_t>((packed >> 8) & 0xFF),
                  static_cast<uint8_t>(packed & 0xFF)};
}

std::string ToHexString(const ColorRGB& color) {
  return absl::StrFormat("%02x%02x%02x", color.r, color.g, color.b);
}

}  // namespace fastzoom
