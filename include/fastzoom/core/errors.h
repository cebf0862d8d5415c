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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_ERRORS_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_ERRORS_H_

#include <cstdint>
#include <optional>
#include <string_view>

#include "absl/status/status.h"

/**
 * @file errors.h
 * @brief Tile address validation errors
 *
 * Invalid tile requests are reported as absl::StatusCode::kOutOfRange with a
 * payload under kDeepZoomErrorTypeUrl naming the failing check. The payload
 * survives RETURN_IF_ERROR / ASSIGN_OR_RETURN propagation, so callers that
 * only see the generator's result can still tell a bad level from a bad
 * column/row.
 */

namespace fastzoom {

/// @brief Payload type URL identifying Deep Zoom validation errors
inline constexpr std::string_view kDeepZoomErrorTypeUrl =
    "type.fastzoom/DeepZoomError";

/// @brief Validation failure variants
enum class DeepZoomErrorKind {
  kInvalidLevel,    ///< Level outside [0, level count)
  kInvalidAddress,  ///< Column or row outside the level's tile grid
};

/// @brief Get string representation of an error kind
constexpr const char* GetName(DeepZoomErrorKind kind) {
  switch (kind) {
    case DeepZoomErrorKind::kInvalidLevel:
      return "InvalidLevel";
    case DeepZoomErrorKind::kInvalidAddress:
      return "InvalidAddress";
  }
  return "unknown";
}

/// @brief Build the error for a level outside [0, level_count)
absl::Status InvalidLevelError(int level, int level_count);

/// @brief Build the error for a tile outside its level's grid
absl::Status InvalidAddressError(int level, int64_t column, int64_t row,
                                 uint32_t columns, uint32_t rows);

/// @brief Recover the validation variant carried by @p status, if any
std::optional<DeepZoomErrorKind> GetDeepZoomErrorKind(
    const absl::Status& status);

inline bool IsInvalidLevel(const absl::Status& status) {
  return GetDeepZoomErrorKind(status) == DeepZoomErrorKind::kInvalidLevel;
}

inline bool IsInvalidAddress(const absl::Status& status) {
  return GetDeepZoomErrorKind(status) == DeepZoomErrorKind::kInvalidAddress;
}

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_ERRORS_H_
