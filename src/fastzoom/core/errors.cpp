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

#include "fastzoom/core/errors.h"

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_format.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom {

namespace {

absl::Status Tag(absl::Status status, DeepZoomErrorKind kind) {
  status.SetPayload(kDeepZoomErrorTypeUrl, absl::Cord(GetName(kind)));
  return status;
}

}  // namespace

absl::Status InvalidLevelError(int level, int level_count) {
  return Tag(MAKE_STATUS(absl::StatusCode::kOutOfRange,
                         absl::StrFormat("Invalid level %d (level count %d)",
                                         level, level_count)),
             DeepZoomErrorKind::kInvalidLevel);
}

absl::Status InvalidAddressError(int level, int64_t column, int64_t row,
                                 uint32_t columns, uint32_t rows) {
  return Tag(MAKE_STATUS(absl::StatusCode::kOutOfRange,
                         absl::StrFormat("Invalid address (%d, %d) at level %d "
                                         "(grid %ux%u)",
                                         column, row, level, columns, rows)),
             DeepZoomErrorKind::kInvalidAddress);
}

std::optional<DeepZoomErrorKind> GetDeepZoomErrorKind(
    const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }
  const std::optional<absl::Cord> payload =
      status.GetPayload(kDeepZoomErrorTypeUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  for (DeepZoomErrorKind kind : {DeepZoomErrorKind::kInvalidLevel,
                                 DeepZoomErrorKind::kInvalidAddress}) {
    if (*payload == GetName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace fastzoom
