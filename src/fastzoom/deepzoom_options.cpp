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

#include "fastzoom/deepzoom_options.h"

#include "fastzoom/status/status_macros.h"

namespace fastzoom {

absl::Status DeepZoomOptions::Validate() const {
  if (tile_size == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "tile_size must be positive");
  }
  return absl::OkStatus();
}

}  // namespace fastzoom
