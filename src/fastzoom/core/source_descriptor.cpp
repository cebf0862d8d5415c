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

#include "fastzoom/core/source_descriptor.h"

#include <span>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom {
namespace core {

int BestTierForDownsample(std::span<const SourceTier> tiers,
                          double downsample) {
  if (tiers.empty()) {
    return -1;
  }

  int best_tier = -1;
  for (size_t i = 0; i < tiers.size(); ++i) {
    if (tiers[i].downsample <= downsample) {
      best_tier = static_cast<int>(i);
    } else {
      break;
    }
  }

  if (best_tier < 0) {
    return static_cast<int>(tiers.size()) - 1;
  }
  return best_tier;
}

absl::Status ValidateTiers(std::span<const SourceTier> tiers) {
  if (tiers.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Source reports no resolution tiers");
  }

  double previous = 0.0;
  for (size_t i = 0; i < tiers.size(); ++i) {
    const SourceTier& tier = tiers[i];
    if (tier.dimensions[0] == 0 || tier.dimensions[1] == 0) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("Tier %d has empty dimensions %ux%u", i,
                          tier.dimensions[0], tier.dimensions[1]));
    }
    if (!(tier.downsample > 0.0) || tier.downsample < previous) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("Tier %d has invalid downsample %f", i,
                          tier.downsample));
    }
    previous = tier.downsample;
  }
  return absl::OkStatus();
}

}  // namespace core
}  // namespace fastzoom
