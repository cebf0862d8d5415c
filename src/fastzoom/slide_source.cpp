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

#include "fastzoom/slide_source.h"

#include <vector>

#include "fastzoom/status/status_macros.h"

namespace fastzoom {

int SlideSource::GetBestTierForDownsample(std::span<const SourceTier> tiers,
                                          double downsample) const {
  return core::BestTierForDownsample(tiers, downsample);
}

absl::StatusOr<std::vector<SourceTier>> SlideSource::GetTiers() const {
  const int tier_count = GetTierCount();
  std::vector<SourceTier> tiers;
  tiers.reserve(tier_count > 0 ? static_cast<size_t>(tier_count) : 0);
  for (int tier = 0; tier < tier_count; ++tier) {
    DECLARE_ASSIGN_OR_RETURN(SourceTier, info, GetTierInfo(tier));
    tiers.push_back(info);
  }
  return tiers;
}

}  // namespace fastzoom
