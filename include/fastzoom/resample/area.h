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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_RESAMPLE_AREA_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_RESAMPLE_AREA_H_

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include "fastzoom/core/size.h"
#include "fastzoom/image.h"

namespace fastzoom::resample {

namespace detail {

// One input sample contributing to an output sample.
struct Tap {
  uint32_t index;
  double weight;
};

// Taps for every output position along one axis. Output pixel o covers the
// input interval [o * scale, (o + 1) * scale); each input pixel is weighted
// by the length of its overlap with that interval, normalized to sum to 1.
inline std::vector<std::vector<Tap>> ComputeAreaTaps(uint32_t in_size,
                                                     uint32_t out_size) {
  std::vector<std::vector<Tap>> taps(out_size);
  const double scale = static_cast<double>(in_size) / out_size;

  for (uint32_t o = 0; o < out_size; ++o) {
    const double start = o * scale;
    const double end = std::min<double>(in_size, (o + 1) * scale);
    const uint32_t first = static_cast<uint32_t>(std::floor(start));
    const uint32_t last = std::min<uint32_t>(
        in_size, static_cast<uint32_t>(std::ceil(end)));

    double total = 0.0;
    for (uint32_t i = first; i < last; ++i) {
      const double overlap =
          std::min<double>(end, i + 1.0) - std::max<double>(start, i);
      if (overlap > 0.0) {
        taps[o].push_back({i, overlap});
        total += overlap;
      }
    }
    if (taps[o].empty()) {
      taps[o].push_back({std::min(first, in_size - 1), 1.0});
      total = 1.0;
    }
    for (Tap& tap : taps[o]) {
      tap.weight /= total;
    }
  }
  return taps;
}

inline uint8_t RoundToByte(double value) {
  return static_cast<uint8_t>(std::clamp(std::lround(value), 0L, 255L));
}

}  // namespace detail

/**
 * @brief Resample an image with an exact area-averaging box filter
 *
 * Every output pixel is the area-weighted mean of the input pixels it covers,
 * which handles non-integer factors as well as the slight enlargements
 * produced by overlap rounding. Channels are filtered independently, so an
 * alpha channel is averaged like any other.
 *
 * @param input Source image (any format, non-empty)
 * @param target Output dimensions (both non-zero)
 * @return Resampled image with the same format as @p input
 */
Image AreaResample(const Image& input, const ImageDimensions& target);

}  // namespace fastzoom::resample

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_RESAMPLE_AREA_H_
