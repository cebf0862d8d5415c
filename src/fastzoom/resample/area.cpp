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

#include "fastzoom/resample/area.h"

#include <stdexcept>
#include <vector>

namespace fastzoom::resample {

Image AreaResample(const Image& input, const ImageDimensions& target) {
  if (input.Empty()) {
    throw std::invalid_argument("AreaResample: input image is empty");
  }
  if (target[0] == 0 || target[1] == 0) {
    throw std::invalid_argument("AreaResample: target dimensions are empty");
  }
  if (input.GetDimensions() == target) {
    return input;
  }

  const uint32_t in_w = input.GetWidth();
  const uint32_t in_h = input.GetHeight();
  const uint32_t out_w = target[0];
  const uint32_t out_h = target[1];
  const uint32_t channels = input.GetChannels();

  const auto x_taps = detail::ComputeAreaTaps(in_w, out_w);
  const auto y_taps = detail::ComputeAreaTaps(in_h, out_h);

  // Horizontal pass: in_h rows of out_w pixels, kept in double precision.
  std::vector<double> horizontal(static_cast<size_t>(in_h) * out_w * channels);
  for (uint32_t y = 0; y < in_h; ++y) {
    const uint8_t* row = input.GetRow(y);
    double* out_row = &horizontal[static_cast<size_t>(y) * out_w * channels];
    for (uint32_t ox = 0; ox < out_w; ++ox) {
      for (const detail::Tap& tap : x_taps[ox]) {
        const uint8_t* px = row + static_cast<size_t>(tap.index) * channels;
        for (uint32_t c = 0; c < channels; ++c) {
          out_row[static_cast<size_t>(ox) * channels + c] += tap.weight * px[c];
        }
      }
    }
  }

  // Vertical pass.
  Image output(target, input.GetFormat());
  const size_t row_samples = static_cast<size_t>(out_w) * channels;
  std::vector<double> accum(row_samples);
  for (uint32_t oy = 0; oy < out_h; ++oy) {
    std::fill(accum.begin(), accum.end(), 0.0);
    for (const detail::Tap& tap : y_taps[oy]) {
      const double* src = &horizontal[static_cast<size_t>(tap.index) *
                                      row_samples];
      for (size_t i = 0; i < row_samples; ++i) {
        accum[i] += tap.weight * src[i];
      }
    }
    uint8_t* out_row = output.GetRow(oy);
    for (size_t i = 0; i < row_samples; ++i) {
      out_row[i] = detail::RoundToByte(accum[i]);
    }
  }
  return output;
}

}  // namespace fastzoom::resample
