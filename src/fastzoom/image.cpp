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

#include "fastzoom/image.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"

namespace fastzoom {

void Image::Fill(const std::vector<uint8_t>& samples) {
  if (samples.size() != channels_) {
    throw std::invalid_argument(
        absl::StrFormat("Fill expects %u samples per pixel, got %u", channels_,
                        samples.size()));
  }
  const size_t pixel_count = GetPixelCount();
  for (size_t i = 0; i < pixel_count; ++i) {
    std::memcpy(&data_[i * channels_], samples.data(), channels_);
  }
}

void Image::Paste(const Image& source_image, int64_t dest_x,
                  int64_t dest_y) {
  if (source_image.Empty() || Empty()) {
    return;
  }
  if (format_ != source_image.format_) {
    throw std::invalid_argument("Image formats must match for pasting");
  }

  // Part of the source that lands inside this image
  const int64_t src_x = std::max<int64_t>(0, -dest_x);
  const int64_t src_y = std::max<int64_t>(0, -dest_y);
  const int64_t dst_x = std::max<int64_t>(0, dest_x);
  const int64_t dst_y = std::max<int64_t>(0, dest_y);
  const int64_t copy_width =
      std::min<int64_t>(source_image.GetWidth() - src_x, dimensions_[0] - dst_x);
  const int64_t copy_height = std::min<int64_t>(
      source_image.GetHeight() - src_y, dimensions_[1] - dst_y);
  if (copy_width <= 0 || copy_height <= 0) {
    return;
  }

  const size_t row_bytes = static_cast<size_t>(copy_width) * channels_;
  for (int64_t row = 0; row < copy_height; ++row) {
    const uint8_t* src_ptr =
        source_image.GetRow(static_cast<uint32_t>(src_y + row)) +
        static_cast<size_t>(src_x) * channels_;
    uint8_t* dst_ptr = GetRow(static_cast<uint32_t>(dst_y + row)) +
                       static_cast<size_t>(dst_x) * channels_;
    std::memcpy(dst_ptr, src_ptr, row_bytes);
  }
}

std::string Image::GetDescription() const {
  return absl::StrFormat("%s %ux%u", GetName(format_), dimensions_[0],
                         dimensions_[1]);
}

}  // namespace fastzoom
