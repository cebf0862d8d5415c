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

#include "fastzoom/sources/memory_slide_source.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "fastzoom/resample/area.h"
#include "fastzoom/status/status_macros.h"

namespace fastzoom {

namespace {

int64_t FloorDiv(int64_t value, double divisor) {
  return static_cast<int64_t>(std::floor(static_cast<double>(value) / divisor));
}

}  // namespace

absl::StatusOr<Image> ToRGBA(const Image& image) {
  if (image.GetFormat() == ImageFormat::kRGBA) {
    return image;
  }

  const uint32_t channels = image.GetChannels();
  if (channels != 1 && channels != 3) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Cannot convert %s to RGBA",
                                       image.GetDescription()));
  }

  Image out(image.GetDimensions(), ImageFormat::kRGBA);
  out.Fill({0, 0, 0, 255});
  for (uint32_t y = 0; y < image.GetHeight(); ++y) {
    for (uint32_t x = 0; x < image.GetWidth(); ++x) {
      for (uint32_t c = 0; c < 3; ++c) {
        // Gray replicates its single sample.
        out.At(y, x, c) = image.At(y, x, channels == 1 ? 0 : c);
      }
    }
  }
  return out;
}

absl::StatusOr<std::unique_ptr<MemorySlideSource>> MemorySlideSource::Create(
    const Image& image, std::vector<double> downsamples,
    SlideProperties properties) {
  if (image.Empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Source image is empty");
  }
  if (downsamples.empty()) {
    downsamples.push_back(1.0);
  }
  if (downsamples.front() != 1.0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("First tier must have downsample 1.0, got %f",
                        downsamples.front()));
  }
  for (size_t i = 1; i < downsamples.size(); ++i) {
    if (!(downsamples[i] > downsamples[i - 1])) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          absl::StrFormat("Tier downsamples must increase strictly "
                          "(tier %d: %f after %f)",
                          i, downsamples[i], downsamples[i - 1]));
    }
  }

  DECLARE_ASSIGN_OR_RETURN(Image, full, ToRGBA(image));

  std::vector<SourceTier> tiers;
  std::vector<Image> images;
  tiers.reserve(downsamples.size());
  images.reserve(downsamples.size());

  for (double downsample : downsamples) {
    const ImageDimensions dims{
        std::max<uint32_t>(1, static_cast<uint32_t>(std::floor(
                                  full.GetWidth() / downsample))),
        std::max<uint32_t>(1, static_cast<uint32_t>(std::floor(
                                  full.GetHeight() / downsample)))};
    tiers.emplace_back(dims, downsample);
    images.push_back(dims == full.GetDimensions()
                         ? full
                         : resample::AreaResample(full, dims));
    VLOG(1) << "Memory source tier " << tiers.size() - 1 << ": " << dims
            << " (downsample " << downsample << ")";
  }

  return std::unique_ptr<MemorySlideSource>(new MemorySlideSource(
      std::move(tiers), std::move(images), std::move(properties)));
}

absl::StatusOr<SourceTier> MemorySlideSource::GetTierInfo(int tier) const {
  if (tier < 0 || tier >= GetTierCount()) {
    return MAKE_STATUS(absl::StatusCode::kOutOfRange,
                       absl::StrFormat("Tier %d out of range (tier count %d)",
                                       tier, GetTierCount()));
  }
  return tiers_[static_cast<size_t>(tier)];
}

absl::StatusOr<Image> MemorySlideSource::ReadRegion(
    const RegionLocation& location, int tier,
    const ImageDimensions& size) const {
  DECLARE_ASSIGN_OR_RETURN(SourceTier, info, GetTierInfo(tier));
  if (size[0] == 0 || size[1] == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Empty region size %ux%u", size[0],
                                       size[1]));
  }

  const Image& stored = GetTierImage(tier);
  Image out(size, ImageFormat::kRGBA);  // zero-filled: transparent black

  // Region origin in tier pixels; the stored tier lands at its negation.
  const int64_t origin_x = FloorDiv(location[0], info.downsample);
  const int64_t origin_y = FloorDiv(location[1], info.downsample);
  out.Paste(stored, -origin_x, -origin_y);
  return out;
}

}  // namespace fastzoom
