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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_IMAGE_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "fastzoom/core/size.h"

namespace fastzoom {

/// @brief Pixel layout of an Image (8 bits per sample, interleaved)
enum class ImageFormat {
  kGray = 1,  ///< Single channel grayscale
  kRGB = 3,   ///< 3 channels: Red, Green, Blue
  kRGBA = 4,  ///< 4 channels: Red, Green, Blue, Alpha
};

/// @brief Get string representation of image format
constexpr const char* GetName(ImageFormat format) {
  switch (format) {
    case ImageFormat::kGray:
      return "Gray";
    case ImageFormat::kRGB:
      return "RGB";
    case ImageFormat::kRGBA:
      return "RGBA";
  }
  return "unknown";
}

/// @brief Number of interleaved samples per pixel
constexpr uint32_t GetFormatChannels(ImageFormat format) {
  return static_cast<uint32_t>(format);
}

/// @brief 8-bit interleaved image container
///
/// Samples are stored row-major as RGBRGB... (or RGBARGBA...). Tiles, raw
/// source regions and resampled intermediates all use this type.
class Image {
 public:
  /// @brief Default constructor for an empty image
  Image() : dimensions_({0, 0}), format_(ImageFormat::kRGB), channels_(3) {}

  /// @brief Constructor allocating a zero-filled image
  /// @param dimensions Image dimensions [width, height]
  /// @param format Pixel layout
  Image(const ImageDimensions& dimensions, ImageFormat format)
      : dimensions_(dimensions),
        format_(format),
        channels_(GetFormatChannels(format)) {
    data_.resize(static_cast<size_t>(dimensions_[0]) * dimensions_[1] *
                     channels_,
                 0);
  }

  Image(const Image& other) = default;
  Image(Image&& other) noexcept = default;
  Image& operator=(const Image& other) = default;
  Image& operator=(Image&& other) noexcept = default;
  ~Image() = default;

  [[nodiscard]] const ImageDimensions& GetDimensions() const noexcept {
    return dimensions_;
  }

  [[nodiscard]] uint32_t GetWidth() const noexcept { return dimensions_[0]; }

  [[nodiscard]] uint32_t GetHeight() const noexcept { return dimensions_[1]; }

  [[nodiscard]] uint32_t GetChannels() const noexcept { return channels_; }

  [[nodiscard]] ImageFormat GetFormat() const noexcept { return format_; }

  [[nodiscard]] bool HasAlpha() const noexcept {
    return format_ == ImageFormat::kRGBA;
  }

  /// @brief Check if image has no pixels
  [[nodiscard]] bool Empty() const noexcept {
    return dimensions_[0] == 0 || dimensions_[1] == 0;
  }

  [[nodiscard]] size_t SizeBytes() const noexcept { return data_.size(); }

  [[nodiscard]] size_t GetPixelCount() const noexcept {
    return static_cast<size_t>(dimensions_[0]) * dimensions_[1];
  }

  /// @brief Number of bytes in one row of pixels
  [[nodiscard]] size_t GetStride() const noexcept {
    return static_cast<size_t>(dimensions_[0]) * channels_;
  }

  [[nodiscard]] const uint8_t* GetData() const noexcept { return data_.data(); }

  [[nodiscard]] uint8_t* GetData() noexcept { return data_.data(); }

  /// @brief Pointer to the first sample of row @p y
  [[nodiscard]] const uint8_t* GetRow(uint32_t y) const noexcept {
    return data_.data() + static_cast<size_t>(y) * GetStride();
  }

  [[nodiscard]] uint8_t* GetRow(uint32_t y) noexcept {
    return data_.data() + static_cast<size_t>(y) * GetStride();
  }

  /// @brief Get a sample with bounds checking
  /// @param y Row coordinate
  /// @param x Column coordinate
  /// @param channel Channel index
  [[nodiscard]] uint8_t& At(uint32_t y, uint32_t x, uint32_t channel) {
    ValidateCoordinates(y, x, channel);
    return data_[GetSampleIndex(y, x, channel)];
  }

  [[nodiscard]] const uint8_t& At(uint32_t y, uint32_t x,
                                  uint32_t channel) const {
    ValidateCoordinates(y, x, channel);
    return data_[GetSampleIndex(y, x, channel)];
  }

  /// @brief Fill every pixel with the same sample values
  /// @param samples One value per channel
  /// @details Throws std::invalid_argument if the count does not match the
  /// channel count.
  void Fill(const std::vector<uint8_t>& samples);

  /// @brief Paste another image onto this image at specified coordinates
  /// @param source_image Image to paste (must have the same format)
  /// @param dest_x Destination x coordinate (left edge), may be negative
  /// @param dest_y Destination y coordinate (top edge), may be negative
  /// @details The source is clipped against this image's boundaries on all
  /// four sides.
  void Paste(const Image& source_image, int64_t dest_x, int64_t dest_y);

  /// @brief Human-readable description, e.g. "RGB 256x256"
  [[nodiscard]] std::string GetDescription() const;

 private:
  ImageDimensions dimensions_;  ///< Image dimensions [width, height]
  ImageFormat format_;          ///< Pixel layout
  uint32_t channels_;           ///< Samples per pixel
  std::vector<uint8_t> data_;   ///< Raw interleaved samples

  void ValidateCoordinates(uint32_t y, uint32_t x, uint32_t channel) const {
    if (x >= dimensions_[0] || y >= dimensions_[1] || channel >= channels_) {
      throw std::out_of_range(
          "Pixel coordinates or channel index out of bounds");
    }
  }

  [[nodiscard]] size_t GetSampleIndex(uint32_t y, uint32_t x,
                                      uint32_t channel) const {
    return (static_cast<size_t>(y) * dimensions_[0] + x) * channels_ + channel;
  }
};

inline std::ostream& operator<<(std::ostream& os, const Image& image) {
  os << image.GetDescription();
  return os;
}

}  // namespace fastzoom

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_IMAGE_H_
