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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_SIZE_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_SIZE_H_

#include <fmt/format.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <type_traits>

namespace fastzoom {

template <typename T>
concept GenericNumber = std::integral<T> || std::floating_point<T>;

/// @brief Fixed-size numeric tuple used for sizes, locations and tile grids
///
/// Index 0 is the horizontal axis (x / width / column), index 1 the vertical
/// axis (y / height / row).
template <GenericNumber T, std::size_t N>
class Size {
 public:
  constexpr Size() : data_{} {}

  constexpr Size(std::initializer_list<T> init) : data_{} {
    if (init.size() != N) {
      throw std::invalid_argument("Initializer list must have size N.");
    }
    std::size_t i = 0;
    for (const T& value : init) {
      data_[i++] = value;
    }
  }

  template <typename... Args>
  constexpr explicit Size(Args... args) requires(
      sizeof...(args) == N && (std::convertible_to<Args, T> && ...))
      : data_{static_cast<T>(args)...} {}

  constexpr T& operator[](std::size_t index) { return data_[index]; }

  constexpr const T& operator[](std::size_t index) const {
    return data_[index];
  }

  [[nodiscard]] static constexpr std::size_t Rank() { return N; }

  /// @brief Product of all components (e.g. pixel count of a dimension)
  [[nodiscard]] constexpr uint64_t Product() const
      requires std::integral<T> {
    uint64_t product = 1;
    for (const T& value : data_) {
      product *= static_cast<uint64_t>(value);
    }
    return product;
  }

  template <typename U>
  explicit operator Size<U, N>() const requires std::convertible_to<T, U> {
    Size<U, N> result;
    for (std::size_t i = 0; i < N; ++i) {
      result[i] = static_cast<U>(data_[i]);
    }
    return result;
  }

  constexpr bool operator==(const Size& other) const {
    return data_ == other.data_;
  }

  constexpr bool operator!=(const Size& other) const {
    return !(*this == other);
  }

  friend std::ostream& operator<<(std::ostream& os, const Size& size) {
    os << "{";
    for (std::size_t i = 0; i < N; ++i) {
      os << +size[i];
      if (i < N - 1) {
        os << ", ";
      }
    }
    os << "}";
    return os;
  }

 private:
  std::array<T, N> data_;
};

/// @brief Pixel dimensions [width, height] or tile grid [columns, rows]
using ImageDimensions = Size<uint32_t, 2>;

/// @brief Pixel coordinate [x, y] inside an image
using ImageCoordinate = Size<uint32_t, 2>;

/// @brief Signed tier-0 location [x, y] handed to region reads
using RegionLocation = Size<int64_t, 2>;

}  // namespace fastzoom

template <typename T, std::size_t N>
struct fmt::formatter<fastzoom::Size<T, N>> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const fastzoom::Size<T, N>& size, FormatContext& ctx) const
      -> decltype(ctx.out()) {
    auto out = ctx.out();
    *out++ = '{';
    for (std::size_t i = 0; i < N; ++i) {
      out = fmt::format_to(out, "{}", size[i]);
      if (i < N - 1) {
        *out++ = ',';
        *out++ = ' ';
      }
    }
    *out++ = '}';
    return out;
  }
};

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_CORE_SIZE_H_
