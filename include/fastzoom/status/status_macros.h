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

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_STATUS_STATUS_MACROS_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"

namespace fastzoom::status {

/// Separator that starts every trace frame inside a status message.
inline constexpr std::string_view kFrameMarker = "\n  at ";

/**
 * @brief Formats one trace frame.
 *
 * Produces `"  at Function (file.cpp:42) [INVALID_ARGUMENT] - message"`.
 */
inline std::string FormatFrame(const char* function, const char* file,
                               int line, absl::StatusCode code,
                               std::string_view message) {
  std::string frame = absl::StrCat("  at ", function, " (", file, ":", line,
                                   ") [", absl::StatusCodeToString(code), "]");
  if (!message.empty()) {
    absl::StrAppend(&frame, " - ", message);
  }
  return frame;
}

/// @brief Returns the root error text of a traced message (no frames).
inline std::string_view RootMessage(std::string_view full_message) {
  if (auto pos = full_message.find(kFrameMarker);
      pos != std::string_view::npos) {
    return full_message.substr(0, pos);
  }
  return full_message;
}

/**
 * @brief Appends a frame to a non-OK status.
 *
 * The code, the root message, previously recorded frames and every payload
 * of the input status are preserved, so callers can still classify errors
 * after they crossed several layers.
 */
inline absl::Status AddTrace(const absl::Status& st, const char* function,
                             const char* file, int line,
                             std::string_view message = {}) {
  if (st.ok()) {
    return st;
  }

  std::string out(st.message());
  out.push_back('\n');
  out += FormatFrame(function, file, line, st.code(), message);

  absl::Status traced(st.code(), out);
  st.ForEachPayload([&traced](std::string_view type_url,
                              const absl::Cord& payload) {
    traced.SetPayload(type_url, payload);
  });
  return traced;
}

template <typename T>
inline absl::StatusOr<T> AddTrace(const absl::StatusOr<T>& sor,
                                  const char* function, const char* file,
                                  int line, std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTrace(sor.status(), function, file, line, message);
}

}  // namespace fastzoom::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/**
 * @brief Create a traced absl::Status carrying its first frame.
 *
 * @param code    The absl::StatusCode to use.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                        \
  ::fastzoom::status::AddTrace(absl::Status((code), (message)), __func__, \
                               __FILE__, __LINE__)

/**
 * @brief Propagate a non-OK absl::Status, appending this function as a frame.
 *
 * @param expr  A Status-producing expression.
 * @param msg   Message for this frame (may be empty).
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                           \
  do {                                                                       \
    auto _st = (expr);                                                       \
    if (!_st.ok()) {                                                         \
      return ::fastzoom::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                          (msg));                            \
    }                                                                        \
  } while (0)

/**
 * @brief Unpack a StatusOr<T> into lhs or return on error with a trace.
 *
 * Moves the value out, so it also works for move-only types.
 *
 * @param lhs   Target variable to assign (already declared).
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                     \
  do {                                                                       \
    auto _sor = (expr);                                                      \
    if (!_sor.ok()) {                                                        \
      return ::fastzoom::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                          __LINE__, ##__VA_ARGS__);          \
    }                                                                        \
    lhs = std::move(_sor).value();                                           \
  } while (0)

/**
 * @brief Declare a variable and unpack a StatusOr<T> into it.
 *
 * @param type   Type of the declared variable (must be default constructible).
 * @param name   Name of the declared variable.
 * @param expr   A StatusOr<T>-producing expression.
 * @param ...    Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_ASSIGN_OR_RETURN(type, name, expr, ...) \
  type name;                                            \
  ASSIGN_OR_RETURN(name, expr, ##__VA_ARGS__)

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_STATUS_STATUS_MACROS_H_
