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
#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_STATUS_STATUS_MACROS_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/cord.h"

namespace slidebridge::status {

/// @brief Marker that separates the root error text from the trace frames.
inline constexpr std::string_view kFrameMarker = "\n  at ";

/**
 * @brief Formats a single trace frame.
 *
 * Produces a line of the form:
 *     "  at FunctionName (file.cpp:123) [StatusCode] - optional message"
 */
inline std::string FormatStackFrame(char const* function, char const* file,
                                    int line, absl::StatusCode code,
                                    std::string_view message) {
  std::string s = "  at ";
  s.append(function);
  s.append(" (");
  s.append(file);
  s.push_back(':');
  s.append(std::to_string(line));
  s.append(") [");
  s.append(absl::StatusCodeToString(code));
  s.append("]");

  if (!message.empty()) {
    s.append(" - ");
    s.append(message);
  }
  return s;
}

/**
 * @brief Returns the root error text of a traced message.
 *
 * Everything from the first frame marker onward is dropped.
 */
inline std::string StripStackTrace(std::string_view full_message) {
  if (auto pos = full_message.find(kFrameMarker);
      pos != std::string_view::npos) {
    return std::string(full_message.substr(0, pos));
  }
  return std::string(full_message);
}

/**
 * @brief Appends exactly one trace frame to a non-OK status.
 *
 * The root text and any earlier frames are kept in order. Payloads attached
 * to the input status (such as the slidebridge error kind) are copied onto
 * the result so they survive propagation through any number of frames.
 */
inline absl::Status AddTraceImpl(absl::Status const& st, char const* function,
                                 char const* file, int line,
                                 std::string_view message) {
  if (st.ok()) {
    return st;
  }

  std::string out = StripStackTrace(st.message());
  if (auto pos = st.message().find(kFrameMarker);
      pos != std::string_view::npos) {
    out.append(st.message().substr(pos));
  }
  out.push_back('\n');
  out.append(FormatStackFrame(function, file, line, st.code(), message));

  absl::Status traced(st.code(), out);
  st.ForEachPayload(
      [&traced](std::string_view type_url, const absl::Cord& payload) {
        traced.SetPayload(type_url, payload);
      });
  return traced;
}

/// @brief Appends a trace frame to a Status.
inline absl::Status AddTrace(absl::Status const& st, char const* function,
                             char const* file, int line,
                             std::string_view message = {}) {
  return AddTraceImpl(st, function, file, line, message);
}

/// @brief Appends a trace frame to the status held by a StatusOr<T>.
template <typename T>
inline absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor,
                                  char const* function, char const* file,
                                  int line, std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTraceImpl(sor.status(), function, file, line, message);
}

}  // namespace slidebridge::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/**
 * @brief Create a traced absl::Status with an initial frame.
 *
 * @param code    The absl::StatusCode to use.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                          \
  ::slidebridge::status::AddTrace(absl::Status((code), (message)), __func__, \
                                  __FILE__, __LINE__)

/**
 * @brief Propagate a non-OK absl::Status, appending this function as a frame.
 *
 * @param expr  A Status-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, ...)                                            \
  do {                                                                        \
    auto _st = (expr);                                                        \
    if (!_st.ok()) {                                                          \
      return ::slidebridge::status::AddTrace(_st, __func__, __FILE__,         \
                                             __LINE__, ##__VA_ARGS__);        \
    }                                                                         \
  } while (0)

/**
 * @brief Unpack a StatusOr<T> into lhs or return on error with a trace.
 *
 * Works for move-only value types; lhs must already be declared.
 *
 * @param lhs   Target variable to assign.
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                  \
  do {                                                                    \
    auto _sor = (expr);                                                   \
    if (!_sor.ok()) {                                                     \
      return ::slidebridge::status::AddTrace(_sor.status(), __func__,     \
                                             __FILE__, __LINE__,          \
                                             ##__VA_ARGS__);              \
    }                                                                     \
    lhs = std::move(_sor).value();                                        \
  } while (0)

/**
 * @brief Declare a variable and unpack a StatusOr<T> into it.
 *
 * @param type   The type of the variable to declare.
 * @param name   The name of the variable to declare.
 * @param expr   A StatusOr<T>-producing expression.
 * @param ...    Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_ASSIGN_OR_RETURN(type, name, expr, ...) \
  type name;                                            \
  ASSIGN_OR_RETURN(name, expr, ##__VA_ARGS__)

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_STATUS_STATUS_MACROS_H_
