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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_ERRORS_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_ERRORS_H_

#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidebridge/status/status_macros.h"

namespace slidebridge {

/// @brief Kinds of failure reported by the binding
///
/// Failures in these categories carry the kind as a status payload, and the
/// absl::StatusCode is derived from it (see GetStatusCode), so callers can
/// branch on either. Plain argument errors (a negative downsample factor, an
/// unknown property name) are returned as untagged statuses.
enum class ErrorKind {
  kOpenError,          ///< Path invalid, unsupported/corrupt file, open failed
  kUseAfterClose,      ///< Operation on a closed or moved-from slide
  kInvalidLevel,       ///< Level index outside [0, level_count)
  kRegionOutOfBounds,  ///< Region exceeds level bounds or has empty extent
  kNativeError,        ///< OpenSlide reported an error after a call
  kVendorUnknown,      ///< Vendor detection found no matching format
};

/// @brief Payload type URL under which the error kind is stored
inline constexpr std::string_view kErrorKindPayloadUrl =
    "type.slidebridge.dev/slidebridge.ErrorKind";

/// @brief Get string representation of an error kind
constexpr const char* GetName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOpenError:
      return "OpenError";
    case ErrorKind::kUseAfterClose:
      return "UseAfterClose";
    case ErrorKind::kInvalidLevel:
      return "InvalidLevel";
    case ErrorKind::kRegionOutOfBounds:
      return "RegionOutOfBounds";
    case ErrorKind::kNativeError:
      return "NativeError";
    case ErrorKind::kVendorUnknown:
      return "VendorUnknown";
  }
  return "unknown";
}

/// @brief Status code used for each error kind
constexpr absl::StatusCode GetStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOpenError:
      return absl::StatusCode::kInvalidArgument;
    case ErrorKind::kUseAfterClose:
      return absl::StatusCode::kFailedPrecondition;
    case ErrorKind::kInvalidLevel:
    case ErrorKind::kRegionOutOfBounds:
      return absl::StatusCode::kOutOfRange;
    case ErrorKind::kNativeError:
      return absl::StatusCode::kInternal;
    case ErrorKind::kVendorUnknown:
      return absl::StatusCode::kNotFound;
  }
  return absl::StatusCode::kUnknown;
}

/// @brief Attach an error kind to a status
/// @param status Non-OK status (OK statuses are returned unchanged)
/// @param kind Kind to record
/// @return Status carrying the kind payload
absl::Status TagError(absl::Status status, ErrorKind kind);

/// @brief Recover the error kind from a status
/// @return Kind, or std::nullopt for OK statuses and untagged errors
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

/// @brief Recover the error kind from a StatusOr
template <typename T>
std::optional<ErrorKind> GetErrorKind(const absl::StatusOr<T>& status_or) {
  return GetErrorKind(status_or.status());
}

/// @brief Check whether a status carries the given kind
inline bool IsErrorKind(const absl::Status& status, ErrorKind kind) {
  return GetErrorKind(status) == kind;
}

/// @brief Root error text without the trace frames
///
/// For kNativeError this is the vendor-defined message exactly as OpenSlide
/// reported it.
std::string GetRootMessage(const absl::Status& status);

}  // namespace slidebridge

/**
 * @brief Create a traced status tagged with a slidebridge::ErrorKind.
 *
 * @param kind    The slidebridge::ErrorKind.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_ERROR(kind, message)                                     \
  ::slidebridge::TagError(                                            \
      MAKE_STATUS(::slidebridge::GetStatusCode(kind), (message)), (kind))

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_ERRORS_H_
