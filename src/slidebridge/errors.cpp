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

#include "slidebridge/errors.h"

#include <array>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "slidebridge/status/status_macros.h"

namespace slidebridge {

namespace {

constexpr std::array<ErrorKind, 6> kAllKinds = {
    ErrorKind::kOpenError,         ErrorKind::kUseAfterClose,
    ErrorKind::kInvalidLevel,      ErrorKind::kRegionOutOfBounds,
    ErrorKind::kNativeError,       ErrorKind::kVendorUnknown,
};

}  // namespace

absl::Status TagError(absl::Status status, ErrorKind kind) {
  if (status.ok()) {
    return status;
  }
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(GetName(kind)));
  return status;
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return std::nullopt;
  }

  const std::optional<absl::Cord> payload =
      status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }

  const std::string name(*payload);
  for (ErrorKind kind : kAllKinds) {
    if (name == GetName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string GetRootMessage(const absl::Status& status) {
  return status::StripStackTrace(status.message());
}

}  // namespace slidebridge
