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

#include "slidebridge/native/error_bridge.h"

#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "slidebridge/errors.h"
#include "slidebridge/status/status_macros.h"
#include "slidebridge/utilities/fmt.h"

namespace slidebridge::native {

std::optional<std::string> GetNativeError(const NativeApi& api,
                                          openslide_t* handle) {
  const char* error = api.get_error(handle);
  if (error == nullptr) {
    return std::nullopt;
  }
  return std::string(error);
}

absl::Status CheckNativeError(const NativeApi& api, openslide_t* handle,
                              std::string_view function) {
  std::optional<std::string> error = GetNativeError(api, handle);
  if (!error.has_value()) {
    return absl::OkStatus();
  }

  // The root message is exactly the native text; the call site goes into the
  // trace frame.
  const absl::Status native_status(GetStatusCode(ErrorKind::kNativeError),
                                  *error);
  return TagError(
      status::AddTrace(native_status, __func__, __FILE__, __LINE__,
                       fmt::format("after {}", function)),
      ErrorKind::kNativeError);
}

absl::Status SentinelError(std::string_view function) {
  return MAKE_ERROR(
      ErrorKind::kNativeError,
      fmt::format("{} returned an error sentinel without error text",
                  function));
}

}  // namespace slidebridge::native
