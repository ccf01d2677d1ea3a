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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_ERROR_BRIDGE_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_ERROR_BRIDGE_H_

#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "slidebridge/native/native_api.h"

namespace slidebridge::native {

/// @brief Copy of the handle's native error string
/// @return Owned error text, or std::nullopt when no error is set
std::optional<std::string> GetNativeError(const NativeApi& api,
                                          openslide_t* handle);

/**
 * @brief Convert the handle's error slot into a status
 *
 * Must be called right after each delegate call. The native text is copied
 * verbatim and becomes the root message of the returned status; it is never
 * parsed.
 *
 * @param api Native table the handle belongs to
 * @param handle Open native handle
 * @param function Name of the delegate that was just called, recorded in
 *        the trace frame
 * @return OK when the slot is empty, kNativeError otherwise
 */
[[nodiscard]] absl::Status CheckNativeError(const NativeApi& api,
                                            openslide_t* handle,
                                            std::string_view function);

/// @brief kNativeError for a sentinel return that came without error text
[[nodiscard]] absl::Status SentinelError(std::string_view function);

}  // namespace slidebridge::native

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_ERROR_BRIDGE_H_
