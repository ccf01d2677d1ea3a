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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_SLIDE_HANDLE_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_SLIDE_HANDLE_H_

#include "slidebridge/native/native_api.h"

namespace slidebridge::native {

/**
 * @brief RAII owner of one native slide handle
 *
 * Calls `close` on the owning table exactly once, either from Close() or
 * from the destructor. A moved-from or closed handle is invalid and never
 * touches native code again.
 */
class SlideHandle {
 public:
  SlideHandle() = default;

  /**
   * @brief Take ownership of a handle returned by `api.open`
   * @param handle Raw handle (may be nullptr, giving an invalid guard)
   * @param api Table the handle was opened through; must outlive the guard
   */
  SlideHandle(openslide_t* handle, const NativeApi* api)
      : handle_(handle), api_(api) {}

  /// @brief Destructor - closes a still-open handle
  ~SlideHandle() noexcept;

  // Non-copyable but movable
  SlideHandle(const SlideHandle&) = delete;
  SlideHandle& operator=(const SlideHandle&) = delete;

  /**
   * @brief Move constructor
   * @param other Handle to move from (will be left in invalid state)
   */
  SlideHandle(SlideHandle&& other) noexcept
      : handle_(other.handle_), api_(other.api_) {
    other.handle_ = nullptr;
    other.api_ = nullptr;
  }

  /**
   * @brief Move assignment operator
   *
   * Closes the handle currently held before taking over `other`.
   */
  SlideHandle& operator=(SlideHandle&& other) noexcept {
    if (this != &other) {
      Close();
      handle_ = other.handle_;
      api_ = other.api_;
      other.handle_ = nullptr;
      other.api_ = nullptr;
    }
    return *this;
  }

  /// @brief Raw handle (nullptr if invalid)
  [[nodiscard]] openslide_t* Get() const { return handle_; }

  /// @brief Table the handle belongs to (nullptr if invalid)
  [[nodiscard]] const NativeApi* api() const { return api_; }

  /// @brief Check if the handle is open
  [[nodiscard]] bool Valid() const { return handle_ != nullptr; }

  /**
   * @brief Close the native handle
   *
   * Idempotent. A pending native error is logged but does not prevent the
   * close.
   */
  void Close() noexcept;

 private:
  openslide_t* handle_ = nullptr;
  const NativeApi* api_ = nullptr;
};

}  // namespace slidebridge::native

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_SLIDE_HANDLE_H_
