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

#include "slidebridge/native/slide_handle.h"

#include "absl/log/log.h"

namespace slidebridge::native {

SlideHandle::~SlideHandle() noexcept {
  Close();
}

void SlideHandle::Close() noexcept {
  if (handle_ == nullptr) {
    return;
  }

  if (const char* error = api_->get_error(handle_); error != nullptr) {
    LOG(WARNING) << "Closing slide handle in error state: " << error;
  }

  LOG(INFO) << "Closing slide handle " << handle_;

  openslide_t* handle = handle_;
  handle_ = nullptr;
  api_->close(handle);
  api_ = nullptr;
}

}  // namespace slidebridge::native
