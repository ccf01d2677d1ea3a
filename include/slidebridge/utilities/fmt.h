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
#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_UTILITIES_FMT_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_UTILITIES_FMT_H_

// Error and log messages are formatted through this alias so the binding can
// use std::format where libc++ ships it and {fmt} everywhere else.
#if defined(__clang__) && (__clang_major__ >= 17) && __cplusplus >= 202002L && \
    defined(_LIBCPP_VERSION)
#include <format>

namespace slidebridge::fmt {
using std::format;
}
#else
#include <fmt/core.h>

namespace slidebridge::fmt {
using ::fmt::format;
}
#endif

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_UTILITIES_FMT_H_
