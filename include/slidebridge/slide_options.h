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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDE_OPTIONS_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDE_OPTIONS_H_

#include <cstddef>
#include <optional>

namespace slidebridge {

namespace native {
struct NativeApi;
}  // namespace native

/// @brief Options for opening slide files
///
/// Example usage:
/// @code
/// SlideOptions options;
/// options.cache_capacity_bytes = 0;  // Disable OpenSlide's tile cache
///
/// auto slide = Slide::Open("slide.svs", options);
/// @endcode
struct SlideOptions {
  /// @brief Capacity of a private OpenSlide tile cache
  ///
  /// If set, a cache of this size replaces the library's shared default
  /// cache for this slide. Zero disables caching.
  std::optional<size_t> cache_capacity_bytes;

  /// @brief Reject paths that do not exist before calling into OpenSlide
  bool check_path_exists = true;

  /// @brief Native function table; nullptr selects the linked libopenslide
  ///
  /// The table must outlive every slide opened through it.
  const native::NativeApi* api = nullptr;

  /// @brief Default constructor
  SlideOptions() = default;
};

}  // namespace slidebridge

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDE_OPTIONS_H_
