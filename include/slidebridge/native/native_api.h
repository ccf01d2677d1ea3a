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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_NATIVE_API_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_NATIVE_API_H_

#include <string>

#include "openslide/openslide.h"

namespace slidebridge::native {

/// @brief Table of the OpenSlide entry points used by slidebridge
///
/// Each member has exactly the signature of the C function it is named
/// after. All native calls made by the binding go through one of these
/// tables, so a table bound to an in-memory implementation can stand in for
/// libopenslide.
struct NativeApi {
  decltype(&openslide_detect_vendor) detect_vendor;
  decltype(&openslide_open) open;
  decltype(&openslide_close) close;
  decltype(&openslide_get_error) get_error;

  decltype(&openslide_get_level_count) get_level_count;
  decltype(&openslide_get_level0_dimensions) get_level0_dimensions;
  decltype(&openslide_get_level_dimensions) get_level_dimensions;
  decltype(&openslide_get_level_downsample) get_level_downsample;
  decltype(&openslide_get_best_level_for_downsample)
      get_best_level_for_downsample;
  decltype(&openslide_read_region) read_region;

  decltype(&openslide_get_property_names) get_property_names;
  decltype(&openslide_get_property_value) get_property_value;

  decltype(&openslide_get_associated_image_names) get_associated_image_names;
  decltype(&openslide_get_associated_image_dimensions)
      get_associated_image_dimensions;
  decltype(&openslide_read_associated_image) read_associated_image;

  decltype(&openslide_get_version) get_version;

  decltype(&openslide_cache_create) cache_create;
  decltype(&openslide_set_cache) set_cache;
  decltype(&openslide_cache_release) cache_release;
};

/// @brief Table bound to the linked libopenslide
const NativeApi& OpenSlideApi();

/// @brief Version string reported by the native library
std::string GetLibraryVersion(const NativeApi& api = OpenSlideApi());

}  // namespace slidebridge::native

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_NATIVE_NATIVE_API_H_
