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

#include "slidebridge/native/native_api.h"

#include <string>

#include "openslide/openslide.h"

namespace slidebridge::native {

const NativeApi& OpenSlideApi() {
  static const NativeApi api = {
      .detect_vendor = &openslide_detect_vendor,
      .open = &openslide_open,
      .close = &openslide_close,
      .get_error = &openslide_get_error,
      .get_level_count = &openslide_get_level_count,
      .get_level0_dimensions = &openslide_get_level0_dimensions,
      .get_level_dimensions = &openslide_get_level_dimensions,
      .get_level_downsample = &openslide_get_level_downsample,
      .get_best_level_for_downsample = &openslide_get_best_level_for_downsample,
      .read_region = &openslide_read_region,
      .get_property_names = &openslide_get_property_names,
      .get_property_value = &openslide_get_property_value,
      .get_associated_image_names = &openslide_get_associated_image_names,
      .get_associated_image_dimensions =
          &openslide_get_associated_image_dimensions,
      .read_associated_image = &openslide_read_associated_image,
      .get_version = &openslide_get_version,
      .cache_create = &openslide_cache_create,
      .set_cache = &openslide_set_cache,
      .cache_release = &openslide_cache_release,
  };
  return api;
}

std::string GetLibraryVersion(const NativeApi& api) {
  const char* version = api.get_version();
  return version != nullptr ? std::string(version) : std::string();
}

}  // namespace slidebridge::native
