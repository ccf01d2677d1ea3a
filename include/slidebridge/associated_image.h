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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_ASSOCIATED_IMAGE_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_ASSOCIATED_IMAGE_H_

#include <functional>
#include <map>
#include <string>

#include "slidebridge/geometry.h"
#include "slidebridge/image.h"

namespace slidebridge {

/// @brief A non-pyramidal image stored alongside the slide
///
/// Typical names are "label", "macro" and "thumbnail".
struct AssociatedImage {
  std::string name;       ///< Name as reported by OpenSlide
  Dimensions dimensions;  ///< Size in pixels
  PixelBuffer pixels;     ///< Premultiplied ARGB pixels
};

/// @brief Snapshot of all associated images keyed by name
using AssociatedImages = std::map<std::string, AssociatedImage, std::less<>>;

}  // namespace slidebridge

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_ASSOCIATED_IMAGE_H_
