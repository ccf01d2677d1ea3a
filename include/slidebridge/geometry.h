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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_GEOMETRY_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_GEOMETRY_H_

#include <cstdint>
#include <ostream>

#include "absl/status/status.h"

namespace slidebridge {

/// @brief Width and height in pixels
struct Dimensions {
  uint64_t width = 0;   ///< Width in pixels
  uint64_t height = 0;  ///< Height in pixels

  bool operator==(const Dimensions& other) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Dimensions& dims) {
  return os << dims.width << " x " << dims.height;
}

/// @brief Geometry of one pyramid level as reported by OpenSlide
struct LevelInfo {
  Dimensions dimensions;    ///< Level size in pixels
  double downsample = 1.0;  ///< Ratio of level 0 resolution to this level
};

/// @brief A region to read from a slide
///
/// `x` and `y` are the top-left corner in level 0 pixel space (the OpenSlide
/// convention); `width` and `height` are in the pixel space of `level`.
struct RegionRequest {
  int64_t x = 0;
  int64_t y = 0;
  int32_t level = 0;
  int64_t width = 0;
  int64_t height = 0;
};

inline std::ostream& operator<<(std::ostream& os,
                                const RegionRequest& request) {
  return os << "(" << request.x << ", " << request.y << ") level "
            << request.level << " size " << request.width << " x "
            << request.height;
}

/// @brief Check that a region has a positive extent
/// @return OK, or kRegionOutOfBounds
[[nodiscard]] absl::Status CheckRegionExtent(const RegionRequest& request);

/// @brief Check that a region lies within the bounds of its level
///
/// The level 0 origin is mapped into level space with
/// `floor(x / downsample)`. This is an approximation of what OpenSlide does
/// internally, which is acceptable because the only goal is to keep clearly
/// out-of-range reads away from the native library.
///
/// @param request Region request (the extent is checked as well)
/// @param level Geometry of `request.level`
/// @return OK, or kRegionOutOfBounds
[[nodiscard]] absl::Status CheckRegionBounds(const RegionRequest& request,
                                             const LevelInfo& level);

}  // namespace slidebridge

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_GEOMETRY_H_
