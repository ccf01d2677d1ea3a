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

#include "slidebridge/geometry.h"

#include <cmath>
#include <cstdint>

#include "absl/status/status.h"
#include "slidebridge/errors.h"
#include "slidebridge/utilities/fmt.h"

namespace slidebridge {

namespace {

/// @brief Map a level 0 coordinate into level space
///
/// Stays in floating point; the caller range-checks before converting.
double ToLevelSpace(int64_t coordinate, double downsample) {
  return std::floor(static_cast<double>(coordinate) / downsample);
}

/// @brief True when [origin, origin + extent) fits in [0, limit)
bool FitsWithin(double origin, int64_t extent, uint64_t limit) {
  if (!(origin < static_cast<double>(limit))) {
    return false;
  }
  // origin is now a non-negative integral value below limit.
  const auto level_origin = static_cast<uint64_t>(origin);
  const auto unsigned_extent = static_cast<uint64_t>(extent);
  if (unsigned_extent > limit) {
    return false;
  }
  return level_origin <= limit - unsigned_extent;
}

}  // namespace

absl::Status CheckRegionExtent(const RegionRequest& request) {
  if (request.width <= 0 || request.height <= 0) {
    return MAKE_ERROR(
        ErrorKind::kRegionOutOfBounds,
        fmt::format("Region extent must be positive, got {} x {}",
                    request.width, request.height));
  }
  return absl::OkStatus();
}

absl::Status CheckRegionBounds(const RegionRequest& request,
                               const LevelInfo& level) {
  RETURN_IF_ERROR(CheckRegionExtent(request));

  if (request.x < 0 || request.y < 0) {
    return MAKE_ERROR(ErrorKind::kRegionOutOfBounds,
                      fmt::format("Region origin ({}, {}) is negative",
                                  request.x, request.y));
  }

  if (!(level.downsample > 0.0) || !std::isfinite(level.downsample)) {
    return MAKE_ERROR(
        ErrorKind::kRegionOutOfBounds,
        fmt::format("Level {} has an unusable downsample factor {}",
                    request.level, level.downsample));
  }

  const double level_x = ToLevelSpace(request.x, level.downsample);
  const double level_y = ToLevelSpace(request.y, level.downsample);

  if (!FitsWithin(level_x, request.width, level.dimensions.width) ||
      !FitsWithin(level_y, request.height, level.dimensions.height)) {
    return MAKE_ERROR(
        ErrorKind::kRegionOutOfBounds,
        fmt::format("Region {} x {} at level position ({}, {}) exceeds "
                    "level {} bounds {} x {}",
                    request.width, request.height, level_x, level_y,
                    request.level, level.dimensions.width,
                    level.dimensions.height));
  }

  return absl::OkStatus();
}

}  // namespace slidebridge
