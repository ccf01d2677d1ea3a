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

#include "slidebridge/slide.h"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidebridge/errors.h"
#include "slidebridge/native/error_bridge.h"
#include "slidebridge/status/status_macros.h"
#include "slidebridge/utilities/fmt.h"

namespace slidebridge {

namespace {

namespace fs = std::filesystem;

bool HasEmbeddedNul(std::string_view text) {
  return text.find('\0') != std::string_view::npos;
}

absl::Status ValidatePath(const std::string& path, bool check_exists) {
  if (path.empty()) {
    return MAKE_ERROR(ErrorKind::kOpenError, "Slide path is empty");
  }
  if (HasEmbeddedNul(path)) {
    return MAKE_ERROR(ErrorKind::kOpenError,
                      "Slide path contains an embedded NUL byte");
  }
  if (!check_exists) {
    return absl::OkStatus();
  }

  std::error_code ec;
  const fs::file_status status = fs::status(path, ec);
  if (ec && status.type() != fs::file_type::not_found) {
    return MAKE_ERROR(ErrorKind::kOpenError,
                      fmt::format("Cannot stat slide file {}: {}", path,
                                  ec.message()));
  }
  if (!fs::exists(status)) {
    return MAKE_ERROR(ErrorKind::kOpenError,
                      fmt::format("Slide file does not exist: {}", path));
  }
  if (fs::is_directory(status)) {
    return MAKE_ERROR(ErrorKind::kOpenError,
                      fmt::format("Slide path is a directory: {}", path));
  }
  return absl::OkStatus();
}

/// @brief Copy a NULL-terminated native string array
std::vector<std::string> CopyNameArray(const char* const* names) {
  std::vector<std::string> copied;
  for (; *names != nullptr; ++names) {
    copied.emplace_back(*names);
  }
  return copied;
}

}  // namespace

Slide::Slide(std::string path, native::SlideHandle handle)
    : path_(std::move(path)), handle_(std::move(handle)) {}

absl::StatusOr<Slide> Slide::Open(const std::string& path,
                                  const SlideOptions& options) {
  const native::NativeApi& api =
      options.api != nullptr ? *options.api : native::OpenSlideApi();

  RETURN_IF_ERROR(ValidatePath(path, options.check_path_exists),
                  "Invalid slide path");

  // Owned from here on; every early return below closes it.
  native::SlideHandle handle(api.open(path.c_str()), &api);
  if (!handle.Valid()) {
    return MAKE_ERROR(
        ErrorKind::kOpenError,
        fmt::format("Unsupported or unreadable slide file: {}", path));
  }

  if (std::optional<std::string> error =
          native::GetNativeError(api, handle.Get());
      error.has_value()) {
    return MAKE_ERROR(ErrorKind::kOpenError,
                      fmt::format("Failed to open {}: {}", path, *error));
  }

  if (options.cache_capacity_bytes.has_value()) {
    openslide_cache_t* cache = api.cache_create(*options.cache_capacity_bytes);
    if (cache == nullptr) {
      return MAKE_ERROR(ErrorKind::kOpenError,
                        fmt::format("Failed to create a tile cache of {} bytes "
                                    "for {}",
                                    *options.cache_capacity_bytes, path));
    }
    api.set_cache(handle.Get(), cache);
    // The slide holds its own reference to the cache.
    api.cache_release(cache);
    if (std::optional<std::string> error =
            native::GetNativeError(api, handle.Get());
        error.has_value()) {
      return MAKE_ERROR(
          ErrorKind::kOpenError,
          fmt::format("Failed to attach a tile cache to {}: {}", path, *error));
    }
  }

  LOG(INFO) << "Opened slide " << path;
  return Slide(path, std::move(handle));
}

absl::StatusOr<std::string> Slide::DetectVendor(const std::string& path,
                                                const native::NativeApi& api) {
  if (path.empty() || HasEmbeddedNul(path)) {
    return MAKE_ERROR(ErrorKind::kVendorUnknown,
                      "Cannot detect the vendor of an invalid path");
  }

  const char* vendor = api.detect_vendor(path.c_str());
  if (vendor == nullptr) {
    return MAKE_ERROR(ErrorKind::kVendorUnknown,
                      fmt::format("No known slide format matches {}", path));
  }
  return std::string(vendor);
}

void Slide::Close() {
  handle_.Close();
}

absl::Status Slide::CheckOpen(std::string_view operation) const {
  if (!handle_.Valid()) {
    return MAKE_ERROR(
        ErrorKind::kUseAfterClose,
        fmt::format("Cannot {}: slide {} is closed", operation, path_));
  }
  return absl::OkStatus();
}

absl::StatusOr<int32_t> Slide::GetLevelCount() const {
  RETURN_IF_ERROR(CheckOpen("get level count"));

  const int32_t count = api().get_level_count(handle_.Get());
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_get_level_count"));
  if (count < 0) {
    return native::SentinelError("openslide_get_level_count");
  }
  return count;
}

absl::Status Slide::ValidateLevel(int32_t level) const {
  DECLARE_ASSIGN_OR_RETURN(int32_t, count, GetLevelCount());
  if (level < 0 || level >= count) {
    return MAKE_ERROR(ErrorKind::kInvalidLevel,
                      fmt::format("Level {} is out of range [0, {})", level,
                                  count));
  }
  return absl::OkStatus();
}

absl::StatusOr<Dimensions> Slide::GetDimensions() const {
  RETURN_IF_ERROR(CheckOpen("get dimensions"));

  int64_t width = -1;
  int64_t height = -1;
  api().get_level0_dimensions(handle_.Get(), &width, &height);
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_get_level0_dimensions"));
  if (width < 0 || height < 0) {
    return native::SentinelError("openslide_get_level0_dimensions");
  }
  return Dimensions{static_cast<uint64_t>(width),
                    static_cast<uint64_t>(height)};
}

absl::StatusOr<Dimensions> Slide::GetLevelDimensions(int32_t level) const {
  RETURN_IF_ERROR(CheckOpen("get level dimensions"));
  RETURN_IF_ERROR(ValidateLevel(level));

  int64_t width = -1;
  int64_t height = -1;
  api().get_level_dimensions(handle_.Get(), level, &width, &height);
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_get_level_dimensions"));
  if (width < 0 || height < 0) {
    return native::SentinelError("openslide_get_level_dimensions");
  }
  return Dimensions{static_cast<uint64_t>(width),
                    static_cast<uint64_t>(height)};
}

absl::StatusOr<double> Slide::GetLevelDownsample(int32_t level) const {
  RETURN_IF_ERROR(CheckOpen("get level downsample"));
  RETURN_IF_ERROR(ValidateLevel(level));

  const double downsample =
      api().get_level_downsample(handle_.Get(), level);
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_get_level_downsample"));
  if (!(downsample > 0.0)) {
    return native::SentinelError("openslide_get_level_downsample");
  }
  return downsample;
}

absl::StatusOr<LevelInfo> Slide::QueryLevelInfo(int32_t level) const {
  LevelInfo info;
  ASSIGN_OR_RETURN(info.dimensions, GetLevelDimensions(level));
  ASSIGN_OR_RETURN(info.downsample, GetLevelDownsample(level));
  return info;
}

absl::StatusOr<std::vector<LevelInfo>> Slide::GetLevels() const {
  DECLARE_ASSIGN_OR_RETURN(int32_t, count, GetLevelCount());

  std::vector<LevelInfo> levels;
  levels.reserve(static_cast<size_t>(count));
  for (int32_t level = 0; level < count; ++level) {
    DECLARE_ASSIGN_OR_RETURN(LevelInfo, info, QueryLevelInfo(level));
    levels.push_back(info);
  }
  return levels;
}

absl::StatusOr<int32_t> Slide::GetBestLevelForDownsample(
    double downsample) const {
  RETURN_IF_ERROR(CheckOpen("get best level for downsample"));
  if (!std::isfinite(downsample) || downsample < 0.0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        fmt::format("Downsample factor must be finite and non-negative, got {}",
                    downsample));
  }

  const int32_t level =
      api().get_best_level_for_downsample(handle_.Get(), downsample);
  RETURN_IF_ERROR(native::CheckNativeError(
      api(), handle_.Get(), "openslide_get_best_level_for_downsample"));
  if (level < 0) {
    return native::SentinelError("openslide_get_best_level_for_downsample");
  }
  return level;
}

absl::StatusOr<PixelBuffer> Slide::ReadRegion(int64_t x, int64_t y,
                                              int32_t level, int64_t width,
                                              int64_t height) const {
  return ReadRegion(RegionRequest{
      .x = x, .y = y, .level = level, .width = width, .height = height});
}

absl::StatusOr<PixelBuffer> Slide::ReadRegion(
    const RegionRequest& request) const {
  RETURN_IF_ERROR(CheckOpen("read region"));
  RETURN_IF_ERROR(ValidateLevel(request.level));
  RETURN_IF_ERROR(CheckRegionExtent(request));

  DECLARE_ASSIGN_OR_RETURN(LevelInfo, level_info,
                           QueryLevelInfo(request.level));
  RETURN_IF_ERROR(CheckRegionBounds(request, level_info));

  DECLARE_ASSIGN_OR_RETURN(PixelBuffer, buffer,
                           PixelBuffer::Allocate(request.width, request.height),
                           "Failed to allocate region buffer");

  api().read_region(handle_.Get(), buffer.GetWords(), request.x, request.y,
                    request.level, request.width, request.height);
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_read_region"));
  return buffer;
}

absl::StatusOr<std::vector<std::string>> Slide::GetPropertyNames() const {
  RETURN_IF_ERROR(CheckOpen("get property names"));

  const char* const* names = api().get_property_names(handle_.Get());
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_get_property_names"));
  if (names == nullptr) {
    return native::SentinelError("openslide_get_property_names");
  }
  return CopyNameArray(names);
}

absl::StatusOr<Properties> Slide::GetProperties() const {
  RETURN_IF_ERROR(CheckOpen("get properties"));

  const char* const* names = api().get_property_names(handle_.Get());
  if (names == nullptr) {
    RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                             "openslide_get_property_names"));
    return native::SentinelError("openslide_get_property_names");
  }

  Properties::Container data;
  for (; *names != nullptr; ++names) {
    const char* value = api().get_property_value(handle_.Get(), *names);
    if (value == nullptr) {
      RETURN_IF_ERROR(native::CheckNativeError(
          api(), handle_.Get(), "openslide_get_property_value"));
      return MAKE_ERROR(ErrorKind::kNativeError,
                        fmt::format("Property {} is listed but has no value",
                                    *names));
    }
    data.emplace(*names, value);
  }
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_get_property_value"));
  return Properties(std::move(data));
}

absl::StatusOr<std::string> Slide::GetPropertyValue(
    std::string_view name) const {
  RETURN_IF_ERROR(CheckOpen("get property value"));
  if (HasEmbeddedNul(name)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "Property names cannot contain NUL bytes");
  }

  const std::string key(name);
  const char* value = api().get_property_value(handle_.Get(), key.c_str());
  RETURN_IF_ERROR(native::CheckNativeError(api(), handle_.Get(),
                                           "openslide_get_property_value"));
  if (value == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       fmt::format("No property named {}", key));
  }
  return std::string(value);
}

absl::StatusOr<std::vector<std::string>> Slide::GetAssociatedImageNames()
    const {
  RETURN_IF_ERROR(CheckOpen("get associated image names"));

  const char* const* names = api().get_associated_image_names(handle_.Get());
  RETURN_IF_ERROR(native::CheckNativeError(
      api(), handle_.Get(), "openslide_get_associated_image_names"));
  if (names == nullptr) {
    return native::SentinelError("openslide_get_associated_image_names");
  }
  return CopyNameArray(names);
}

absl::StatusOr<Dimensions> Slide::GetAssociatedImageDimensions(
    std::string_view name) const {
  RETURN_IF_ERROR(CheckOpen("get associated image dimensions"));
  if (HasEmbeddedNul(name)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "Associated image names cannot contain NUL bytes");
  }

  const std::string key(name);
  int64_t width = -1;
  int64_t height = -1;
  api().get_associated_image_dimensions(handle_.Get(), key.c_str(), &width,
                                        &height);
  RETURN_IF_ERROR(native::CheckNativeError(
      api(), handle_.Get(), "openslide_get_associated_image_dimensions"));
  if (width < 0 || height < 0) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       fmt::format("No associated image named {}", key));
  }
  return Dimensions{static_cast<uint64_t>(width),
                    static_cast<uint64_t>(height)};
}

absl::StatusOr<AssociatedImage> Slide::ReadAssociatedImage(
    std::string_view name) const {
  AssociatedImage image;
  image.name = std::string(name);
  ASSIGN_OR_RETURN(image.dimensions, GetAssociatedImageDimensions(name));
  ASSIGN_OR_RETURN(
      image.pixels,
      PixelBuffer::Allocate(static_cast<int64_t>(image.dimensions.width),
                            static_cast<int64_t>(image.dimensions.height)),
      fmt::format("Failed to allocate associated image {}", image.name));

  api().read_associated_image(handle_.Get(), image.name.c_str(),
                              image.pixels.GetWords());
  RETURN_IF_ERROR(native::CheckNativeError(
      api(), handle_.Get(), "openslide_read_associated_image"));
  return image;
}

absl::StatusOr<AssociatedImages> Slide::GetAssociatedImages() const {
  DECLARE_ASSIGN_OR_RETURN(std::vector<std::string>, names,
                           GetAssociatedImageNames());

  AssociatedImages images;
  for (const std::string& name : names) {
    DECLARE_ASSIGN_OR_RETURN(AssociatedImage, image, ReadAssociatedImage(name),
                             fmt::format("Associated image {}", name));
    images.emplace(name, std::move(image));
  }
  return images;
}

std::string GetLibraryVersion() {
  return native::GetLibraryVersion();
}

}  // namespace slidebridge
