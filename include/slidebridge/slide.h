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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDE_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDE_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidebridge/associated_image.h"
#include "slidebridge/geometry.h"
#include "slidebridge/image.h"
#include "slidebridge/native/native_api.h"
#include "slidebridge/native/slide_handle.h"
#include "slidebridge/properties.h"
#include "slidebridge/slide_options.h"

namespace slidebridge {

/**
 * @brief An open whole-slide image
 *
 * Owns exactly one OpenSlide handle. Every accessor validates its arguments
 * before crossing into native code, checks the native error slot right after
 * the call, and copies native outputs into owned values.
 *
 * Once Close() has run (or the slide was moved from) every accessor fails
 * with ErrorKind::kUseAfterClose without reaching native code.
 *
 * A Slide is not thread-safe; callers serialize access to one instance.
 * Distinct slides are independent.
 *
 * Example usage:
 * @code
 * auto slide = Slide::Open("sample.svs");
 * if (!slide.ok()) {
 *   return slide.status();
 * }
 * auto region = slide->ReadRegion(0, 0, 0, 512, 512);
 * @endcode
 */
class Slide {
 public:
  /**
   * @brief Open a slide file
   *
   * @param path Filesystem path of the slide
   * @param options Open options (tile cache, native table)
   * @return Open slide, or kOpenError when the path is empty, contains a NUL
   *         byte, does not exist, names a directory, or OpenSlide cannot open
   *         it. No native handle outlives a failed open.
   */
  [[nodiscard]] static absl::StatusOr<Slide> Open(
      const std::string& path, const SlideOptions& options = SlideOptions());

  /**
   * @brief Identify the format of a file without opening it
   *
   * @return Vendor name (e.g. "aperio"), or kVendorUnknown
   */
  [[nodiscard]] static absl::StatusOr<std::string> DetectVendor(
      const std::string& path,
      const native::NativeApi& api = native::OpenSlideApi());

  Slide(const Slide&) = delete;
  Slide& operator=(const Slide&) = delete;
  Slide(Slide&&) noexcept = default;
  Slide& operator=(Slide&&) noexcept = default;
  ~Slide() = default;

  /// @brief Release the native handle; further calls are no-ops
  void Close();

  [[nodiscard]] bool IsOpen() const { return handle_.Valid(); }

  /// @brief Path the slide was opened from
  [[nodiscard]] const std::string& GetPath() const { return path_; }

  /// @brief Level 0 size in pixels
  [[nodiscard]] absl::StatusOr<Dimensions> GetDimensions() const;

  /// @brief Number of pyramid levels
  [[nodiscard]] absl::StatusOr<int32_t> GetLevelCount() const;

  /// @brief Size of a level in pixels
  /// @return Dimensions, or kInvalidLevel when level is out of range
  [[nodiscard]] absl::StatusOr<Dimensions> GetLevelDimensions(
      int32_t level) const;

  /// @brief Downsample factor of a level relative to level 0
  /// @return Factor, or kInvalidLevel when level is out of range
  [[nodiscard]] absl::StatusOr<double> GetLevelDownsample(int32_t level) const;

  /// @brief Geometry of every level, in level order
  [[nodiscard]] absl::StatusOr<std::vector<LevelInfo>> GetLevels() const;

  /**
   * @brief Level OpenSlide picks for a downsample factor
   *
   * The native answer is returned unmodified. OpenSlide selects the last
   * level whose downsample is strictly below the requested factor, so for
   * levels {1, 4, 16} a factor of exactly 16 yields level 1.
   *
   * @return Level index, or kInvalidArgument for a negative or non-finite
   *         factor
   */
  [[nodiscard]] absl::StatusOr<int32_t> GetBestLevelForDownsample(
      double downsample) const;

  /**
   * @brief Read a region into a new pixel buffer
   *
   * @param x Left edge in level 0 pixel space
   * @param y Top edge in level 0 pixel space
   * @param level Pyramid level
   * @param width Width in level pixels
   * @param height Height in level pixels
   * @return Buffer of exactly width * height * 4 bytes, kInvalidLevel, or
   *         kRegionOutOfBounds when the region is empty or leaves the level
   */
  [[nodiscard]] absl::StatusOr<PixelBuffer> ReadRegion(int64_t x, int64_t y,
                                                       int32_t level,
                                                       int64_t width,
                                                       int64_t height) const;

  [[nodiscard]] absl::StatusOr<PixelBuffer> ReadRegion(
      const RegionRequest& request) const;

  /// @brief Snapshot of all properties
  [[nodiscard]] absl::StatusOr<Properties> GetProperties() const;

  /// @brief Property names in native enumeration order
  [[nodiscard]] absl::StatusOr<std::vector<std::string>> GetPropertyNames()
      const;

  /// @brief Value of one property, or kNotFound
  [[nodiscard]] absl::StatusOr<std::string> GetPropertyValue(
      std::string_view name) const;

  /// @brief Associated image names in native enumeration order
  [[nodiscard]] absl::StatusOr<std::vector<std::string>>
  GetAssociatedImageNames() const;

  /// @brief Size of one associated image, or kNotFound
  [[nodiscard]] absl::StatusOr<Dimensions> GetAssociatedImageDimensions(
      std::string_view name) const;

  /// @brief Read one associated image, or kNotFound
  [[nodiscard]] absl::StatusOr<AssociatedImage> ReadAssociatedImage(
      std::string_view name) const;

  /// @brief Read every associated image; any failure fails the whole call
  [[nodiscard]] absl::StatusOr<AssociatedImages> GetAssociatedImages() const;

 private:
  Slide(std::string path, native::SlideHandle handle);

  /// @brief kUseAfterClose when the handle is gone
  absl::Status CheckOpen(std::string_view operation) const;

  /// @brief kInvalidLevel unless 0 <= level < level count
  absl::Status ValidateLevel(int32_t level) const;

  /// @brief Dimensions and downsample of an already validated level
  absl::StatusOr<LevelInfo> QueryLevelInfo(int32_t level) const;

  const native::NativeApi& api() const { return *handle_.api(); }

  std::string path_;
  native::SlideHandle handle_;
};

/// @brief Version of the linked OpenSlide library
std::string GetLibraryVersion();

}  // namespace slidebridge

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDE_H_
