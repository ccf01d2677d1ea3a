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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_IMAGE_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "absl/status/statusor.h"
#include "slidebridge/geometry.h"

namespace slidebridge {

/// @brief Bytes per pixel in a PixelBuffer
inline constexpr size_t kBytesPerPixel = 4;

/// @brief Image format enumeration for converted images
enum class ImageFormat {
  kRGB = 3,   ///< 3 channels: Red, Green, Blue
  kRGBA = 4,  ///< 4 channels: Red, Green, Blue, Alpha
};

/// @brief Get string representation of image format
constexpr const char* GetName(ImageFormat format) {
  switch (format) {
    case ImageFormat::kRGB:
      return "RGB";
    case ImageFormat::kRGBA:
      return "RGBA";
  }
  return "unknown";
}

/// @brief Get number of channels for an image format
constexpr uint32_t GetFormatChannels(ImageFormat format) {
  return static_cast<uint32_t>(format);
}

/// @brief 8-bit interleaved image with straight (non-premultiplied) alpha
class Image {
 public:
  Image() = default;

  /// @brief Allocate a zero-filled image
  Image(const Dimensions& dimensions, ImageFormat format);

  [[nodiscard]] const Dimensions& GetDimensions() const { return dimensions_; }
  [[nodiscard]] uint64_t GetWidth() const { return dimensions_.width; }
  [[nodiscard]] uint64_t GetHeight() const { return dimensions_.height; }
  [[nodiscard]] ImageFormat GetFormat() const { return format_; }
  [[nodiscard]] uint32_t GetChannels() const {
    return GetFormatChannels(format_);
  }

  [[nodiscard]] uint8_t* GetData() { return data_.data(); }
  [[nodiscard]] const uint8_t* GetData() const { return data_.data(); }
  [[nodiscard]] size_t GetSizeBytes() const { return data_.size(); }

  /// @brief Pointer to the first sample of pixel (x, y)
  [[nodiscard]] const uint8_t* At(uint64_t x, uint64_t y) const {
    return data_.data() + (y * dimensions_.width + x) * GetChannels();
  }

 private:
  Dimensions dimensions_;
  ImageFormat format_ = ImageFormat::kRGBA;
  std::vector<uint8_t> data_;
};

/// @brief Pixels exactly as OpenSlide writes them
///
/// One 32-bit word per pixel holding premultiplied ARGB in native byte order
/// (alpha in the most significant byte), so on little-endian hosts the byte
/// view is BGRA. The buffer is allocated by the binding right before the
/// native read and is owned solely by the caller afterwards; it never aliases
/// native memory.
///
/// Invariant: GetSizeBytes() == width * height * kBytesPerPixel.
class PixelBuffer {
 public:
  PixelBuffer() = default;

  /// @brief Allocate a zero-filled buffer for a width x height region
  /// @return Buffer, or kInvalidArgument for a non-positive extent and
  /// kResourceExhausted when the byte size does not fit in size_t
  [[nodiscard]] static absl::StatusOr<PixelBuffer> Allocate(int64_t width,
                                                            int64_t height);

  PixelBuffer(const PixelBuffer&) = default;
  PixelBuffer& operator=(const PixelBuffer&) = default;
  PixelBuffer(PixelBuffer&&) noexcept = default;
  PixelBuffer& operator=(PixelBuffer&&) noexcept = default;

  [[nodiscard]] const Dimensions& GetDimensions() const { return dimensions_; }
  [[nodiscard]] uint64_t GetWidth() const { return dimensions_.width; }
  [[nodiscard]] uint64_t GetHeight() const { return dimensions_.height; }

  /// @brief Destination pointer handed to openslide_read_region
  [[nodiscard]] uint32_t* GetWords() { return words_.data(); }
  [[nodiscard]] const uint32_t* GetWords() const { return words_.data(); }
  [[nodiscard]] size_t GetPixelCount() const { return words_.size(); }

  /// @brief Byte view of the buffer (native byte order)
  [[nodiscard]] std::span<const uint8_t> GetBytes() const;
  [[nodiscard]] size_t GetSizeBytes() const {
    return words_.size() * kBytesPerPixel;
  }

  /// @brief Premultiplied ARGB word of pixel (x, y)
  [[nodiscard]] uint32_t GetPixel(uint64_t x, uint64_t y) const {
    return words_[y * dimensions_.width + x];
  }

  /// @brief Convert to straight-alpha RGBA
  ///
  /// Color channels of partially transparent pixels are divided by alpha
  /// and rounded; fully transparent and fully opaque pixels are copied.
  [[nodiscard]] Image ToRgba() const;

  /// @brief Convert to RGB, un-premultiplying like ToRgba() and dropping alpha
  [[nodiscard]] Image ToRgb() const;

 private:
  PixelBuffer(const Dimensions& dimensions, size_t pixel_count);

  Dimensions dimensions_;
  std::vector<uint32_t> words_;
};

}  // namespace slidebridge

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_IMAGE_H_
