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

#include "slidebridge/image.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidebridge/status/status_macros.h"
#include "slidebridge/utilities/fmt.h"

namespace slidebridge {

namespace {

/// @brief Straight-alpha RGBA components of one premultiplied ARGB word
std::array<uint8_t, 4> Unpremultiply(uint32_t argb) {
  const auto alpha = static_cast<uint8_t>((argb >> 24) & 0xFF);
  std::array<uint8_t, 4> rgba = {
      static_cast<uint8_t>((argb >> 16) & 0xFF),
      static_cast<uint8_t>((argb >> 8) & 0xFF),
      static_cast<uint8_t>(argb & 0xFF),
      alpha,
  };

  if (alpha != 0 && alpha != 255) {
    const float scale = 255.0F / static_cast<float>(alpha);
    for (size_t c = 0; c < 3; ++c) {
      const float value = std::round(static_cast<float>(rgba[c]) * scale);
      rgba[c] = static_cast<uint8_t>(std::clamp(value, 0.0F, 255.0F));
    }
  }
  return rgba;
}

Image Convert(const PixelBuffer& buffer, ImageFormat format) {
  Image image(buffer.GetDimensions(), format);
  const uint32_t channels = GetFormatChannels(format);
  const uint32_t* src = buffer.GetWords();
  uint8_t* dst = image.GetData();

  for (size_t i = 0; i < buffer.GetPixelCount(); ++i) {
    const auto rgba = Unpremultiply(src[i]);
    std::copy_n(rgba.begin(), channels, dst + i * channels);
  }
  return image;
}

}  // namespace

Image::Image(const Dimensions& dimensions, ImageFormat format)
    : dimensions_(dimensions),
      format_(format),
      data_(dimensions.width * dimensions.height * GetFormatChannels(format),
            0) {}

PixelBuffer::PixelBuffer(const Dimensions& dimensions, size_t pixel_count)
    : dimensions_(dimensions), words_(pixel_count, 0) {}

absl::StatusOr<PixelBuffer> PixelBuffer::Allocate(int64_t width,
                                                  int64_t height) {
  if (width <= 0 || height <= 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        fmt::format("Buffer extent must be positive, got {} x {}", width,
                    height));
  }

  const auto w = static_cast<uint64_t>(width);
  const auto h = static_cast<uint64_t>(height);
  constexpr uint64_t kMaxPixels =
      std::numeric_limits<size_t>::max() / kBytesPerPixel;
  if (w > kMaxPixels / h) {
    return MAKE_STATUS(
        absl::StatusCode::kResourceExhausted,
        fmt::format("Buffer of {} x {} pixels is too large to allocate", width,
                    height));
  }

  return PixelBuffer(Dimensions{w, h}, static_cast<size_t>(w * h));
}

std::span<const uint8_t> PixelBuffer::GetBytes() const {
  return {reinterpret_cast<const uint8_t*>(words_.data()), GetSizeBytes()};
}

Image PixelBuffer::ToRgba() const {
  return Convert(*this, ImageFormat::kRGBA);
}

Image PixelBuffer::ToRgb() const {
  return Convert(*this, ImageFormat::kRGB);
}

}  // namespace slidebridge
