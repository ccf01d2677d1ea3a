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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_PROPERTIES_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_PROPERTIES_H_

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slidebridge {

/// @brief Vendor-agnostic property names defined by OpenSlide
///
/// Vendor-specific keys (`aperio.*`, `hamamatsu.*`, ...) are left in the
/// Properties map untouched; only these names get a typed view.
namespace PropertyKeys {

inline constexpr std::string_view kComment = "openslide.comment";
inline constexpr std::string_view kVendor = "openslide.vendor";
inline constexpr std::string_view kQuickHash1 = "openslide.quickhash-1";
inline constexpr std::string_view kBackgroundColor =
    "openslide.background-color";
inline constexpr std::string_view kObjectivePower =
    "openslide.objective-power";
inline constexpr std::string_view kMppX = "openslide.mpp-x";
inline constexpr std::string_view kMppY = "openslide.mpp-y";
inline constexpr std::string_view kBoundsX = "openslide.bounds-x";
inline constexpr std::string_view kBoundsY = "openslide.bounds-y";
inline constexpr std::string_view kBoundsWidth = "openslide.bounds-width";
inline constexpr std::string_view kBoundsHeight = "openslide.bounds-height";
inline constexpr std::string_view kLevelCount = "openslide.level-count";

/// @brief Prefix of the per-level keys `openslide.level[N].<field>`
inline constexpr std::string_view kLevelPrefix = "openslide.level[";

}  // namespace PropertyKeys

/// @brief Immutable snapshot of a slide's property dictionary
///
/// Built once per query from OpenSlide's property enumeration. Keys are kept
/// exactly as OpenSlide reported them and iterate in sorted order.
class Properties {
 public:
  using Container = std::map<std::string, std::string, std::less<>>;
  using const_iterator = Container::const_iterator;
  using value_type = Container::value_type;

  Properties() = default;

  explicit Properties(Container data) : data_(std::move(data)) {}

  Properties(std::initializer_list<value_type> init) : data_(init) {}

  /// @brief Value for a key, or std::nullopt
  [[nodiscard]] std::optional<std::string> Get(std::string_view key) const;

  /// @brief Value parsed as a double, or std::nullopt if absent/unparseable
  [[nodiscard]] std::optional<double> GetDouble(std::string_view key) const;

  /// @brief Value parsed as an int64, or std::nullopt if absent/unparseable
  [[nodiscard]] std::optional<int64_t> GetInt64(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const {
    return data_.find(key) != data_.end();
  }

  [[nodiscard]] const_iterator find(std::string_view key) const {
    return data_.find(key);
  }

  [[nodiscard]] size_t size() const noexcept { return data_.size(); }
  [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

  [[nodiscard]] const_iterator begin() const { return data_.begin(); }
  [[nodiscard]] const_iterator end() const { return data_.end(); }

  /// @brief All keys in iteration order
  [[nodiscard]] std::vector<std::string> Keys() const;

  [[nodiscard]] const Container& GetContainer() const { return data_; }

  /// @brief One `key: "value"` line per property
  [[nodiscard]] std::string ToString(size_t indent = 0) const;

 private:
  Container data_;
};

inline std::ostream& operator<<(std::ostream& os,
                                const Properties& properties) {
  return os << properties.ToString();
}

/// @brief Per-level entries of the standard properties
struct LevelProperties {
  std::optional<uint64_t> width;
  std::optional<uint64_t> height;
  std::optional<double> downsample;
  std::optional<uint64_t> tile_width;
  std::optional<uint64_t> tile_height;
};

/// @brief Typed view over the OpenSlide standard properties
///
/// Every field is optional: formats populate different subsets. Values that
/// are present but unparseable are logged and left unset.
struct StandardProperties {
  std::optional<std::string> vendor;
  std::optional<std::string> comment;
  std::optional<std::string> quickhash_1;
  std::optional<std::string> background_color;  ///< Hex RGB, e.g. "FFFFFF"
  std::optional<double> objective_power;
  std::optional<double> mpp_x;  ///< Microns per pixel, X direction
  std::optional<double> mpp_y;  ///< Microns per pixel, Y direction
  std::optional<int64_t> bounds_x;
  std::optional<int64_t> bounds_y;
  std::optional<int64_t> bounds_width;
  std::optional<int64_t> bounds_height;

  /// @brief Number of levels
  ///
  /// When the `openslide.level[N]` keys disagree with
  /// `openslide.level-count`, the count implied by the highest N wins.
  std::optional<uint32_t> level_count;

  /// @brief Level entries, indexed by level; empty when no level keys exist
  std::vector<LevelProperties> levels;

  /// @brief Build the typed view from a property snapshot
  [[nodiscard]] static StandardProperties FromProperties(
      const Properties& properties);
};

}  // namespace slidebridge

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_PROPERTIES_H_
