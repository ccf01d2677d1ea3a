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

#include "slidebridge/properties.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace slidebridge {

namespace {

/// Level indices above this are treated as malformed keys.
constexpr uint64_t kMaxLevelIndex = 1024;

/// @brief A parsed `openslide.level[N].<field>` key
struct LevelKey {
  uint64_t index = 0;
  std::string_view field;
};

std::optional<LevelKey> ParseLevelKey(std::string_view key) {
  if (!absl::ConsumePrefix(&key, PropertyKeys::kLevelPrefix)) {
    return std::nullopt;
  }
  const size_t close = key.find("].");
  if (close == std::string_view::npos) {
    return std::nullopt;
  }

  LevelKey level_key;
  if (!absl::SimpleAtoi(key.substr(0, close), &level_key.index)) {
    return std::nullopt;
  }
  level_key.field = key.substr(close + 2);
  return level_key;
}

template <typename T>
std::optional<T> ParseNumber(std::string_view key, std::string_view value) {
  T parsed{};
  bool ok = false;
  if constexpr (std::is_floating_point_v<T>) {
    ok = absl::SimpleAtod(value, &parsed);
  } else {
    ok = absl::SimpleAtoi(value, &parsed);
  }
  if (!ok) {
    LOG(WARNING) << "Ignoring property " << key << ": cannot parse \""
                 << value << "\"";
    return std::nullopt;
  }
  return parsed;
}

template <typename T>
std::optional<T> ParseProperty(const Properties& properties,
                               std::string_view key) {
  const auto it = properties.find(key);
  if (it == properties.end()) {
    return std::nullopt;
  }
  return ParseNumber<T>(key, it->second);
}

void ApplyLevelField(const LevelKey& level_key, std::string_view key,
                     std::string_view value, LevelProperties& level) {
  if (level_key.field == "width") {
    level.width = ParseNumber<uint64_t>(key, value);
  } else if (level_key.field == "height") {
    level.height = ParseNumber<uint64_t>(key, value);
  } else if (level_key.field == "downsample") {
    level.downsample = ParseNumber<double>(key, value);
  } else if (level_key.field == "tile-width") {
    level.tile_width = ParseNumber<uint64_t>(key, value);
  } else if (level_key.field == "tile-height") {
    level.tile_height = ParseNumber<uint64_t>(key, value);
  }
}

}  // namespace

std::optional<std::string> Properties::Get(std::string_view key) const {
  const auto it = data_.find(key);
  if (it == data_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<double> Properties::GetDouble(std::string_view key) const {
  const auto it = data_.find(key);
  double value = 0.0;
  if (it == data_.end() || !absl::SimpleAtod(it->second, &value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<int64_t> Properties::GetInt64(std::string_view key) const {
  const auto it = data_.find(key);
  int64_t value = 0;
  if (it == data_.end() || !absl::SimpleAtoi(it->second, &value)) {
    return std::nullopt;
  }
  return value;
}

std::vector<std::string> Properties::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(data_.size());
  for (const auto& [key, value] : data_) {
    keys.push_back(key);
  }
  return keys;
}

std::string Properties::ToString(size_t indent) const {
  const std::string pad(indent, ' ');
  std::string out;
  for (const auto& [key, value] : data_) {
    absl::StrAppend(&out, pad, key, ": \"", value, "\"\n");
  }
  return out;
}

StandardProperties StandardProperties::FromProperties(
    const Properties& properties) {
  StandardProperties standard;
  standard.vendor = properties.Get(PropertyKeys::kVendor);
  standard.comment = properties.Get(PropertyKeys::kComment);
  standard.quickhash_1 = properties.Get(PropertyKeys::kQuickHash1);
  standard.background_color = properties.Get(PropertyKeys::kBackgroundColor);
  standard.objective_power =
      ParseProperty<double>(properties, PropertyKeys::kObjectivePower);
  standard.mpp_x = ParseProperty<double>(properties, PropertyKeys::kMppX);
  standard.mpp_y = ParseProperty<double>(properties, PropertyKeys::kMppY);
  standard.bounds_x = ParseProperty<int64_t>(properties, PropertyKeys::kBoundsX);
  standard.bounds_y = ParseProperty<int64_t>(properties, PropertyKeys::kBoundsY);
  standard.bounds_width =
      ParseProperty<int64_t>(properties, PropertyKeys::kBoundsWidth);
  standard.bounds_height =
      ParseProperty<int64_t>(properties, PropertyKeys::kBoundsHeight);
  standard.level_count =
      ParseProperty<uint32_t>(properties, PropertyKeys::kLevelCount);

  for (const auto& [key, value] : properties) {
    const std::optional<LevelKey> level_key = ParseLevelKey(key);
    if (!level_key.has_value()) {
      continue;
    }
    if (level_key->index >= kMaxLevelIndex) {
      LOG(WARNING) << "Ignoring property " << key << ": level index "
                   << level_key->index << " is out of range";
      continue;
    }
    if (level_key->index >= standard.levels.size()) {
      standard.levels.resize(level_key->index + 1);
    }
    ApplyLevelField(*level_key, key, value, standard.levels[level_key->index]);
  }

  if (!standard.levels.empty()) {
    const auto derived = static_cast<uint32_t>(standard.levels.size());
    if (standard.level_count.has_value() && *standard.level_count != derived) {
      LOG(WARNING) << PropertyKeys::kLevelCount << " is "
                   << *standard.level_count << " but level keys describe "
                   << derived << " levels, using " << derived;
    }
    standard.level_count = derived;
  }

  return standard;
}

}  // namespace slidebridge
