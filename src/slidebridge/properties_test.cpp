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

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace slidebridge {
namespace {

class StandardPropertiesTest : public ::testing::Test {
 protected:
  Properties aperio_ = {
      {"aperio.AppMag", "20"},
      {"openslide.vendor", "aperio"},
      {"openslide.comment", "Aperio Image Library v10.0.50"},
      {"openslide.quickhash-1", "abc123"},
      {"openslide.mpp-x", "0.499"},
      {"openslide.mpp-y", "0.499"},
      {"openslide.objective-power", "20"},
      {"openslide.level-count", "2"},
      {"openslide.level[0].width", "2220"},
      {"openslide.level[0].height", "2967"},
      {"openslide.level[0].downsample", "1"},
      {"openslide.level[0].tile-width", "240"},
      {"openslide.level[0].tile-height", "240"},
      {"openslide.level[1].width", "555"},
      {"openslide.level[1].height", "741"},
      {"openslide.level[1].downsample", "4.0009"},
  };
};

TEST_F(StandardPropertiesTest, ParsesVendorAgnosticKeys) {
  const StandardProperties standard =
      StandardProperties::FromProperties(aperio_);

  EXPECT_EQ(standard.vendor, "aperio");
  EXPECT_EQ(standard.comment, "Aperio Image Library v10.0.50");
  EXPECT_EQ(standard.quickhash_1, "abc123");
  ASSERT_TRUE(standard.mpp_x.has_value());
  EXPECT_DOUBLE_EQ(*standard.mpp_x, 0.499);
  EXPECT_DOUBLE_EQ(*standard.mpp_y, 0.499);
  EXPECT_DOUBLE_EQ(*standard.objective_power, 20.0);
  EXPECT_FALSE(standard.background_color.has_value());
  EXPECT_FALSE(standard.bounds_x.has_value());
}

TEST_F(StandardPropertiesTest, ParsesLevelKeys) {
  const StandardProperties standard =
      StandardProperties::FromProperties(aperio_);

  EXPECT_EQ(standard.level_count, 2U);
  ASSERT_EQ(standard.levels.size(), 2);
  EXPECT_EQ(standard.levels[0].width, 2220U);
  EXPECT_EQ(standard.levels[0].height, 2967U);
  EXPECT_EQ(standard.levels[0].tile_width, 240U);
  EXPECT_EQ(standard.levels[0].tile_height, 240U);
  EXPECT_DOUBLE_EQ(*standard.levels[1].downsample, 4.0009);
  EXPECT_FALSE(standard.levels[1].tile_width.has_value());
}

TEST_F(StandardPropertiesTest, LevelKeysOverrideStatedLevelCount) {
  const Properties properties = {
      {"openslide.level-count", "5"},
      {"openslide.level[0].width", "100"},
      {"openslide.level[2].width", "25"},
  };
  const StandardProperties standard =
      StandardProperties::FromProperties(properties);

  EXPECT_EQ(standard.level_count, 3U);
  EXPECT_EQ(standard.levels.size(), 3);
  EXPECT_FALSE(standard.levels[1].width.has_value());
}

TEST_F(StandardPropertiesTest, StatedLevelCountWithoutLevelKeys) {
  const StandardProperties standard = StandardProperties::FromProperties(
      Properties{{"openslide.level-count", "4"}});
  EXPECT_EQ(standard.level_count, 4U);
  EXPECT_TRUE(standard.levels.empty());
}

TEST_F(StandardPropertiesTest, UnparseableValuesAreLeftUnset) {
  const Properties properties = {
      {"openslide.mpp-x", "not-a-number"},
      {"openslide.bounds-x", "12.5"},
      {"openslide.bounds-y", "-8"},
      {"openslide.level[0].width", "wide"},
      {"openslide.level[x].width", "100"},
  };
  const StandardProperties standard =
      StandardProperties::FromProperties(properties);

  EXPECT_FALSE(standard.mpp_x.has_value());
  EXPECT_FALSE(standard.bounds_x.has_value());
  EXPECT_EQ(standard.bounds_y, -8);
  ASSERT_EQ(standard.levels.size(), 1);
  EXPECT_FALSE(standard.levels[0].width.has_value());
}

TEST_F(StandardPropertiesTest, EmptyProperties) {
  const StandardProperties standard =
      StandardProperties::FromProperties(Properties());
  EXPECT_FALSE(standard.vendor.has_value());
  EXPECT_FALSE(standard.level_count.has_value());
  EXPECT_TRUE(standard.levels.empty());
}

TEST(PropertiesTest, TypedLookups) {
  const Properties properties = {
      {"a.double", "1.5"},
      {"a.int", "-42"},
      {"a.text", "hello"},
  };

  EXPECT_EQ(properties.Get("a.text"), "hello");
  EXPECT_EQ(properties.Get("missing"), std::nullopt);
  EXPECT_DOUBLE_EQ(*properties.GetDouble("a.double"), 1.5);
  EXPECT_EQ(properties.GetInt64("a.int"), -42);
  EXPECT_EQ(properties.GetInt64("a.text"), std::nullopt);
  EXPECT_TRUE(properties.contains("a.int"));
  EXPECT_FALSE(properties.contains("a"));
}

TEST(PropertiesTest, KeysAreSorted) {
  const Properties properties = {{"b", "2"}, {"a", "1"}, {"c", "3"}};
  EXPECT_EQ(properties.Keys(), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(properties.size(), 3);
}

TEST(PropertiesTest, ToStringListsEveryEntry) {
  const Properties properties = {{"openslide.vendor", "aperio"}};
  EXPECT_EQ(properties.ToString(), "openslide.vendor: \"aperio\"\n");
  EXPECT_EQ(properties.ToString(2), "  openslide.vendor: \"aperio\"\n");
}

}  // namespace
}  // namespace slidebridge
