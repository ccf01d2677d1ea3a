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

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidebridge/errors.h"
#include "slidebridge/properties.h"
#include "slidebridge/slide.h"

namespace slidebridge {
namespace {

/// Runs against libopenslide when SLIDEBRIDGE_TEST_SLIDE points at
/// CMU-1-Small-Region.svs from the OpenSlide test data.
class SlideIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("SLIDEBRIDGE_TEST_SLIDE");
    if (path == nullptr || *path == '\0') {
      GTEST_SKIP() << "SLIDEBRIDGE_TEST_SLIDE is not set";
    }
    path_ = path;
  }

  std::string path_;
};

TEST_F(SlideIntegrationTest, LibraryVersion) {
  EXPECT_FALSE(GetLibraryVersion().empty());
}

TEST_F(SlideIntegrationTest, DetectVendor) {
  auto vendor = Slide::DetectVendor(path_);
  ASSERT_TRUE(vendor.ok()) << vendor.status();
  EXPECT_EQ(*vendor, "aperio");
}

TEST_F(SlideIntegrationTest, Geometry) {
  auto slide = Slide::Open(path_);
  ASSERT_TRUE(slide.ok()) << slide.status();

  EXPECT_EQ(slide->GetDimensions().value(), (Dimensions{2220, 2967}));
  EXPECT_EQ(slide->GetLevelCount().value(), 1);
  EXPECT_EQ(slide->GetLevelDimensions(0).value(), (Dimensions{2220, 2967}));
  EXPECT_DOUBLE_EQ(slide->GetLevelDownsample(0).value(), 1.0);
  EXPECT_EQ(slide->GetBestLevelForDownsample(2.5).value(), 0);
  EXPECT_TRUE(IsErrorKind(slide->GetLevelDimensions(1).status(),
                          ErrorKind::kInvalidLevel));
}

TEST_F(SlideIntegrationTest, ReadRegion) {
  auto slide = Slide::Open(path_);
  ASSERT_TRUE(slide.ok()) << slide.status();

  auto region = slide->ReadRegion(0, 0, 0, 256, 256);
  ASSERT_TRUE(region.ok()) << region.status();
  EXPECT_EQ(region->GetSizeBytes(), 256 * 256 * 4);

  EXPECT_TRUE(IsErrorKind(slide->ReadRegion(2200, 0, 0, 100, 100).status(),
                          ErrorKind::kRegionOutOfBounds));
}

TEST_F(SlideIntegrationTest, Properties) {
  auto slide = Slide::Open(path_);
  ASSERT_TRUE(slide.ok()) << slide.status();

  auto properties = slide->GetProperties();
  ASSERT_TRUE(properties.ok()) << properties.status();
  const StandardProperties standard =
      StandardProperties::FromProperties(*properties);
  EXPECT_EQ(standard.vendor, "aperio");
  EXPECT_EQ(standard.level_count, 1U);
  ASSERT_EQ(standard.levels.size(), 1);
  EXPECT_EQ(standard.levels[0].width, 2220U);
  EXPECT_EQ(standard.levels[0].height, 2967U);
}

TEST_F(SlideIntegrationTest, AssociatedImages) {
  auto slide = Slide::Open(path_);
  ASSERT_TRUE(slide.ok()) << slide.status();

  auto images = slide->GetAssociatedImages();
  ASSERT_TRUE(images.ok()) << images.status();
  for (const auto& [name, image] : *images) {
    EXPECT_EQ(image.pixels.GetSizeBytes(),
              image.dimensions.width * image.dimensions.height * 4)
        << name;
  }
}

TEST_F(SlideIntegrationTest, UseAfterClose) {
  auto slide = Slide::Open(path_);
  ASSERT_TRUE(slide.ok()) << slide.status();
  slide->Close();
  EXPECT_TRUE(IsErrorKind(slide->GetDimensions().status(),
                          ErrorKind::kUseAfterClose));
}

}  // namespace
}  // namespace slidebridge
