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

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "benchmark/benchmark.h"
#include "slidebridge/slide.h"

namespace {

constexpr const char* kSlideEnvironmentVariable = "SLIDEBRIDGE_BENCHMARK_SLIDE";

// Fixed seed for reproducible random access benchmarks
constexpr uint32_t kRandomSeed = 42;

/// @brief Benchmark fixture for tiled region reads through slidebridge::Slide
class SlideRegionFixture : public benchmark::Fixture {
 public:
  void SetUp(const ::benchmark::State& state) override {
    if (!slide_.has_value()) {
      const char* path = std::getenv(kSlideEnvironmentVariable);
      if (path == nullptr) {
        return;
      }

      // Disable cache for pure read performance measurement
      slidebridge::SlideOptions options;
      options.cache_capacity_bytes = 0;
      auto slide_or = slidebridge::Slide::Open(path, options);
      if (!slide_or.ok()) {
        return;
      }
      slide_.emplace(std::move(slide_or).value());
    }

    tile_size_ = state.range(0);
    level_ = static_cast<int32_t>(state.range(1));

    auto info_or = slide_->GetLevels();
    if (!info_or.ok() || level_ >= static_cast<int32_t>(info_or->size())) {
      level_valid_ = false;
      return;
    }
    level_valid_ = true;

    const auto& info = (*info_or)[level_];
    level_width_ = static_cast<int64_t>(info.dimensions.width);
    level_height_ = static_cast<int64_t>(info.dimensions.height);
    downsample_ = info.downsample;

    // Calculate tile grid
    tiles_x_ = (level_width_ + tile_size_ - 1) / tile_size_;
    tiles_y_ = (level_height_ + tile_size_ - 1) / tile_size_;
    total_tiles_ = tiles_x_ * tiles_y_;
  }

  void TearDown(const ::benchmark::State& state) override {}

 protected:
  /// @brief Read one tile of the grid; false on error
  bool ReadTile(int64_t tile_idx, int64_t* bytes) {
    const int64_t tile_y = tile_idx / tiles_x_;
    const int64_t tile_x = tile_idx % tiles_x_;

    const int64_t x = tile_x * tile_size_;
    const int64_t y = tile_y * tile_size_;
    const int64_t tile_w = std::min(tile_size_, level_width_ - x);
    const int64_t tile_h = std::min(tile_size_, level_height_ - y);

    // Region origins are given in level 0 coordinates
    const auto x0 = static_cast<int64_t>(static_cast<double>(x) * downsample_);
    const auto y0 = static_cast<int64_t>(static_cast<double>(y) * downsample_);

    auto buffer_or = slide_->ReadRegion(x0, y0, level_, tile_w, tile_h);
    if (!buffer_or.ok()) {
      return false;
    }
    benchmark::DoNotOptimize(buffer_or->GetWords());
    *bytes += static_cast<int64_t>(buffer_or->GetSizeBytes());
    return true;
  }

  /// @brief Skip with a reason when no slide or level is available
  bool Ready(benchmark::State& state) {
    if (!slide_.has_value()) {
      state.SkipWithError("Set SLIDEBRIDGE_BENCHMARK_SLIDE to a readable slide");
      return false;
    }
    if (!level_valid_) {
      state.SkipWithError("Level not present in slide");
      return false;
    }
    return true;
  }

  std::optional<slidebridge::Slide> slide_;
  bool level_valid_{false};
  int64_t tile_size_{256};
  int32_t level_{0};
  double downsample_{1.0};
  int64_t level_width_{0};
  int64_t level_height_{0};
  int64_t tiles_x_{0};
  int64_t tiles_y_{0};
  int64_t total_tiles_{0};
};

/// @brief Row-major tile reading benchmark
BENCHMARK_DEFINE_F(SlideRegionFixture, RowMajor)

(benchmark::State& state) {
  if (!Ready(state)) {
    return;
  }

  int64_t tile_idx = 0;
  int64_t total_bytes = 0;

  for (auto _ : state) {
    if (!ReadTile(tile_idx, &total_bytes)) {
      state.SkipWithError("Failed to read region");
      break;
    }
    tile_idx = (tile_idx + 1) % total_tiles_;
  }

  state.SetItemsProcessed(state.iterations());
  state.SetBytesProcessed(total_bytes);
}

/// @brief Random access tile reading benchmark
BENCHMARK_DEFINE_F(SlideRegionFixture, RandomAccess)

(benchmark::State& state) {
  if (!Ready(state)) {
    return;
  }

  // Generate random tile indices (at least 10% of total tiles)
  const int64_t tiles_to_read =
      std::max(static_cast<int64_t>(1), total_tiles_ / 10);

  std::mt19937 rng(kRandomSeed);
  std::uniform_int_distribution<int64_t> dist(0, total_tiles_ - 1);

  std::vector<int64_t> tile_indices;
  tile_indices.reserve(tiles_to_read);
  for (int64_t i = 0; i < tiles_to_read; ++i) {
    tile_indices.push_back(dist(rng));
  }

  int64_t access_idx = 0;
  int64_t total_bytes = 0;

  for (auto _ : state) {
    if (!ReadTile(tile_indices[access_idx], &total_bytes)) {
      state.SkipWithError("Failed to read region");
      break;
    }
    access_idx = (access_idx + 1) % tiles_to_read;
  }

  state.SetItemsProcessed(state.iterations());
  state.SetBytesProcessed(total_bytes);
}

/// @brief Property snapshot benchmark
BENCHMARK_DEFINE_F(SlideRegionFixture, Properties)

(benchmark::State& state) {
  if (!Ready(state)) {
    return;
  }

  for (auto _ : state) {
    auto properties_or = slide_->GetProperties();
    if (!properties_or.ok()) {
      state.SkipWithError("Failed to read properties");
      break;
    }
    benchmark::DoNotOptimize(properties_or->size());
  }

  state.SetItemsProcessed(state.iterations());
}

// Format: ->Args({tile_size, level})
BENCHMARK_REGISTER_F(SlideRegionFixture, RowMajor)
    ->Args({128, 0})
    ->Args({256, 0})
    ->Args({512, 0})
    ->Args({256, 1})
    ->Args({256, 2})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(SlideRegionFixture, RandomAccess)
    ->Args({128, 0})
    ->Args({256, 0})
    ->Args({512, 0})
    ->Args({256, 1})
    ->Args({256, 2})
    ->Unit(benchmark::kMicrosecond);

BENCHMARK_REGISTER_F(SlideRegionFixture, Properties)
    ->Args({256, 0})
    ->Unit(benchmark::kMicrosecond);

}  // namespace

BENCHMARK_MAIN();
