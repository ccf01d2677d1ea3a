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

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "lodepng/lodepng.h"
#include "slidebridge/slidebridge.h"

// Common flags
ABSL_FLAG(std::string, input, "", "Path to the slide file");
ABSL_FLAG(int64_t, cache_bytes, -1,
          "OpenSlide tile cache capacity in bytes (-1 keeps the default cache, "
          "0 disables caching)");

// Info command flags
ABSL_FLAG(bool, verbose, false, "Show every property reported by OpenSlide");

// Region command flags
ABSL_FLAG(int64_t, x, 0, "X coordinate (top-left, level 0 pixel space)");
ABSL_FLAG(int64_t, y, 0, "Y coordinate (top-left, level 0 pixel space)");
ABSL_FLAG(int64_t, width, 512, "Region width in pixels");
ABSL_FLAG(int64_t, height, 512, "Region height in pixels");
ABSL_FLAG(int32_t, level, 0, "Pyramid level to read from");
ABSL_FLAG(std::string, output, "output.png", "Output PNG path");

namespace {

void PrintSeparator(char c = '=') {
  std::cout << std::string(80, c) << '\n';
}

void PrintHeader(const std::string& title) {
  std::cout << '\n';
  PrintSeparator('=');
  std::cout << " " << title << '\n';
  PrintSeparator('=');
}

void PrintSubHeader(const std::string& title) {
  std::cout << '\n';
  std::cout << "--- " << title << " ---\n";
}

void PrintKeyValue(const std::string& key, const std::string& value,
                   int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << value << '\n';
}

void PrintKeyValue(const std::string& key, double value, int width = 30) {
  std::cout << std::left << std::setw(width) << (key + ":") << std::fixed
            << std::setprecision(6) << value << '\n';
}

std::string ToString(const slidebridge::Dimensions& dims) {
  return std::to_string(dims.width) + " x " + std::to_string(dims.height);
}

template <typename T>
void PrintOptional(const std::string& key, const std::optional<T>& value) {
  if (value.has_value()) {
    PrintKeyValue(key, *value);
  }
}

slidebridge::SlideOptions MakeOptions() {
  slidebridge::SlideOptions options;
  const int64_t cache_bytes = absl::GetFlag(FLAGS_cache_bytes);
  if (cache_bytes >= 0) {
    options.cache_capacity_bytes = static_cast<size_t>(cache_bytes);
  }
  return options;
}

void PrintSlideInfo(const slidebridge::Slide& slide,
                    const slidebridge::StandardProperties& standard) {
  PrintHeader("Slide Information");

  PrintKeyValue("OpenSlide Version", slidebridge::GetLibraryVersion());
  auto vendor_or = slidebridge::Slide::DetectVendor(slide.GetPath());
  PrintKeyValue("Vendor", vendor_or.ok() ? *vendor_or : "unknown");

  auto dims_or = slide.GetDimensions();
  if (dims_or.ok()) {
    PrintKeyValue("Dimensions", ToString(*dims_or));
  }

  if (standard.mpp_x.has_value()) {
    PrintKeyValue("MPP X", *standard.mpp_x);
  }
  if (standard.mpp_y.has_value()) {
    PrintKeyValue("MPP Y", *standard.mpp_y);
  }
  if (standard.objective_power.has_value()) {
    PrintKeyValue("Objective Power", *standard.objective_power);
  }
  PrintOptional("Background Color", standard.background_color);
  PrintOptional("Quickhash", standard.quickhash_1);
}

void PrintLevelInfo(const slidebridge::Slide& slide,
                    const slidebridge::StandardProperties& standard) {
  PrintHeader("Pyramid Levels");

  auto levels_or = slide.GetLevels();
  if (!levels_or.ok()) {
    std::cerr << "Error reading levels: " << levels_or.status() << '\n';
    return;
  }

  const auto& levels = *levels_or;
  PrintKeyValue("Number of Levels", std::to_string(levels.size()));

  for (size_t level = 0; level < levels.size(); ++level) {
    const auto& info = levels[level];
    PrintSubHeader("Level " + std::to_string(level));

    PrintKeyValue("  Dimensions", ToString(info.dimensions), 25);
    PrintKeyValue("  Downsample Factor", info.downsample, 25);

    if (level < standard.levels.size()) {
      const auto& props = standard.levels[level];
      if (props.tile_width.has_value() && props.tile_height.has_value()) {
        PrintKeyValue("  Tile Size",
                      std::to_string(*props.tile_width) + " x " +
                          std::to_string(*props.tile_height),
                      25);
      }
    }

    // Approximate MPP for this level
    if (standard.mpp_x.has_value() && standard.mpp_y.has_value()) {
      std::string mpp_str = std::to_string(*standard.mpp_x * info.downsample) +
                            " x " +
                            std::to_string(*standard.mpp_y * info.downsample);
      PrintKeyValue("  Approx MPP", mpp_str, 25);
    }
  }
}

void PrintAssociatedImages(const slidebridge::Slide& slide) {
  auto names_or = slide.GetAssociatedImageNames();
  if (!names_or.ok() || names_or->empty()) {
    return;
  }

  PrintHeader("Associated Images");
  PrintKeyValue("Number of Images", std::to_string(names_or->size()));

  for (const auto& name : *names_or) {
    auto dims_or = slide.GetAssociatedImageDimensions(name);
    PrintKeyValue("  " + name,
                  dims_or.ok() ? ToString(*dims_or) : "unknown size", 25);
  }
}

void PrintProperties(const slidebridge::Properties& properties) {
  if (properties.empty()) {
    return;
  }

  PrintHeader("Properties");
  for (const auto& [key, value] : properties) {
    PrintKeyValue("  " + key, value, 45);
  }
}

// PNG image writer using lodepng
absl::Status SaveImagePNG(const slidebridge::Image& image,
                          const std::string& filename) {
  if (image.GetFormat() != slidebridge::ImageFormat::kRGBA) {
    return absl::InvalidArgumentError("Only RGBA images can be saved");
  }

  unsigned int error =
      lodepng_encode32_file(filename.c_str(), image.GetData(),
                            static_cast<unsigned int>(image.GetWidth()),
                            static_cast<unsigned int>(image.GetHeight()));

  if (error != 0) {
    return absl::InternalError(absl::StrFormat("PNG encode error %d: %s", error,
                                               lodepng_error_text(error)));
  }

  return absl::OkStatus();
}

int InfoCommand(const std::string& input_file, bool verbose) {
  std::cout << "Opening slide: " << input_file << '\n';
  auto slide_or = slidebridge::Slide::Open(input_file, MakeOptions());

  if (!slide_or.ok()) {
    std::cerr << "\nError: Failed to open slide\n";
    std::cerr << "Status: " << slide_or.status() << '\n';
    return 1;
  }

  const auto& slide = *slide_or;

  auto properties_or = slide.GetProperties();
  if (!properties_or.ok()) {
    std::cerr << "Error: Failed to read properties\n";
    std::cerr << "Status: " << properties_or.status() << '\n';
    return 1;
  }
  const auto standard =
      slidebridge::StandardProperties::FromProperties(*properties_or);

  PrintSlideInfo(slide, standard);
  PrintLevelInfo(slide, standard);
  PrintAssociatedImages(slide);

  if (verbose) {
    PrintProperties(*properties_or);
  }

  std::cout << '\n';
  PrintSeparator('=');
  std::cout << "Successfully read slide information!\n";
  PrintSeparator('=');
  std::cout << '\n';

  return 0;
}

int RegionCommand(const std::string& input_file,
                  const slidebridge::RegionRequest& request,
                  const std::string& output_file) {
  std::cout << "Opening slide: " << input_file << '\n';
  auto slide_or = slidebridge::Slide::Open(input_file, MakeOptions());

  if (!slide_or.ok()) {
    std::cerr << "Error: Failed to open slide\n";
    std::cerr << "Status: " << slide_or.status() << '\n';
    return 1;
  }

  std::cout << "Reading region:\n";
  std::cout << "  Position: (" << request.x << ", " << request.y << ")\n";
  std::cout << "  Size: " << request.width << " x " << request.height
            << " pixels\n";
  std::cout << "  Level: " << request.level << '\n';

  auto buffer_or = slide_or->ReadRegion(request);
  if (!buffer_or.ok()) {
    std::cerr << "Error: Failed to read region\n";
    std::cerr << "Status: " << buffer_or.status() << '\n';
    return 1;
  }

  const auto image = buffer_or->ToRgba();
  std::cout << "Read image: " << image.GetWidth() << " x " << image.GetHeight()
            << " pixels\n";

  std::cout << "Saving to: " << output_file << '\n';
  auto save_status = SaveImagePNG(image, output_file);
  if (!save_status.ok()) {
    std::cerr << "Error: Failed to save image\n";
    std::cerr << "Status: " << save_status << '\n';
    return 1;
  }

  std::cout << "Successfully saved region!\n";
  return 0;
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  info     Show slide information\n";
  std::cerr << "  region   Read a region and save it as PNG\n";
  std::cerr << "\n";
  std::cerr << "Common options:\n";
  std::cerr << "  --input=<path>       Path to slide file (required)\n";
  std::cerr << "  --cache_bytes=<n>    Tile cache capacity (default: "
               "library cache)\n";
  std::cerr << "\n";
  std::cerr << "Info command options:\n";
  std::cerr << "  --verbose            Show every property\n";
  std::cerr << "\n";
  std::cerr << "Region command options:\n";
  std::cerr << "  --x=<value>          X coordinate in level 0 (default: 0)\n";
  std::cerr << "  --y=<value>          Y coordinate in level 0 (default: 0)\n";
  std::cerr << "  --width=<pixels>     Region width (default: 512)\n";
  std::cerr << "  --height=<pixels>    Region height (default: 512)\n";
  std::cerr << "  --level=<n>          Pyramid level (default: 0)\n";
  std::cerr
      << "  --output=<path>      Output file path (default: output.png)\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name << " info --input=slide.svs --verbose\n";
  std::cerr << "  " << program_name
            << " region --input=slide.svs --x=1000 --y=2000 --width=1024 "
               "--height=1024\n";
  std::cerr << "  " << program_name
            << " region --input=slide.ndpi --level=2 --output=region.png\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  // Get command
  std::string command = argv[1];

  // Parse remaining flags
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string input_file = absl::GetFlag(FLAGS_input);

  if (input_file.empty()) {
    std::cerr << "Error: --input flag is required\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  if (command == "info") {
    return InfoCommand(input_file, absl::GetFlag(FLAGS_verbose));
  } else if (command == "region") {
    const slidebridge::RegionRequest request{
        .x = absl::GetFlag(FLAGS_x),
        .y = absl::GetFlag(FLAGS_y),
        .level = absl::GetFlag(FLAGS_level),
        .width = absl::GetFlag(FLAGS_width),
        .height = absl::GetFlag(FLAGS_height)};
    return RegionCommand(input_file, request, absl::GetFlag(FLAGS_output));
  } else {
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
}
