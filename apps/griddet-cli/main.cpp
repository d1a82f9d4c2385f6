/**
 * griddet-cli: decode a raw grid-detector output dump into detections.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/griddet_cli --raw out.bin (--width W --height H | --image img.jpg) [--config path]
 * With --output <dir>: also writes results to <dir>/<raw basename>.txt (same content as terminal).
 */

#include <griddet/app/config.hpp>
#include <griddet/app/detector_runner.hpp>
#include <griddet/app/report.hpp>
#include <griddet/core/detector_config.hpp>
#include <griddet/core/error.hpp>
#include <griddet/core/image_size.hpp>
#include <griddet/vision/grid_detector.hpp>
#include <griddet/vision/load_image.hpp>
#include <griddet/vision/raw_output_io.hpp>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace {

void print_usage() {
  std::cout << "Usage: griddet_cli --raw <path> (--width <px> --height <px> | --image <path>) [options]\n"
            << "  --raw <path>      Raw network output (float32 dump, S*S*C + S*S*B + S*S*B*4 values)\n"
            << "  --width <px>      Source image width in pixels\n"
            << "  --height <px>     Source image height in pixels\n"
            << "  --image <path>    Read width/height from this image instead\n"
            << "  --config <path>   Detector config (key=value file); default: 7x7 grid, 20 VOC classes, 2 boxes\n"
            << "  --output <dir>    Also write the report to <dir>/<raw basename>.txt\n";
}

}  // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string raw_path;
  std::string image_path;
  std::string output_dir;
  griddet::core::ImageSize image_size;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--raw" && i + 1 < argc) {
        raw_path = argv[++i];
      } else if (arg == "--image" && i + 1 < argc) {
        image_path = argv[++i];
      } else if (arg == "--width" && i + 1 < argc) {
        image_size.width = std::stoi(argv[++i]);
      } else if (arg == "--height" && i + 1 < argc) {
        image_size.height = std::stoi(argv[++i]);
      } else if (arg == "--output" && i + 1 < argc) {
        output_dir = argv[++i];
      } else if (arg == "--help" || arg == "-h") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        print_usage();
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Invalid numeric argument: " << e.what() << "\n";
    return 1;
  }

  if (raw_path.empty()) {
    print_usage();
    return 1;
  }

  griddet::core::DetectorConfig cfg;
  try {
    cfg = config_path.empty() ? griddet::app::default_config()
                              : griddet::app::load_config(config_path);
  } catch (const std::exception &e) {
    std::cerr << "Failed to parse config " << config_path << ": " << e.what() << "\n";
    return 1;
  }

  if (!image_path.empty()) {
    auto probed = griddet::vision::read_image_size(image_path);
    if (!probed) {
      std::cerr << "Failed to load image: " << image_path << "\n";
      return 1;
    }
    image_size = *probed;
  }

  auto raw = griddet::vision::load_raw_output(raw_path);
  if (!raw) {
    std::cerr << "Failed to load raw output " << raw_path << ": "
              << griddet::core::to_string(raw.error()) << "\n";
    return 1;
  }

  const griddet::vision::GridDetector detector(std::move(cfg));

  double total_ms = 0.0;
  griddet::app::StageTimingCallback timing_cb = [&total_ms](std::size_t, double ms) {
    total_ms += ms;
  };
  auto result = griddet::app::run_detector(detector, *raw, image_size, &timing_cb);
  if (!result) {
    std::cerr << "Detection error: " << griddet::core::to_string(result.error()) << "\n";
    return 1;
  }

  std::cout << "total time is " << total_ms << " milliseconds\n";
  const std::string text = griddet::app::format_detections(*result);
  std::cout << text;

  if (!output_dir.empty()) {
    std::filesystem::path p(raw_path);
    std::filesystem::path out_dir(output_dir);
    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return 0;
}
