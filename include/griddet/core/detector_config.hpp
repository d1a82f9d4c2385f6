#pragma once

#include <griddet/core/grid_layout.hpp>
#include <string>
#include <vector>

namespace griddet::core {

/// Everything the detection core needs at call time; passed explicitly, never global.
struct DetectorConfig {
  GridLayout layout{};
  float threshold{0.2f};      // minimum fused score kept (inclusive)
  float iou_threshold{0.5f};  // overlap above which a lower-ranked box is suppressed
  std::vector<std::string> labels;  // class id -> name
};

/// The 20 Pascal VOC class names in class-id order.
[[nodiscard]] std::vector<std::string> voc_labels();

/// 7x7 grid, 20 classes, 2 boxes per cell, thresholds 0.2 / 0.5, VOC labels.
[[nodiscard]] DetectorConfig default_detector_config();

}  // namespace griddet::core
