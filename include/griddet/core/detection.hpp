#pragma once

#include <cstddef>
#include <string>

namespace griddet::core {

/// Axis-aligned box in center-size form (pixel units once resolved).
struct BBox {
  float cx{0.f};
  float cy{0.f};
  float w{0.f};
  float h{0.f};
};

/// Single surviving detection: label, box, fused score.
struct Detection {
  std::string label;
  BBox box{};
  float score{0.f};
  std::size_t class_id{0};
};

}  // namespace griddet::core
