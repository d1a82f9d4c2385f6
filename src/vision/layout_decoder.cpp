#include <griddet/vision/layout_decoder.hpp>

namespace griddet::vision {

std::expected<DecodedOutput, core::DetectError> decode_layout(
    std::span<const float> raw,
    const core::GridLayout& layout) {
  if (!layout.valid()) {
    return std::unexpected(core::DetectError::InvalidLayout);
  }
  if (raw.size() != layout.total_size()) {
    return std::unexpected(core::DetectError::ShapeMismatch);
  }

  DecodedOutput out;
  out.layout = layout;
  out.class_probs = CellTensorView(raw.subspan(0, layout.class_prob_count()),
                                   layout.grid_size, layout.num_classes);
  out.confidences = CellTensorView(
      raw.subspan(layout.confidence_offset(), layout.confidence_count()),
      layout.grid_size, layout.boxes_per_cell);
  out.geometry = GeometryView(
      raw.subspan(layout.geometry_offset(), layout.geometry_count()),
      layout.grid_size, layout.boxes_per_cell);
  return out;
}

}  // namespace griddet::vision
