#include <griddet/vision/box_resolver.hpp>

namespace griddet::vision {

std::expected<BoxGeometry, core::DetectError> resolve_boxes(
    const GeometryView& raw,
    core::ImageSize image) {
  if (!image.valid()) {
    return std::unexpected(core::DetectError::InvalidImageSize);
  }

  const std::size_t s = raw.grid_size();
  const std::size_t nb = raw.boxes_per_cell();
  const float grid = static_cast<float>(s);
  const float img_w = static_cast<float>(image.width);
  const float img_h = static_cast<float>(image.height);

  BoxGeometry out(s, nb);
  for (std::size_t row = 0; row < s; ++row) {
    for (std::size_t col = 0; col < s; ++col) {
      for (std::size_t b = 0; b < nb; ++b) {
        const float rx = raw(row, col, b, kCx);
        const float ry = raw(row, col, b, kCy);
        const float rw = raw(row, col, b, kW);
        const float rh = raw(row, col, b, kH);

        core::BBox& box = out.at(row, col, b);
        box.cx = (rx + static_cast<float>(col)) / grid * img_w;
        box.cy = (ry + static_cast<float>(row)) / grid * img_h;
        // Sizes are stored as square roots of the normalized size.
        box.w = rw * rw * img_w;
        box.h = rh * rh * img_h;
      }
    }
  }
  return out;
}

ScoreTensor fuse_scores(const CellTensorView& class_probs,
                        const CellTensorView& confidences) {
  const std::size_t s = class_probs.grid_size();
  const std::size_t nc = class_probs.depth();
  const std::size_t nb = confidences.depth();

  ScoreTensor out(s, nb, nc);
  for (std::size_t row = 0; row < s; ++row) {
    for (std::size_t col = 0; col < s; ++col) {
      for (std::size_t b = 0; b < nb; ++b) {
        const float conf = confidences(row, col, b);
        for (std::size_t c = 0; c < nc; ++c) {
          out(row, col, b, c) = class_probs(row, col, c) * conf;
        }
      }
    }
  }
  return out;
}

}  // namespace griddet::vision
