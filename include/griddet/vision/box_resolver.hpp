#pragma once

#include <griddet/core/detection.hpp>
#include <griddet/core/error.hpp>
#include <griddet/core/image_size.hpp>
#include <griddet/vision/layout_decoder.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace griddet::vision {

/// Image-space boxes indexed [row, col, box]. Owns its storage.
class BoxGeometry {
 public:
  BoxGeometry() = default;
  BoxGeometry(std::size_t grid_size, std::size_t boxes_per_cell)
      : grid_size_(grid_size),
        boxes_per_cell_(boxes_per_cell),
        boxes_(grid_size * grid_size * boxes_per_cell) {}

  [[nodiscard]] const core::BBox& at(std::size_t row,
                                     std::size_t col,
                                     std::size_t box) const noexcept {
    return boxes_[index(row, col, box)];
  }
  [[nodiscard]] core::BBox& at(std::size_t row,
                               std::size_t col,
                               std::size_t box) noexcept {
    return boxes_[index(row, col, box)];
  }

  [[nodiscard]] std::size_t grid_size() const noexcept { return grid_size_; }
  [[nodiscard]] std::size_t boxes_per_cell() const noexcept {
    return boxes_per_cell_;
  }
  [[nodiscard]] std::span<const core::BBox> boxes() const noexcept {
    return boxes_;
  }

 private:
  [[nodiscard]] std::size_t index(std::size_t row,
                                  std::size_t col,
                                  std::size_t box) const noexcept {
    return (row * grid_size_ + col) * boxes_per_cell_ + box;
  }

  std::size_t grid_size_{0};
  std::size_t boxes_per_cell_{0};
  std::vector<core::BBox> boxes_;
};

/// Fused class x confidence scores indexed [row, col, box, class]. Owns its storage.
class ScoreTensor {
 public:
  ScoreTensor() = default;
  ScoreTensor(std::size_t grid_size,
              std::size_t boxes_per_cell,
              std::size_t num_classes)
      : grid_size_(grid_size),
        boxes_per_cell_(boxes_per_cell),
        num_classes_(num_classes),
        scores_(grid_size * grid_size * boxes_per_cell * num_classes, 0.f) {}

  [[nodiscard]] float operator()(std::size_t row,
                                 std::size_t col,
                                 std::size_t box,
                                 std::size_t cls) const noexcept {
    return scores_[index(row, col, box, cls)];
  }
  [[nodiscard]] float& operator()(std::size_t row,
                                  std::size_t col,
                                  std::size_t box,
                                  std::size_t cls) noexcept {
    return scores_[index(row, col, box, cls)];
  }

  [[nodiscard]] std::size_t grid_size() const noexcept { return grid_size_; }
  [[nodiscard]] std::size_t boxes_per_cell() const noexcept {
    return boxes_per_cell_;
  }
  [[nodiscard]] std::size_t num_classes() const noexcept { return num_classes_; }
  [[nodiscard]] std::span<const float> data() const noexcept { return scores_; }

 private:
  [[nodiscard]] std::size_t index(std::size_t row,
                                  std::size_t col,
                                  std::size_t box,
                                  std::size_t cls) const noexcept {
    return ((row * grid_size_ + col) * boxes_per_cell_ + box) * num_classes_ +
           cls;
  }

  std::size_t grid_size_{0};
  std::size_t boxes_per_cell_{0};
  std::size_t num_classes_{0};
  std::vector<float> scores_;
};

/// Converts raw grid-relative geometry to pixel-space center-size boxes.
///
/// For cell (row, col) and raw (rx, ry, rw, rh):
///   cx = (rx + col) / S * width     cy = (ry + row) / S * height
///   w  = rw^2 * width               h  = rh^2 * height
/// The x offset is the column index and the y offset is the row index.
/// Returns a fresh BoxGeometry; \p raw is never written.
/// Errors: InvalidImageSize if width or height is not positive.
[[nodiscard]] std::expected<BoxGeometry, core::DetectError> resolve_boxes(
    const GeometryView& raw,
    core::ImageSize image);

/// score[row, col, box, class] = class_probs[row, col, class] * confidences[row, col, box].
[[nodiscard]] ScoreTensor fuse_scores(const CellTensorView& class_probs,
                                      const CellTensorView& confidences);

}  // namespace griddet::vision
