#pragma once

#include <griddet/core/error.hpp>
#include <griddet/core/grid_layout.hpp>
#include <cstddef>
#include <expected>
#include <span>

namespace griddet::vision {

/// Index of each geometry component within a box, fastest-varying axis of the geometry region.
enum BoxComponent : std::size_t {
  kCx = 0,
  kCy = 1,
  kW = 2,
  kH = 3,
};

/// Read-only [row, col, k] view over one region of a raw output (k = class or box).
/// Non-owning: the caller keeps the underlying buffer alive and unmodified.
class CellTensorView {
 public:
  CellTensorView() = default;
  CellTensorView(std::span<const float> data,
                 std::size_t grid_size,
                 std::size_t depth) noexcept
      : data_(data), grid_size_(grid_size), depth_(depth) {}

  [[nodiscard]] float operator()(std::size_t row,
                                 std::size_t col,
                                 std::size_t k) const noexcept {
    return data_[(row * grid_size_ + col) * depth_ + k];
  }

  [[nodiscard]] std::size_t grid_size() const noexcept { return grid_size_; }
  /// Length of the trailing axis (classes or boxes per cell).
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
  [[nodiscard]] std::span<const float> data() const noexcept { return data_; }

 private:
  std::span<const float> data_;
  std::size_t grid_size_{0};
  std::size_t depth_{0};
};

/// Read-only [row, col, box, component] view over the raw geometry region.
class GeometryView {
 public:
  GeometryView() = default;
  GeometryView(std::span<const float> data,
               std::size_t grid_size,
               std::size_t boxes_per_cell) noexcept
      : data_(data), grid_size_(grid_size), boxes_per_cell_(boxes_per_cell) {}

  [[nodiscard]] float operator()(std::size_t row,
                                 std::size_t col,
                                 std::size_t box,
                                 std::size_t component) const noexcept {
    return data_[((row * grid_size_ + col) * boxes_per_cell_ + box) *
                     core::GridLayout::kBoxComponents +
                 component];
  }

  [[nodiscard]] std::size_t grid_size() const noexcept { return grid_size_; }
  [[nodiscard]] std::size_t boxes_per_cell() const noexcept {
    return boxes_per_cell_;
  }
  [[nodiscard]] std::span<const float> data() const noexcept { return data_; }

 private:
  std::span<const float> data_;
  std::size_t grid_size_{0};
  std::size_t boxes_per_cell_{0};
};

/// The three logical sub-tensors of one raw output.
struct DecodedOutput {
  core::GridLayout layout{};
  CellTensorView class_probs;  // [row, col, class]
  CellTensorView confidences;  // [row, col, box]
  GeometryView geometry;       // [row, col, box, component], untransformed
};

/// Splits \p raw into class-probability, confidence and geometry views.
/// No numeric transform and no copy; the views alias \p raw.
/// Errors: InvalidLayout if any layout dimension is zero,
/// ShapeMismatch if raw.size() != layout.total_size().
[[nodiscard]] std::expected<DecodedOutput, core::DetectError> decode_layout(
    std::span<const float> raw,
    const core::GridLayout& layout);

}  // namespace griddet::vision
