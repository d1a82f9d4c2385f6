#pragma once

#include <cstddef>
#include <limits>

namespace griddet::core {

/// Shape of a grid detector's flat output: S x S cells, C classes, B boxes per cell.
///
/// The flat buffer holds three contiguous regions in this order:
///   class probabilities [row, col, class]        S*S*C values
///   box confidences     [row, col, box]          S*S*B values
///   box geometry        [row, col, box, 4]       S*S*B*4 values
/// Each region is row-major with its trailing axis varying fastest.
struct GridLayout {
  std::size_t grid_size{7};
  std::size_t num_classes{20};
  std::size_t boxes_per_cell{2};

  /// Geometry components per box: cx, cy, w, h.
  static constexpr std::size_t kBoxComponents = 4;

  [[nodiscard]] constexpr std::size_t num_cells() const noexcept {
    return grid_size * grid_size;
  }
  [[nodiscard]] constexpr std::size_t class_prob_count() const noexcept {
    return num_cells() * num_classes;
  }
  [[nodiscard]] constexpr std::size_t confidence_count() const noexcept {
    return num_cells() * boxes_per_cell;
  }
  [[nodiscard]] constexpr std::size_t geometry_count() const noexcept {
    return num_cells() * boxes_per_cell * kBoxComponents;
  }

  [[nodiscard]] constexpr std::size_t confidence_offset() const noexcept {
    return class_prob_count();
  }
  [[nodiscard]] constexpr std::size_t geometry_offset() const noexcept {
    return class_prob_count() + confidence_count();
  }

  /// Exact length a raw output buffer must have for this layout.
  [[nodiscard]] constexpr std::size_t total_size() const noexcept {
    return class_prob_count() + confidence_count() + geometry_count();
  }

  /// True if total_size() and every region count fit in std::size_t.
  [[nodiscard]] constexpr bool representable() const noexcept {
    constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
    // Per cell: C class probabilities, B confidences, B*4 geometry values.
    if (boxes_per_cell > (kMax - num_classes) / (kBoxComponents + 1)) return false;
    const std::size_t per_cell = num_classes + boxes_per_cell * (kBoxComponents + 1);
    if (grid_size != 0 && grid_size > kMax / grid_size) return false;
    return per_cell == 0 || num_cells() <= kMax / per_cell;
  }

  /// True if every dimension is at least 1 and the buffer length is representable.
  [[nodiscard]] constexpr bool valid() const noexcept {
    return grid_size > 0 && num_classes > 0 && boxes_per_cell > 0 && representable();
  }
};

}  // namespace griddet::core
