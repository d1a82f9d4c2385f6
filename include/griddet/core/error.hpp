#pragma once

#include <string_view>

namespace griddet::core {

/// Detection error codes; used with std::expected for recoverable failures.
enum class DetectError {
  None = 0,
  ShapeMismatch,       // raw output length disagrees with the grid layout
  InvalidLayout,       // grid size, class count or boxes per cell is zero
  InvalidImageSize,
  InvalidParameter,    // threshold or IoU threshold non-finite or outside [0,1]
  LabelTableTooSmall,
  DegenerateBox,       // zero-or-negative area box reached during IoU
  LoadFailed,
};

/// Enumerator name, e.g. "ShapeMismatch".
[[nodiscard]] std::string_view to_string(DetectError e) noexcept;

}  // namespace griddet::core
