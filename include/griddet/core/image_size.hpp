#pragma once

namespace griddet::core {

/// Source image dimensions in pixels. Both must be positive to resolve boxes.
struct ImageSize {
  int width{0};
  int height{0};

  [[nodiscard]] constexpr bool valid() const noexcept {
    return width > 0 && height > 0;
  }
};

}  // namespace griddet::core
