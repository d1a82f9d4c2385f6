#include <griddet/core/error.hpp>

namespace griddet::core {

std::string_view to_string(DetectError e) noexcept {
  switch (e) {
    case DetectError::None:
      return "None";
    case DetectError::ShapeMismatch:
      return "ShapeMismatch";
    case DetectError::InvalidLayout:
      return "InvalidLayout";
    case DetectError::InvalidImageSize:
      return "InvalidImageSize";
    case DetectError::InvalidParameter:
      return "InvalidParameter";
    case DetectError::LabelTableTooSmall:
      return "LabelTableTooSmall";
    case DetectError::DegenerateBox:
      return "DegenerateBox";
    case DetectError::LoadFailed:
      return "LoadFailed";
  }
  return "Unknown";
}

}  // namespace griddet::core
