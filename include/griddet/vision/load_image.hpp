#pragma once

#include <griddet/core/image_size.hpp>
#include <optional>
#include <string>

namespace griddet::vision {

/// Pixel size of an image file (any format OpenCV can read). Returns nullopt on failure.
std::optional<core::ImageSize> read_image_size(const std::string& path);

}  // namespace griddet::vision
