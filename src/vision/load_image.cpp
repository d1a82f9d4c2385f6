#include <griddet/vision/load_image.hpp>
#include <opencv2/core/mat.hpp>
#include <opencv2/imgcodecs.hpp>

namespace griddet::vision {

std::optional<core::ImageSize> read_image_size(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) return std::nullopt;

  return core::ImageSize{mat.cols, mat.rows};
}

}  // namespace griddet::vision
