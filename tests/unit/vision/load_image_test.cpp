#include <griddet/vision/load_image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <string>

namespace gv = griddet::vision;

TEST(LoadImage, MissingFileReturnsNullopt) {
  EXPECT_FALSE(gv::read_image_size("nonexistent_griddet_image_12345.png").has_value());
}

TEST(LoadImage, ReadsWidthAndHeight) {
  const std::string path =
      (std::filesystem::temp_directory_path() / "griddet_load_image_test.png").string();
  cv::Mat img(48, 80, CV_8UC3, cv::Scalar(0, 128, 255));
  ASSERT_TRUE(cv::imwrite(path, img));

  auto size = gv::read_image_size(path);
  ASSERT_TRUE(size.has_value());
  EXPECT_EQ(size->width, 80);
  EXPECT_EQ(size->height, 48);
  std::filesystem::remove(path);
}
