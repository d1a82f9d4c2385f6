#include <griddet/core/error.hpp>
#include <griddet/vision/raw_output_io.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace gv = griddet::vision;
namespace gc = griddet::core;

namespace {

std::string temp_path(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace

TEST(RawOutputIo, SaveThenLoad) {
  const std::string path = temp_path("griddet_raw_output_io_test.bin");
  const std::vector<float> values = {0.f, 0.25f, -1.5f, 3.75f, 1e-7f};
  ASSERT_TRUE(gv::save_raw_output(path, values));

  auto loaded = gv::load_raw_output(path);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, values);
  std::filesystem::remove(path);
}

TEST(RawOutputIo, MissingFileFails) {
  auto loaded = gv::load_raw_output("nonexistent_griddet_raw_output_12345.bin");
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), gc::DetectError::LoadFailed);
}

TEST(RawOutputIo, EmptyFileFails) {
  const std::string path = temp_path("griddet_raw_output_empty.bin");
  { std::ofstream f(path, std::ios::binary | std::ios::trunc); }
  auto loaded = gv::load_raw_output(path);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), gc::DetectError::LoadFailed);
  std::filesystem::remove(path);
}

TEST(RawOutputIo, PartialFloatFails) {
  const std::string path = temp_path("griddet_raw_output_partial.bin");
  {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    const char bytes[6] = {0, 0, 0, 0, 1, 2};
    f.write(bytes, sizeof(bytes));
  }
  auto loaded = gv::load_raw_output(path);
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error(), gc::DetectError::LoadFailed);
  std::filesystem::remove(path);
}
