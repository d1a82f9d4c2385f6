#include <griddet/vision/raw_output_io.hpp>
#include <cstddef>
#include <fstream>
#include <ios>

namespace griddet::vision {

std::expected<std::vector<float>, core::DetectError> load_raw_output(
    const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    return std::unexpected(core::DetectError::LoadFailed);
  }
  const std::streamsize bytes = f.tellg();
  if (bytes <= 0 || static_cast<std::size_t>(bytes) % sizeof(float) != 0) {
    return std::unexpected(core::DetectError::LoadFailed);
  }

  std::vector<float> values(static_cast<std::size_t>(bytes) / sizeof(float));
  f.seekg(0, std::ios::beg);
  if (!f.read(reinterpret_cast<char*>(values.data()), bytes)) {
    return std::unexpected(core::DetectError::LoadFailed);
  }
  return values;
}

bool save_raw_output(const std::string& path, std::span<const float> values) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  f.write(reinterpret_cast<const char*>(values.data()),
          static_cast<std::streamsize>(values.size_bytes()));
  return static_cast<bool>(f);
}

}  // namespace griddet::vision
