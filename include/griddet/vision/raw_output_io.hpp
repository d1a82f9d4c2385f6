#pragma once

#include <griddet/core/error.hpp>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace griddet::vision {

/// Load a raw network output dump: native-endian float32 values, no header.
/// Errors: LoadFailed if the file cannot be read, is empty, or its size is not a
/// multiple of sizeof(float). Length is not checked against any layout here.
[[nodiscard]] std::expected<std::vector<float>, core::DetectError>
load_raw_output(const std::string& path);

/// Write \p values in the format load_raw_output reads. Returns false on I/O failure.
[[nodiscard]] bool save_raw_output(const std::string& path,
                                   std::span<const float> values);

}  // namespace griddet::vision
