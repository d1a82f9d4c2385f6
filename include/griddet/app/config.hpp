#pragma once

#include <griddet/core/detector_config.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace griddet::app {

/// Load detector config from a simple key=value file (one per line) or use defaults.
/// Keys: grid_size, num_classes, boxes_per_cell, threshold, iou_threshold,
/// labels (comma-separated). '#' starts a comment line; unknown keys are ignored.
/// A missing file yields default_config(). Malformed numbers throw (std::stoul / std::stof).
/// Negative dimensions, or dimensions whose output length overflows std::size_t,
/// throw std::out_of_range.
core::DetectorConfig load_config(const std::string& path);

/// Default config when no file is provided.
core::DetectorConfig default_config();

/// Split "a, b ,c" into {"a", "b", "c"}; empty items are dropped.
std::vector<std::string> parse_label_list(std::string_view text);

}  // namespace griddet::app
