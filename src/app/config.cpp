#include <griddet/app/config.hpp>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace griddet::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// std::stoul wraps a leading minus sign instead of rejecting it.
std::size_t parse_dimension(const std::string& key, const std::string& value) {
  if (value.find('-') != std::string::npos) {
    throw std::out_of_range(key + " must not be negative: " + value);
  }
  return std::stoul(value);
}

}  // namespace

core::DetectorConfig default_config() {
  return core::default_detector_config();
}

std::vector<std::string> parse_label_list(std::string_view text) {
  std::vector<std::string> out;
  std::size_t begin = 0;
  while (begin <= text.size()) {
    auto comma = text.find(',', begin);
    if (comma == std::string_view::npos) comma = text.size();
    std::string item(text.substr(begin, comma - begin));
    trim(item);
    if (!item.empty()) out.push_back(std::move(item));
    begin = comma + 1;
  }
  return out;
}

core::DetectorConfig load_config(const std::string& path) {
  core::DetectorConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "grid_size") c.layout.grid_size = parse_dimension(key, value);
    else if (key == "num_classes") c.layout.num_classes = parse_dimension(key, value);
    else if (key == "boxes_per_cell") c.layout.boxes_per_cell = parse_dimension(key, value);
    else if (key == "threshold") c.threshold = std::stof(value);
    else if (key == "iou_threshold") c.iou_threshold = std::stof(value);
    else if (key == "labels") c.labels = parse_label_list(value);
  }
  if (!c.layout.representable()) {
    throw std::out_of_range("layout dimensions overflow the output length");
  }
  return c;
}

}  // namespace griddet::app
