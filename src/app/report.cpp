#include <griddet/app/report.hpp>
#include <array>
#include <charconv>
#include <sstream>
#include <string_view>

namespace griddet::app {

namespace {

/// Shortest text that round-trips to the same float.
std::string_view format_score(float score, std::array<char, 32>& buf) {
  const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), score);
  return std::string_view(buf.data(), static_cast<std::size_t>(res.ptr - buf.data()));
}

}  // namespace

std::string format_detection(const core::Detection& d) {
  std::array<char, 32> score_buf{};
  std::ostringstream out;
  out << "    class : " << d.label << ", [x,y,w,h]=["
      << static_cast<int>(d.box.cx) << "," << static_cast<int>(d.box.cy) << ","
      << static_cast<int>(d.box.w) << "," << static_cast<int>(d.box.h)
      << "], Confidence = " << format_score(d.score, score_buf);
  return out.str();
}

std::string format_detections(const std::vector<core::Detection>& detections) {
  std::ostringstream out;
  out << "detections=" << detections.size() << "\n";
  for (const auto& d : detections) {
    out << format_detection(d) << "\n";
  }
  return out.str();
}

}  // namespace griddet::app
