#include <griddet/vision/grid_detector.hpp>
#include <griddet/vision/box_resolver.hpp>
#include <griddet/vision/layout_decoder.hpp>
#include <chrono>
#include <utility>

namespace griddet::vision {

namespace {

using Clock = std::chrono::steady_clock;

void report_stage(StageTimingCallback* timing_cb,
                  std::size_t stage_index,
                  Clock::time_point stage_start) {
  if (!timing_cb) return;
  const auto stage_end = Clock::now();
  const double ms = 1e-6 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(stage_end - stage_start).count());
  (*timing_cb)(stage_index, ms);
}

}  // namespace

GridDetector::GridDetector(core::DetectorConfig config)
    : config_(std::move(config)),
      selector_(config_.threshold, config_.iou_threshold, config_.labels) {}

std::expected<std::vector<core::Detection>, core::DetectError>
GridDetector::detect(std::span<const float> raw,
                     core::ImageSize image,
                     StageTimingCallback* timing_cb) const {
  auto start = Clock::now();
  auto decoded = decode_layout(raw, config_.layout);
  if (!decoded) {
    return std::unexpected(decoded.error());
  }
  report_stage(timing_cb, 0, start);

  start = Clock::now();
  auto boxes = resolve_boxes(decoded->geometry, image);
  if (!boxes) {
    return std::unexpected(boxes.error());
  }
  report_stage(timing_cb, 1, start);

  start = Clock::now();
  const ScoreTensor scores = fuse_scores(decoded->class_probs, decoded->confidences);
  report_stage(timing_cb, 2, start);

  start = Clock::now();
  auto detections = selector_.select(scores, *boxes);
  if (!detections) {
    return std::unexpected(detections.error());
  }
  report_stage(timing_cb, 3, start);

  return detections;
}

}  // namespace griddet::vision
