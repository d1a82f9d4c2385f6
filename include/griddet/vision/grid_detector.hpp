#pragma once

#include <griddet/core/detection.hpp>
#include <griddet/core/detector_config.hpp>
#include <griddet/core/error.hpp>
#include <griddet/core/image_size.hpp>
#include <griddet/vision/detection_selector.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <vector>

namespace griddet::vision {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to detect().
using StageTimingCallback =
    std::function<void(std::size_t stage_index, double duration_ms)>;

/// Raw grid output -> ranked, de-duplicated detections.
/// Runs decode_layout, resolve_boxes, fuse_scores and DetectionSelector::select in order.
class GridDetector {
 public:
  /// Stages reported to the timing callback: decode, resolve, fuse, select.
  static constexpr std::size_t kStageCount = 4;

  explicit GridDetector(core::DetectorConfig config);

  /// Run the full pipeline on one raw output. \p raw is only read.
  /// The first error of any stage is returned unchanged.
  /// If timing_cb is non-null, it is called after each completed stage.
  /// Thread-safe: the detector holds no mutable state.
  [[nodiscard]] std::expected<std::vector<core::Detection>, core::DetectError>
  detect(std::span<const float> raw,
         core::ImageSize image,
         StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const core::DetectorConfig& config() const noexcept {
    return config_;
  }

 private:
  core::DetectorConfig config_;
  DetectionSelector selector_;
};

}  // namespace griddet::vision
