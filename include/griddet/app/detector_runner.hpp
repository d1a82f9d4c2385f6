#pragma once

#include <griddet/core/detection.hpp>
#include <griddet/core/error.hpp>
#include <griddet/core/image_size.hpp>
#include <griddet/vision/grid_detector.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <vector>

namespace griddet::app {

/// One raw network output to decode, with the size of the image it came from.
struct DetectionRequest {
  std::uint64_t request_id{0};
  std::vector<float> raw;
  core::ImageSize image_size{};
};

/// Outcome for one request: detections or the error that stopped the pipeline.
struct DetectionResult {
  std::uint64_t request_id{0};
  std::expected<std::vector<core::Detection>, core::DetectError> detections;
};

/// Callback for each DetectionResult; may be invoked from worker threads.
/// Must be thread-safe if using run_detector_batch_parallel.
using DetectionResultCallback = std::function<void(const DetectionResult&)>;

/// Optional per-stage timing: (stage_index, duration_ms).
using StageTimingCallback = vision::StageTimingCallback;

/// Runs the detector on a single raw output. No threading; direct call.
[[nodiscard]] std::expected<std::vector<core::Detection>, core::DetectError>
run_detector(const vision::GridDetector& detector,
             std::span<const float> raw,
             core::ImageSize image_size,
             StageTimingCallback* timing_cb = nullptr);

/// Runs the detector on every request sequentially; calls callback for each result,
/// failures included, in input order.
void run_detector_batch(const vision::GridDetector& detector,
                        const std::vector<DetectionRequest>& requests,
                        DetectionResultCallback callback);

/// Runs the detector on many requests in parallel using a thread pool.
/// callback may be invoked from any worker (must be thread-safe); order is unspecified.
/// num_workers 0 = use hardware concurrency.
void run_detector_batch_parallel(const vision::GridDetector& detector,
                                 const std::vector<DetectionRequest>& requests,
                                 DetectionResultCallback callback,
                                 std::size_t num_workers = 0);

}  // namespace griddet::app
