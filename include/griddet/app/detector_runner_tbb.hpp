#pragma once

#include <griddet/app/detector_runner.hpp>
#include <griddet/vision/grid_detector.hpp>
#include <vector>

#ifdef GRIDDET_HAS_TBB

namespace griddet::app {

/// Runs the detector on a batch of requests in parallel using TBB.
///
/// Every request produces exactly one callback(result), failures included.
/// The detector is shared by all TBB tasks; it holds no mutable state, so this is safe.
/// Requests are read only; not modified.
///
/// \param detector Detector used for every request. Caller keeps ownership.
/// \param requests Raw outputs with their image sizes.
/// \param callback Invoked once per request, from TBB worker threads. Must be thread-safe.
void run_detector_batch_tbb(const vision::GridDetector& detector,
                            const std::vector<DetectionRequest>& requests,
                            DetectionResultCallback callback);

}  // namespace griddet::app

#endif  // GRIDDET_HAS_TBB
