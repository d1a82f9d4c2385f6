#include <griddet/app/detector_runner_tbb.hpp>

#ifdef GRIDDET_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace griddet::app {

void run_detector_batch_tbb(const vision::GridDetector& detector,
                            const std::vector<DetectionRequest>& requests,
                            DetectionResultCallback callback) {
  if (requests.empty() || !callback) return;

  const std::size_t n = requests.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&detector, &requests, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const DetectionRequest& req = requests[i];
          callback(DetectionResult{req.request_id,
                                   detector.detect(req.raw, req.image_size)});
        }
      });
}

}  // namespace griddet::app

#endif  // GRIDDET_HAS_TBB
