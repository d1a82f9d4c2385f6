#include <griddet/app/detector_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace griddet::app {

std::expected<std::vector<core::Detection>, core::DetectError> run_detector(
    const vision::GridDetector& detector,
    std::span<const float> raw,
    core::ImageSize image_size,
    StageTimingCallback* timing_cb) {
  return detector.detect(raw, image_size, timing_cb);
}

void run_detector_batch(const vision::GridDetector& detector,
                        const std::vector<DetectionRequest>& requests,
                        DetectionResultCallback callback) {
  if (!callback) return;
  for (const auto& req : requests) {
    callback(DetectionResult{req.request_id,
                             detector.detect(req.raw, req.image_size)});
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void run_detector_batch_parallel(const vision::GridDetector& detector,
                                 const std::vector<DetectionRequest>& requests,
                                 DetectionResultCallback callback,
                                 std::size_t num_workers) {
  const std::size_t n = requests.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    run_detector_batch(detector, requests, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      const DetectionRequest& req = requests[idx];
      callback(DetectionResult{req.request_id,
                               detector.detect(req.raw, req.image_size)});
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace griddet::app
