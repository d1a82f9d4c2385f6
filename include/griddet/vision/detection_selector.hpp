#pragma once

#include <griddet/core/detection.hpp>
#include <griddet/core/error.hpp>
#include <griddet/vision/box_resolver.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace griddet::vision {

/// One (row, col, box, class) entry of the score tensor that passed the threshold.
struct Candidate {
  std::size_t class_id{0};
  core::BBox box{};
  float score{0.f};
};

/// Intersection over union of two center-size boxes.
/// Errors: DegenerateBox if either box has non-positive width or height,
/// or the union area is not positive.
[[nodiscard]] std::expected<float, core::DetectError> iou(const core::BBox& a,
                                                          const core::BBox& b);

/// Every entry with score >= threshold, enumerated row-major over
/// (row, col, box, class) with class fastest.
[[nodiscard]] std::vector<Candidate> filter_candidates(
    const ScoreTensor& scores,
    const BoxGeometry& boxes,
    float threshold);

/// Stable sort by score, highest first; equal scores keep enumeration order.
void sort_candidates(std::vector<Candidate>& candidates);

/// Greedy non-maximum suppression over score-sorted candidates.
/// Walks candidates in order; each one not yet suppressed suppresses every later
/// unsuppressed candidate whose IoU with it exceeds \p iou_threshold, whatever its
/// class. Survivors are returned in their input order with values untouched.
[[nodiscard]] std::expected<std::vector<Candidate>, core::DetectError>
suppress_overlaps(const std::vector<Candidate>& sorted, float iou_threshold);

/// Thresholds the score tensor, ranks candidates and applies class-agnostic NMS.
class DetectionSelector {
 public:
  DetectionSelector(float threshold,
                    float iou_threshold,
                    std::vector<std::string> labels);

  /// Errors: InvalidParameter, LabelTableTooSmall, ShapeMismatch (score tensor and
  /// boxes disagree), DegenerateBox (from IoU during suppression).
  [[nodiscard]] std::expected<std::vector<core::Detection>, core::DetectError>
  select(const ScoreTensor& scores, const BoxGeometry& boxes) const;

  /// Checks thresholds and that the label table covers \p num_classes.
  [[nodiscard]] std::expected<void, core::DetectError> validate(
      std::size_t num_classes) const;

  [[nodiscard]] float threshold() const noexcept { return threshold_; }
  [[nodiscard]] float iou_threshold() const noexcept { return iou_threshold_; }
  [[nodiscard]] const std::vector<std::string>& labels() const noexcept {
    return labels_;
  }

 private:
  float threshold_;
  float iou_threshold_;
  std::vector<std::string> labels_;
};

}  // namespace griddet::vision
