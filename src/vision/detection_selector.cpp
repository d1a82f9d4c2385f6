#include <griddet/vision/detection_selector.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace griddet::vision {

namespace {

bool in_unit_range(float v) {
  return std::isfinite(v) && v >= 0.f && v <= 1.f;
}

}  // namespace

std::expected<float, core::DetectError> iou(const core::BBox& a,
                                            const core::BBox& b) {
  if (!(a.w > 0.f && a.h > 0.f) || !(b.w > 0.f && b.h > 0.f)) {
    return std::unexpected(core::DetectError::DegenerateBox);
  }

  // Overlap along x from centers and widths, then along y from centers and heights.
  const float overlap_x = std::min(a.cx + 0.5f * a.w, b.cx + 0.5f * b.w) -
                          std::max(a.cx - 0.5f * a.w, b.cx - 0.5f * b.w);
  const float overlap_y = std::min(a.cy + 0.5f * a.h, b.cy + 0.5f * b.h) -
                          std::max(a.cy - 0.5f * a.h, b.cy - 0.5f * b.h);
  const float intersection = std::max(0.f, overlap_x) * std::max(0.f, overlap_y);
  const float union_area = a.w * a.h + b.w * b.h - intersection;
  if (!(union_area > 0.f)) {
    return std::unexpected(core::DetectError::DegenerateBox);
  }
  return intersection / union_area;
}

std::vector<Candidate> filter_candidates(const ScoreTensor& scores,
                                         const BoxGeometry& boxes,
                                         float threshold) {
  std::vector<Candidate> out;
  const std::size_t s = scores.grid_size();
  const std::size_t nb = scores.boxes_per_cell();
  const std::size_t nc = scores.num_classes();

  for (std::size_t row = 0; row < s; ++row) {
    for (std::size_t col = 0; col < s; ++col) {
      for (std::size_t b = 0; b < nb; ++b) {
        for (std::size_t c = 0; c < nc; ++c) {
          const float score = scores(row, col, b, c);
          if (score >= threshold) {
            out.push_back(Candidate{c, boxes.at(row, col, b), score});
          }
        }
      }
    }
  }
  return out;
}

void sort_candidates(std::vector<Candidate>& candidates) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate& lhs, const Candidate& rhs) {
                     return lhs.score > rhs.score;
                   });
}

std::expected<std::vector<Candidate>, core::DetectError> suppress_overlaps(
    const std::vector<Candidate>& sorted,
    float iou_threshold) {
  const std::size_t n = sorted.size();
  std::vector<bool> suppressed(n, false);

  for (std::size_t i = 0; i < n; ++i) {
    if (suppressed[i]) continue;
    for (std::size_t j = i + 1; j < n; ++j) {
      if (suppressed[j]) continue;
      auto overlap = iou(sorted[i].box, sorted[j].box);
      if (!overlap) {
        return std::unexpected(overlap.error());
      }
      if (*overlap > iou_threshold) {
        suppressed[j] = true;
      }
    }
  }

  std::vector<Candidate> kept;
  kept.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (!suppressed[i]) kept.push_back(sorted[i]);
  }
  return kept;
}

DetectionSelector::DetectionSelector(float threshold,
                                     float iou_threshold,
                                     std::vector<std::string> labels)
    : threshold_(threshold),
      iou_threshold_(iou_threshold),
      labels_(std::move(labels)) {}

std::expected<void, core::DetectError> DetectionSelector::validate(
    std::size_t num_classes) const {
  if (!in_unit_range(threshold_) || !in_unit_range(iou_threshold_)) {
    return std::unexpected(core::DetectError::InvalidParameter);
  }
  if (labels_.size() < num_classes) {
    return std::unexpected(core::DetectError::LabelTableTooSmall);
  }
  return {};
}

std::expected<std::vector<core::Detection>, core::DetectError>
DetectionSelector::select(const ScoreTensor& scores,
                          const BoxGeometry& boxes) const {
  auto valid = validate(scores.num_classes());
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (scores.grid_size() != boxes.grid_size() ||
      scores.boxes_per_cell() != boxes.boxes_per_cell()) {
    return std::unexpected(core::DetectError::ShapeMismatch);
  }

  std::vector<Candidate> candidates = filter_candidates(scores, boxes, threshold_);
  sort_candidates(candidates);

  auto kept = suppress_overlaps(candidates, iou_threshold_);
  if (!kept) {
    return std::unexpected(kept.error());
  }

  std::vector<core::Detection> out;
  out.reserve(kept->size());
  for (const auto& cand : *kept) {
    core::Detection d;
    d.label = labels_[cand.class_id];
    d.box = cand.box;
    d.score = cand.score;
    d.class_id = cand.class_id;
    out.push_back(std::move(d));
  }
  return out;
}

}  // namespace griddet::vision
