#include <griddet/core/detector_config.hpp>

namespace griddet::core {

std::vector<std::string> voc_labels() {
  return {"aeroplane", "bicycle", "bird",        "boat",      "bottle",
          "bus",       "car",     "cat",         "chair",     "cow",
          "diningtable", "dog",   "horse",       "motorbike", "person",
          "pottedplant", "sheep", "sofa",        "train",     "tvmonitor"};
}

DetectorConfig default_detector_config() {
  DetectorConfig c;
  c.layout.grid_size = 7;
  c.layout.num_classes = 20;
  c.layout.boxes_per_cell = 2;
  c.threshold = 0.2f;
  c.iou_threshold = 0.5f;
  c.labels = voc_labels();
  return c;
}

}  // namespace griddet::core
