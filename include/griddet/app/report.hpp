#pragma once

#include <griddet/core/detection.hpp>
#include <string>
#include <vector>

namespace griddet::app {

/// One report line: "    class : <label>, [x,y,w,h]=[x,y,w,h], Confidence = <score>".
/// Box values are truncated toward zero.
std::string format_detection(const core::Detection& d);

/// "detections=<n>" header followed by one format_detection line per detection.
std::string format_detections(const std::vector<core::Detection>& detections);

}  // namespace griddet::app
