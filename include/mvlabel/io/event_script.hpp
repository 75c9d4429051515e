#pragma once

#include <mvlabel/annotation/events.hpp>

#include <string>
#include <vector>

namespace mvlabel::io {

// Reads a recorded list of annotation events:
//
//   events:
//     - { type: click, frame: 0, camera: 1, marker: 3, u: 100.0, v: 50.0 }
//     - { type: triangulate, frame: 0 }
//
// Missing camera/marker default to -1 (marker -1 means the selected marker).
// Throws on an unreadable file or an unknown event type.
std::vector<annotation::AnnotationEvent> LoadEventScript(const std::string& path);

bool SaveEventScript(const std::string& path, const std::vector<annotation::AnnotationEvent>& events);

}  // namespace mvlabel::io
