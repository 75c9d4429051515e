#pragma once

#include <mvlabel/types.hpp>

#include <Eigen/Core>

#include <string>

namespace mvlabel::annotation {

// Requests a UI layer can issue against a LabelSession.
enum class EventType {
  kSelectMarker = 0,
  kClick,            // place the marker at uv_px in camera
  kDrag,             // held point in camera; forced triangulation
  kDelete,           // clear the marker in camera
  kTriangulate,      // whole frame
  kSwapIdentities,   // animal 0 <-> animal 1 in camera
  kToggleInvisible,
  kResetMarker,
  kResetFrame,
  kSetFrameLabeled,
  kCopyFrame,
  kPasteFrame,
};

const char* EventTypeName(EventType type);

// Throws on an unknown name.
EventType ParseEventType(const std::string& name);

struct AnnotationEvent {
  EventType type = EventType::kTriangulate;
  FrameId frame = 0;
  CameraId camera = -1;
  MarkerId marker = -1;  // -1: the session's selected marker
  Eigen::Vector2d uv_px = MissingPoint2d();
};

}  // namespace mvlabel::annotation
