#include <mvlabel/annotation/events.hpp>
#include <mvlabel/common.hpp>

namespace mvlabel::annotation {

namespace {

constexpr EventType kAllEvents[] = {
    EventType::kSelectMarker,  EventType::kClick,          EventType::kDrag,
    EventType::kDelete,        EventType::kTriangulate,    EventType::kSwapIdentities,
    EventType::kToggleInvisible, EventType::kResetMarker,  EventType::kResetFrame,
    EventType::kSetFrameLabeled, EventType::kCopyFrame,    EventType::kPasteFrame,
};

}  // namespace

const char* EventTypeName(EventType type) {
  switch (type) {
    case EventType::kSelectMarker: return "select_marker";
    case EventType::kClick: return "click";
    case EventType::kDrag: return "drag";
    case EventType::kDelete: return "delete";
    case EventType::kTriangulate: return "triangulate";
    case EventType::kSwapIdentities: return "swap_identities";
    case EventType::kToggleInvisible: return "toggle_invisible";
    case EventType::kResetMarker: return "reset_marker";
    case EventType::kResetFrame: return "reset_frame";
    case EventType::kSetFrameLabeled: return "set_frame_labeled";
    case EventType::kCopyFrame: return "copy_frame";
    case EventType::kPasteFrame: return "paste_frame";
  }
  return "unknown";
}

EventType ParseEventType(const std::string& name) {
  for (const EventType t : kAllEvents) {
    if (name == EventTypeName(t)) return t;
  }
  Throw(__FILE__, __LINE__, "Unknown event type: " + name);
}

}  // namespace mvlabel::annotation
