#include <mvlabel/io/event_script.hpp>
#include <mvlabel/common.hpp>

#include <opencv2/core.hpp>

namespace mvlabel::io {

std::vector<annotation::AnnotationEvent> LoadEventScript(const std::string& path) {
  cv::FileStorage st(path, cv::FileStorage::READ);
  MVLABEL_REQUIRE_CODE(st.isOpened(), ErrorCode::kIo, "Failed to open event script: " + path);

  std::vector<annotation::AnnotationEvent> events;
  const cv::FileNode list = st["events"];
  if (list.empty()) return events;
  MVLABEL_REQUIRE_CODE(list.isSeq(), ErrorCode::kIo, "events must be a list in " + path);

  for (auto it = list.begin(); it != list.end(); ++it) {
    const cv::FileNode node = *it;
    annotation::AnnotationEvent ev;

    std::string type;
    node["type"] >> type;
    ev.type = annotation::ParseEventType(type);

    const cv::FileNode frame = node["frame"];
    const cv::FileNode camera = node["camera"];
    const cv::FileNode marker = node["marker"];
    const cv::FileNode u = node["u"];
    const cv::FileNode v = node["v"];
    if (!frame.empty()) frame >> ev.frame;
    if (!camera.empty()) camera >> ev.camera;
    if (!marker.empty()) marker >> ev.marker;
    if (!u.empty() && !v.empty()) {
      ev.uv_px = Eigen::Vector2d(static_cast<double>(u), static_cast<double>(v));
    }
    events.push_back(ev);
  }
  return events;
}

bool SaveEventScript(const std::string& path, const std::vector<annotation::AnnotationEvent>& events) {
  cv::FileStorage st(path, cv::FileStorage::WRITE);
  if (!st.isOpened()) return false;

  st << "events" << "[";
  for (const auto& ev : events) {
    st << "{:" << "type" << annotation::EventTypeName(ev.type) << "frame" << ev.frame << "camera"
       << ev.camera << "marker" << ev.marker;
    if (ev.uv_px.allFinite()) st << "u" << ev.uv_px.x() << "v" << ev.uv_px.y();
    st << "}";
  }
  st << "]";
  return true;
}

}  // namespace mvlabel::io
