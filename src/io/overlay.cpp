#include <mvlabel/io/overlay.hpp>
#include <mvlabel/common.hpp>
#include <mvlabel/io/session_io.hpp>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace mvlabel::io {

namespace fs = std::filesystem;

namespace {

cv::Scalar ToBGR(const Eigen::Vector3d& rgb) {
  auto byte = [](double v) { return 255.0 * std::clamp(v, 0.0, 1.0); };
  return cv::Scalar(byte(rgb(2)), byte(rgb(1)), byte(rgb(0)));
}

cv::Point ToPoint(const Eigen::Vector2d& uv) {
  return cv::Point(cvRound(uv.x()), cvRound(uv.y()));
}

std::string OverlayName(CameraId c, int video_frame) {
  std::ostringstream oss;
  oss << "cam" << std::setw(2) << std::setfill('0') << c + 1 << "_" << std::setw(8) << std::setfill('0')
      << video_frame << ".jpg";
  return oss.str();
}

}  // namespace

cv::Mat RenderOverlay(const annotation::LabelSession& session, CameraId c, FrameId f, const cv::Mat& image) {
  MVLABEL_REQUIRE(!image.empty(), "RenderOverlay: empty image");
  const auto& store = session.store();
  const Skeleton& skel = session.skeleton();

  cv::Mat out;
  if (image.channels() == 1) {
    cv::cvtColor(image, out, cv::COLOR_GRAY2BGR);
  } else {
    out = image.clone();
  }

  const int radius = std::max(2, std::max(out.cols, out.rows) / 300);
  for (std::size_t i = 0; i < skel.segments.size(); ++i) {
    const Observation& a = store.observation(skel.segments[i].from, c, f);
    const Observation& b = store.observation(skel.segments[i].to, c, f);
    if (!a.has_position() || !b.has_position()) continue;
    const cv::Scalar color =
        i < skel.segment_colors.size() ? ToBGR(skel.segment_colors[i]) : cv::Scalar(255, 255, 255);
    cv::line(out, ToPoint(a.uv_px), ToPoint(b.uv_px), color, std::max(1, radius / 2), cv::LINE_AA);
  }

  for (MarkerId m = 0; m < store.num_markers(); ++m) {
    const Observation& obs = store.observation(m, c, f);
    if (!obs.has_position()) continue;
    const int thickness = obs.status == LabelStatus::kLabeled ? cv::FILLED : 1;
    cv::circle(out, ToPoint(obs.uv_px), radius, ToBGR(skel.MarkerColor(m)), thickness, cv::LINE_AA);
  }
  return out;
}

bool ExportOverlayImages(const std::string& out_dir, const annotation::LabelSession& session,
                         const FrameSource& source, FrameId f) {
  session.store().CheckFrame(f);
  if (source.num_cameras() != session.num_cameras()) return false;

  EnsureDir(out_dir);
  const int video_frame = session.frames_to_label()[f];
  for (CameraId c = 0; c < session.num_cameras(); ++c) {
    const cv::Mat img = source.ReadFrame(c, video_frame);
    const fs::path p = fs::path(out_dir) / OverlayName(c, video_frame);
    if (!cv::imwrite(p.string(), RenderOverlay(session, c, f, img))) return false;
  }
  return true;
}

}  // namespace mvlabel::io
