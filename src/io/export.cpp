#include <mvlabel/io/export.hpp>
#include <mvlabel/common.hpp>

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <string>
#include <vector>

namespace mvlabel::io {

namespace {

int ToByte(double v) {
  return static_cast<int>(std::lround(255.0 * std::clamp(v, 0.0, 1.0)));
}

void WritePLYHeader(std::ofstream& out, std::size_t n) {
  out << "ply\nformat ascii 1.0\n";
  out << "element vertex " << n << "\n";
  out << "property float x\nproperty float y\nproperty float z\n";
  out << "property uchar red\nproperty uchar green\nproperty uchar blue\n";
  out << "end_header\n";
}

}  // namespace

bool ExportWorldPointsPLY(const std::string& path, const annotation::LabelSession& session, FrameId f) {
  const auto& store = session.store();
  std::vector<MarkerId> markers;
  for (MarkerId m = 0; m < store.num_markers(); ++m) {
    if (store.HasWorldPoint(m, f)) markers.push_back(m);
  }

  std::ofstream out(path);
  if (!out.is_open()) return false;

  WritePLYHeader(out, markers.size());
  out << std::setprecision(9);
  for (const MarkerId m : markers) {
    const Eigen::Vector3d& X = store.world_point(m, f);
    const Eigen::Vector3d rgb = session.skeleton().MarkerColor(m);
    out << static_cast<float>(X.x()) << " " << static_cast<float>(X.y()) << " "
        << static_cast<float>(X.z()) << " " << ToByte(rgb(0)) << " " << ToByte(rgb(1)) << " "
        << ToByte(rgb(2)) << "\n";
  }
  return true;
}

bool ExportCamerasPLY(const std::string& path, const std::vector<geometry::Camera>& cameras) {
  std::ofstream out(path);
  if (!out.is_open()) return false;

  WritePLYHeader(out, cameras.size());
  out << std::setprecision(9);
  for (const auto& cam : cameras) {
    const Eigen::Vector3d C = cam.world_pose().C;
    out << static_cast<float>(C.x()) << " " << static_cast<float>(C.y()) << " "
        << static_cast<float>(C.z()) << " 255 255 255\n";
  }
  return true;
}

bool ExportLabelData(const std::string& path, const annotation::LabelSession& session) {
  const auto& store = session.store();
  const int M = store.num_markers();
  const int C = store.num_cameras();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  std::vector<FrameId> labeled;
  for (FrameId f = 0; f < store.num_frames(); ++f) {
    if (session.IsFrameLabeled(f)) labeled.push_back(f);
  }
  const int n = static_cast<int>(labeled.size());

  cv::FileStorage st(path, cv::FileStorage::WRITE);
  if (!st.isOpened()) return false;

  // data_3d is shared by all cameras: world points of markers Labeled everywhere.
  cv::Mat data_3d(n, 3 * M, CV_64F, cv::Scalar(nan));
  cv::Mat data_frame(n, 1, CV_32S);
  for (int i = 0; i < n; ++i) {
    const FrameId f = labeled[i];
    data_frame.at<int>(i, 0) = session.frames_to_label()[f];
    for (MarkerId m = 0; m < M; ++m) {
      bool all_labeled = true;
      for (CameraId c = 0; c < C && all_labeled; ++c) {
        all_labeled = store.observation(m, c, f).status == LabelStatus::kLabeled;
      }
      if (!all_labeled) continue;
      const Eigen::Vector3d& X = store.world_point(m, f);
      for (int k = 0; k < 3; ++k) data_3d.at<double>(i, 3 * m + k) = X(k);
    }
  }

  st << "labelData" << "[";
  for (CameraId c = 0; c < C; ++c) {
    cv::Mat data_2d(n, 2 * M, CV_64F, cv::Scalar(nan));
    for (int i = 0; i < n; ++i) {
      for (MarkerId m = 0; m < M; ++m) {
        const Eigen::Vector2d uv = session.ProjectWorldPoint(m, c, labeled[i]);
        data_2d.at<double>(i, 2 * m) = uv.x();
        data_2d.at<double>(i, 2 * m + 1) = uv.y();
      }
    }
    st << "{:"
       << "camname" << ("Camera" + std::to_string(c + 1)) << "data_2d" << data_2d << "data_3d"
       << data_3d << "data_frame" << data_frame << "}";
  }
  st << "]";

  // [markers, cameras, 2, frames]
  const int sz[4] = {M, C, 2, store.num_frames()};
  cv::Mat hand(4, sz, CV_64F, cv::Scalar(nan));
  for (FrameId f = 0; f < store.num_frames(); ++f) {
    for (MarkerId m = 0; m < M; ++m) {
      for (CameraId c = 0; c < C; ++c) {
        const Observation& obs = store.observation(m, c, f);
        if (!obs.hand_labeled) continue;
        for (int k = 0; k < 2; ++k) {
          const int idx[4] = {m, c, k, f};
          hand.at<double>(idx) = obs.uv_px(k);
        }
      }
    }
  }
  st << "handLabeled2D" << hand;
  return true;
}

}  // namespace mvlabel::io
