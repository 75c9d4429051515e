#include <mvlabel/io/session_io.hpp>
#include <mvlabel/common.hpp>

#include <opencv2/core.hpp>

#include <initializer_list>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace mvlabel::io {

namespace fs = std::filesystem;

using annotation::CorrespondenceStore;
using annotation::LabelSession;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

cv::Mat ToMat(const Eigen::Matrix3d& A) {
  cv::Mat M(3, 3, CV_64F);
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      M.at<double>(r, c) = A(r, c);
    }
  }
  return M;
}

Eigen::Matrix3d ToMatrix3d(const cv::Mat& M, const std::string& what) {
  MVLABEL_REQUIRE(M.rows == 3 && M.cols == 3, "Invalid 3x3 matrix: " + what);
  cv::Mat Md;
  M.convertTo(Md, CV_64F);
  Eigen::Matrix3d A;
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      A(r, c) = Md.at<double>(r, c);
    }
  }
  return A;
}

// Flattens a 1xN or Nx1 matrix.
std::vector<double> ToVector(const cv::Mat& M) {
  cv::Mat Md;
  M.convertTo(Md, CV_64F);
  std::vector<double> v;
  v.reserve(Md.total());
  for (int r = 0; r < Md.rows; ++r) {
    for (int c = 0; c < Md.cols; ++c) {
      v.push_back(Md.at<double>(r, c));
    }
  }
  return v;
}

geometry::PoseConvention ParseConvention(const std::string& name) {
  if (name.empty() || name == geometry::PoseConventionName(geometry::PoseConvention::kRowVector)) {
    return geometry::PoseConvention::kRowVector;
  }
  if (name == geometry::PoseConventionName(geometry::PoseConvention::kColumnVector)) {
    return geometry::PoseConvention::kColumnVector;
  }
  Throw(ErrorCode::kInvalidCalibration, __FILE__, __LINE__, "Unknown pose convention: " + name);
}

void WriteCalibrations(cv::FileStorage& st, const std::vector<geometry::RawCalibration>& raws) {
  st << "camParams" << "[";
  for (const auto& raw : raws) {
    cv::Mat radial(1, static_cast<int>(raw.radial_distortion.size()), CV_64F);
    for (int k = 0; k < radial.cols; ++k) radial.at<double>(0, k) = raw.radial_distortion[k];
    cv::Mat tangential = (cv::Mat_<double>(1, 2) << raw.tangential_distortion.x(),
                          raw.tangential_distortion.y());
    cv::Mat t = (cv::Mat_<double>(1, 3) << raw.t.x(), raw.t.y(), raw.t.z());

    st << "{:"
       << "K" << ToMat(raw.K) << "RDistort" << radial << "TDistort" << tangential << "r"
       << ToMat(raw.r) << "t" << t << "image_height" << raw.image_height_px << "image_width"
       << raw.image_width_px << "convention" << geometry::PoseConventionName(raw.convention)
       << "}";
  }
  st << "]";
}

std::vector<geometry::RawCalibration> ReadCalibrations(const cv::FileNode& node) {
  MVLABEL_REQUIRE_CODE(!node.empty() && node.isSeq(), ErrorCode::kIo, "Session file has no camParams");

  std::vector<geometry::RawCalibration> raws;
  for (auto it = node.begin(); it != node.end(); ++it) {
    geometry::RawCalibration raw;
    cv::Mat K;
    cv::Mat r;
    cv::Mat t;
    cv::Mat radial;
    cv::Mat tangential;
    (*it)["K"] >> K;
    (*it)["r"] >> r;
    (*it)["t"] >> t;
    (*it)["RDistort"] >> radial;
    (*it)["TDistort"] >> tangential;

    raw.K = ToMatrix3d(K, "camParams.K");
    raw.r = ToMatrix3d(r, "camParams.r");

    const std::vector<double> tv = ToVector(t);
    MVLABEL_REQUIRE_CODE(tv.size() == 3, ErrorCode::kInvalidCalibration,
                         "camParams.t must have 3 entries");
    raw.t = Eigen::Vector3d(tv[0], tv[1], tv[2]);

    if (!radial.empty()) raw.radial_distortion = ToVector(radial);
    if (!tangential.empty()) {
      const std::vector<double> p = ToVector(tangential);
      MVLABEL_REQUIRE_CODE(p.size() == 2, ErrorCode::kInvalidCalibration,
                           "camParams.TDistort must have 2 entries");
      raw.tangential_distortion = Eigen::Vector2d(p[0], p[1]);
    }

    const cv::FileNode h = (*it)["image_height"];
    const cv::FileNode w = (*it)["image_width"];
    if (!h.empty()) h >> raw.image_height_px;
    if (!w.empty()) w >> raw.image_width_px;

    std::string convention;
    const cv::FileNode conv = (*it)["convention"];
    if (!conv.empty()) conv >> convention;
    raw.convention = ParseConvention(convention);

    raws.push_back(std::move(raw));
  }
  return raws;
}

void WriteSkeleton(cv::FileStorage& st, const Skeleton& skel) {
  const int n_seg = static_cast<int>(skel.segments.size());
  cv::Mat joints_idx(n_seg, 2, CV_32S);
  cv::Mat color(static_cast<int>(skel.segment_colors.size()), 3, CV_64F);
  cv::Mat marker_colors(static_cast<int>(skel.marker_colors.size()), 3, CV_64F);
  for (int i = 0; i < n_seg; ++i) {
    joints_idx.at<int>(i, 0) = skel.segments[i].from;
    joints_idx.at<int>(i, 1) = skel.segments[i].to;
  }
  for (int i = 0; i < color.rows; ++i) {
    for (int k = 0; k < 3; ++k) color.at<double>(i, k) = skel.segment_colors[i](k);
  }
  for (int i = 0; i < marker_colors.rows; ++i) {
    for (int k = 0; k < 3; ++k) marker_colors.at<double>(i, k) = skel.marker_colors[i](k);
  }

  st << "skeleton" << "{";
  st << "joint_names" << "[";
  for (const auto& name : skel.joint_names) st << name;
  st << "]";
  st << "joints_idx" << joints_idx << "color" << color << "marker_colors" << marker_colors;
  st << "}";
}

Skeleton ReadSkeleton(const cv::FileNode& node) {
  MVLABEL_REQUIRE_CODE(!node.empty(), ErrorCode::kIo, "Session file has no skeleton");
  Skeleton skel;

  const cv::FileNode names = node["joint_names"];
  for (auto it = names.begin(); it != names.end(); ++it) {
    skel.joint_names.push_back(static_cast<std::string>(*it));
  }

  cv::Mat joints_idx;
  cv::Mat color;
  cv::Mat marker_colors;
  node["joints_idx"] >> joints_idx;
  node["color"] >> color;
  node["marker_colors"] >> marker_colors;

  if (!joints_idx.empty()) {
    MVLABEL_REQUIRE(joints_idx.cols == 2, "Invalid skeleton.joints_idx matrix");
    joints_idx.convertTo(joints_idx, CV_32S);
    for (int i = 0; i < joints_idx.rows; ++i) {
      skel.segments.push_back(Segment{joints_idx.at<int>(i, 0), joints_idx.at<int>(i, 1)});
    }
  }
  auto read_colors = [](const cv::Mat& M, std::vector<Eigen::Vector3d>* out) {
    if (M.empty()) return;
    MVLABEL_REQUIRE(M.cols == 3, "Invalid skeleton color matrix");
    cv::Mat Md;
    M.convertTo(Md, CV_64F);
    for (int i = 0; i < Md.rows; ++i) {
      out->emplace_back(Md.at<double>(i, 0), Md.at<double>(i, 1), Md.at<double>(i, 2));
    }
  };
  read_colors(color, &skel.segment_colors);
  read_colors(marker_colors, &skel.marker_colors);
  return skel;
}

// [nFrames, 3 * nMarkers], NaN where `keep` is false or there is no world point.
template <typename Keep>
cv::Mat WorldPointTable(const CorrespondenceStore& store, Keep keep) {
  cv::Mat M(store.num_frames(), 3 * store.num_markers(), CV_64F, cv::Scalar(kNaN));
  for (FrameId f = 0; f < store.num_frames(); ++f) {
    for (MarkerId m = 0; m < store.num_markers(); ++m) {
      if (!keep(m, f)) continue;
      const Eigen::Vector3d& X = store.world_point(m, f);
      for (int k = 0; k < 3; ++k) M.at<double>(f, 3 * m + k) = X(k);
    }
  }
  return M;
}

bool LabeledInAllCameras(const CorrespondenceStore& store, MarkerId m, FrameId f) {
  for (CameraId c = 0; c < store.num_cameras(); ++c) {
    if (store.observation(m, c, f).status != LabelStatus::kLabeled) return false;
  }
  return true;
}

Eigen::MatrixXd ToEigen(const cv::Mat& M) {
  cv::Mat Md;
  M.convertTo(Md, CV_64F);
  Eigen::MatrixXd A(Md.rows, Md.cols);
  for (int r = 0; r < Md.rows; ++r) {
    for (int c = 0; c < Md.cols; ++c) {
      A(r, c) = Md.at<double>(r, c);
    }
  }
  return A;
}

// [nMarkers, nCams, 2, nFrames]
cv::Mat PixelTable(const CorrespondenceStore& store) {
  const int sz[4] = {store.num_markers(), store.num_cameras(), 2, store.num_frames()};
  return cv::Mat(4, sz, CV_64F, cv::Scalar(kNaN));
}

void SetPixel(cv::Mat* table, MarkerId m, CameraId c, FrameId f, const Eigen::Vector2d& uv) {
  for (int k = 0; k < 2; ++k) {
    const int idx[4] = {m, c, k, f};
    table->at<double>(idx) = uv(k);
  }
}

Eigen::Vector2d GetPixel(const cv::Mat& table, MarkerId m, CameraId c, FrameId f) {
  Eigen::Vector2d uv;
  for (int k = 0; k < 2; ++k) {
    const int idx[4] = {m, c, k, f};
    uv(k) = table.at<double>(idx);
  }
  return uv;
}

bool HasShape(const cv::Mat& M, std::initializer_list<int> dims) {
  if (M.dims != static_cast<int>(dims.size())) return false;
  int i = 0;
  for (const int d : dims) {
    if (M.size[i++] != d) return false;
  }
  return true;
}

cv::Mat ReadPixelTable(const cv::FileStorage& st, const char* key, const CorrespondenceStore& store) {
  cv::Mat M;
  st[key] >> M;
  if (M.empty()) return M;
  MVLABEL_REQUIRE_CODE(
      HasShape(M, {store.num_markers(), store.num_cameras(), 2, store.num_frames()}), ErrorCode::kIo,
      std::string("Session field ") + key + " has the wrong shape");
  if (M.type() != CV_64F) M.convertTo(M, CV_64F);
  return M;
}

Observation MakeObservation(LabelStatus status, const Eigen::Vector2d& uv, bool hand_labeled) {
  Observation obs;
  if (IsEligibleStatus(status) && uv.allFinite()) {
    obs.status = status;
    obs.uv_px = uv;
    obs.hand_labeled = hand_labeled && status == LabelStatus::kLabeled;
  } else if (status == LabelStatus::kInvisible) {
    obs.status = LabelStatus::kInvisible;
  }
  return obs;
}

}  // namespace

void EnsureDir(const fs::path& p) {
  if (p.empty()) return;
  std::error_code ec;
  fs::create_directories(p, ec);
  MVLABEL_REQUIRE_CODE(!ec, ErrorCode::kIo,
                       "Failed to create directory: " + p.string() + " (" + ec.message() + ")");
}

bool SaveSession(const fs::path& path, const LabelSession& session) {
  cv::FileStorage st(path.string(), cv::FileStorage::WRITE);
  if (!st.isOpened()) return false;

  const CorrespondenceStore& store = session.store();
  const int M = store.num_markers();
  const int C = store.num_cameras();
  const int F = store.num_frames();

  st << "n_animals" << store.num_animals();
  WriteCalibrations(st, session.calibrations());
  WriteSkeleton(st, session.skeleton());

  st << "framesToLabel" << "[";
  for (const int frame : session.frames_to_label()) st << frame;
  st << "]";

  const int status_sz[3] = {M, C, F};
  cv::Mat status(3, status_sz, CV_8U, cv::Scalar(0));
  cv::Mat data_2d = PixelTable(store);
  cv::Mat initial_2d = PixelTable(store);
  cv::Mat hand_labeled_2d = PixelTable(store);

  for (FrameId f = 0; f < F; ++f) {
    for (MarkerId m = 0; m < M; ++m) {
      for (CameraId c = 0; c < C; ++c) {
        const Observation& obs = store.observation(m, c, f);
        status.at<uchar>(m, c, f) = static_cast<uchar>(obs.status);
        if (obs.has_position()) SetPixel(&data_2d, m, c, f, obs.uv_px);
        if (obs.hand_labeled) SetPixel(&hand_labeled_2d, m, c, f, obs.uv_px);
        SetPixel(&initial_2d, m, c, f, store.initial_position(m, c, f));
      }
    }
  }

  st << "status" << status;
  st << "data_3D"
     << WorldPointTable(store, [&](MarkerId m, FrameId f) { return LabeledInAllCameras(store, m, f); });
  st << "points_3D" << WorldPointTable(store, [](MarkerId, FrameId) { return true; });
  st << "handLabeled2D" << hand_labeled_2d;
  st << "data_2D" << data_2d;
  st << "initial_2D" << initial_2d;
  return true;
}

std::unique_ptr<LabelSession> LoadSession(const fs::path& path, const SessionConfig& cfg) {
  cv::FileStorage st(path.string(), cv::FileStorage::READ);
  if (!st.isOpened()) return nullptr;

  SessionConfig session_cfg = cfg;
  const cv::FileNode n_animals = st["n_animals"];
  if (!n_animals.empty()) n_animals >> session_cfg.num_animals;

  std::vector<geometry::RawCalibration> raws = ReadCalibrations(st["camParams"]);
  Skeleton skeleton = ReadSkeleton(st["skeleton"]);

  cv::Mat status;
  st["status"] >> status;
  MVLABEL_REQUIRE_CODE(!status.empty() && status.dims == 3, ErrorCode::kIo,
                       "Session file has no [markers, cameras, frames] status array");
  MVLABEL_REQUIRE_CODE(status.size[0] == skeleton.num_markers() &&
                           status.size[1] == static_cast<int>(raws.size()),
                       ErrorCode::kIo, "Session status array does not match skeleton and cameras");
  if (status.type() != CV_8U) status.convertTo(status, CV_8U);
  const int num_frames = status.size[2];

  std::vector<int> frames_to_label;
  const cv::FileNode ftl = st["framesToLabel"];
  for (auto it = ftl.begin(); it != ftl.end(); ++it) frames_to_label.push_back(static_cast<int>(*it));
  if (frames_to_label.empty()) {
    for (int f = 0; f < num_frames; ++f) frames_to_label.push_back(f);
  }
  MVLABEL_REQUIRE_CODE(static_cast<int>(frames_to_label.size()) == num_frames, ErrorCode::kIo,
                       "framesToLabel does not match the frame count of the status array");

  auto session = std::make_unique<LabelSession>(std::move(raws), std::move(skeleton),
                                                std::move(frames_to_label), session_cfg);
  CorrespondenceStore* store = session->mutable_store();
  const int M = store->num_markers();
  const int C = store->num_cameras();
  const int F = store->num_frames();

  auto saved_status = [&](MarkerId m, CameraId c, FrameId f) {
    const int v = status.at<uchar>(m, c, f);
    MVLABEL_REQUIRE_CODE(v <= static_cast<int>(LabelStatus::kInvisible), ErrorCode::kIo,
                         "Invalid status value " + std::to_string(v));
    return static_cast<LabelStatus>(v);
  };

  const cv::Mat hand_labeled_2d = ReadPixelTable(st, "handLabeled2D", *store);
  const cv::Mat data_2d = ReadPixelTable(st, "data_2D", *store);
  const cv::Mat initial_2d = ReadPixelTable(st, "initial_2D", *store);

  cv::Mat points_3d;
  cv::Mat data_3d;
  st["points_3D"] >> points_3d;
  st["data_3D"] >> data_3d;
  for (const cv::Mat* table : {&points_3d, &data_3d}) {
    MVLABEL_REQUIRE_CODE(table->empty() || (table->rows == F && table->cols == 3 * M), ErrorCode::kIo,
                         "Session 3-D table has the wrong shape");
  }

  int dropped = 0;
  if (!data_2d.empty()) {
    for (FrameId f = 0; f < F; ++f) {
      for (MarkerId m = 0; m < M; ++m) {
        for (CameraId c = 0; c < C; ++c) {
          const LabelStatus s = saved_status(m, c, f);
          const bool hand = !hand_labeled_2d.empty() && GetPixel(hand_labeled_2d, m, c, f).allFinite();
          const Observation obs = MakeObservation(s, GetPixel(data_2d, m, c, f), hand);
          if (obs.status != s) dropped++;
          store->PutObservation(m, c, f, obs);
          if (!initial_2d.empty()) store->SetInitialPosition(m, c, f, GetPixel(initial_2d, m, c, f));
        }
      }
    }
    const Eigen::MatrixXd X = ToEigen(points_3d.empty() ? data_3d : points_3d);
    for (FrameId f = 0; f < X.rows(); ++f) {
      for (MarkerId m = 0; m < M; ++m) {
        store->SetWorldPoint(m, f, X.block<1, 3>(f, 3 * m).transpose());
      }
    }
  } else {
    if (!data_3d.empty()) session->LoadFrom3D(ToEigen(data_3d));
    for (FrameId f = 0; f < F; ++f) {
      for (MarkerId m = 0; m < M; ++m) {
        for (CameraId c = 0; c < C; ++c) {
          const LabelStatus s = saved_status(m, c, f);
          const Eigen::Vector2d hand =
              hand_labeled_2d.empty() ? MissingPoint2d() : GetPixel(hand_labeled_2d, m, c, f);
          Observation obs;
          if (hand.allFinite() && s == LabelStatus::kLabeled) {
            obs = MakeObservation(s, hand, true);
          } else {
            obs = MakeObservation(s, store->observation(m, c, f).uv_px, false);
          }
          if (obs.status != s) dropped++;
          store->PutObservation(m, c, f, obs);
        }
      }
    }
  }

  if (dropped > 0) {
    std::cerr << "[mvlabel] warning: " << dropped
              << " observations had a status without a position and were reset to unlabeled\n";
  }
  if (session->config().verbose) {
    std::cerr << "[mvlabel] loaded session " << path.string() << " labeled_frames="
              << session->LabeledFrameCount() << "\n";
  }
  return session;
}

std::unique_ptr<LabelSession> LoadMergedSessions(const std::vector<fs::path>& paths,
                                                 const SessionConfig& cfg) {
  MVLABEL_REQUIRE(!paths.empty(), "LoadMergedSessions: no files");

  std::vector<std::unique_ptr<LabelSession>> parts;
  std::vector<int> frames_to_label;
  for (const fs::path& p : paths) {
    std::unique_ptr<LabelSession> s = LoadSession(p, cfg);
    MVLABEL_REQUIRE_CODE(s != nullptr, ErrorCode::kIo, "Failed to open session file: " + p.string());

    if (!parts.empty()) {
      const LabelSession& first = *parts.front();
      MVLABEL_REQUIRE(s->skeleton().joint_names == first.skeleton().joint_names,
                      "LoadMergedSessions: skeleton of " + p.string() + " differs");
      MVLABEL_REQUIRE(s->store().num_animals() == first.store().num_animals(),
                      "LoadMergedSessions: animal count of " + p.string() + " differs");
      MVLABEL_REQUIRE(s->num_cameras() == first.num_cameras(),
                      "LoadMergedSessions: camera count of " + p.string() + " differs");
      for (CameraId c = 0; c < s->num_cameras(); ++c) {
        const Eigen::Matrix<double, 3, 4> Pa = s->cameras()[c].ProjectionMatrix();
        const Eigen::Matrix<double, 3, 4> Pb = first.cameras()[c].ProjectionMatrix();
        MVLABEL_REQUIRE(Pa.isApprox(Pb, 1e-9),
                        "LoadMergedSessions: camera " + std::to_string(c) + " of " + p.string() +
                            " differs");
      }
    }
    frames_to_label.insert(frames_to_label.end(), s->frames_to_label().begin(),
                           s->frames_to_label().end());
    parts.push_back(std::move(s));
  }

  const LabelSession& first = *parts.front();
  SessionConfig merged_cfg = cfg;
  merged_cfg.num_animals = first.store().num_animals();
  auto merged = std::make_unique<LabelSession>(first.calibrations(), first.skeleton(),
                                               std::move(frames_to_label), merged_cfg);

  FrameId offset = 0;
  for (const auto& part : parts) {
    for (FrameId f = 0; f < part->num_frames(); ++f) {
      merged->mutable_store()->RestoreFrame(offset + f, part->store().CopyFrame(f));
    }
    offset += part->num_frames();
  }

  if (cfg.verbose) {
    std::cerr << "[mvlabel] merged " << parts.size() << " sessions, frames=" << merged->num_frames() << "\n";
  }
  return merged;
}

}  // namespace mvlabel::io
