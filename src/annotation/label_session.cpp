#include <mvlabel/annotation/label_session.hpp>
#include <mvlabel/annotation/identity.hpp>
#include <mvlabel/annotation/reprojection.hpp>
#include <mvlabel/common.hpp>

#include <iostream>
#include <string>
#include <utility>

#ifdef MVLABEL_USE_OPENMP
#include <omp.h>
#endif

namespace mvlabel::annotation {

namespace {

// Runs fn against frame f and puts the frame back if it throws.
template <typename Fn>
auto WithFrameRollback(CorrespondenceStore* store, FrameId f, Fn&& fn) -> decltype(fn()) {
  const FrameState backup = store->CopyFrame(f);
  try {
    return fn();
  } catch (...) {
    store->RestoreFrame(f, backup);
    throw;
  }
}

const Observation& FrameObservation(const FrameState& state, MarkerId m, CameraId c) {
  return state.observations[static_cast<std::size_t>(m) * state.num_cameras + c];
}

}  // namespace

LabelSession::LabelSession(std::vector<geometry::RawCalibration> calibrations, Skeleton skeleton,
                           std::vector<int> frames_to_label, const SessionConfig& cfg)
    : cfg_(cfg),
      raw_(std::move(calibrations)),
      skeleton_(std::move(skeleton)),
      frames_to_label_(std::move(frames_to_label)) {
  MVLABEL_REQUIRE(!raw_.empty(), "LabelSession: no cameras");
  MVLABEL_REQUIRE(skeleton_.num_markers() > 0, "LabelSession: skeleton has no joints");
  MVLABEL_REQUIRE(!frames_to_label_.empty(), "LabelSession: no frames to label");
  skeleton_.Validate();

  cameras_ = geometry::ResolvePoses(raw_, cfg_.calibration);
  store_ = CorrespondenceStore(skeleton_.num_markers(), static_cast<int>(cameras_.size()),
                               static_cast<int>(frames_to_label_.size()), cfg_.num_animals,
                               cfg_.status.rounding_decimals);

  if (cfg_.verbose) {
    std::cerr << "[mvlabel] session: cameras=" << num_cameras() << " markers=" << num_markers()
              << " animals=" << cfg_.num_animals << " frames=" << num_frames() << "\n";
  }
}

MarkerId LabelSession::ResolveMarker(MarkerId m) const {
  return m < 0 ? selected_marker_ : m;
}

void LabelSession::SelectMarker(MarkerId m) {
  store_.CheckMarker(m);
  selected_marker_ = m;
}

void LabelSession::Click(MarkerId m, CameraId c, FrameId f, const Eigen::Vector2d& uv_px) {
  MVLABEL_REQUIRE(uv_px.allFinite(), "Click: position must be finite");
  const LabelStatus status = store_.DeriveStatus(uv_px, store_.initial_position(m, c, f));
  store_.SetObservation(m, c, f, uv_px, status, status == LabelStatus::kLabeled);
}

void LabelSession::DeleteObservation(MarkerId m, CameraId c, FrameId f) {
  store_.ClearObservation(m, c, f);
}

void LabelSession::ResetMarker(MarkerId m, FrameId f) {
  store_.CheckMarker(m);
  for (CameraId c = 0; c < num_cameras(); ++c) store_.ClearObservation(m, c, f);
  store_.ClearWorldPoint(m, f);
}

void LabelSession::ResetFrame(FrameId f) {
  store_.CheckFrame(f);
  for (MarkerId m = 0; m < num_markers(); ++m) ResetMarker(m, f);
  store_.ClearInitialPositions(f);
}

void LabelSession::ToggleInvisible(MarkerId m, FrameId f) {
  bool any_invisible = false;
  for (CameraId c = 0; c < num_cameras(); ++c) {
    if (store_.observation(m, c, f).status == LabelStatus::kInvisible) any_invisible = true;
  }
  if (any_invisible) {
    store_.ClearInvisible(m, f);
  } else {
    store_.MarkInvisible(m, f);
  }
  if (cfg_.verbose) {
    std::cerr << "[mvlabel] marker " << m << " frame " << f
              << (any_invisible ? " visible again\n" : " marked invisible\n");
  }
}

Eigen::Vector2d LabelSession::TriangulationInput(CameraId c, const Eigen::Vector2d& uv_px,
                                                 bool* fallback) const {
  *fallback = false;
  if (cfg_.undistorted_images) return uv_px;
  const geometry::Camera& cam = cameras_[c];
  if (!cam.intrinsics().HasDistortion()) return uv_px;

  const geometry::UndistortResult u = cam.UndistortPixel(uv_px, cfg_.undistort);
  if (!u.converged) {
    *fallback = true;
    std::cerr << "[mvlabel] warning: undistortion did not converge in camera " << c << " at ("
              << uv_px.x() << ", " << uv_px.y() << "), using the distorted coordinate\n";
  }
  return u.uv_px;
}

void LabelSession::ReprojectAndRestore(MarkerId m, FrameId f, const FrameState& before) {
  ReprojectAll(m, f, cameras_, !cfg_.undistorted_images, &store_);
  for (CameraId c = 0; c < num_cameras(); ++c) {
    const Observation& raw = FrameObservation(before, m, c);
    if (IsEligibleStatus(raw.status)) store_.PutObservation(m, c, f, raw);
  }
}

TriangulationReport LabelSession::Triangulate(FrameId f) {
  store_.CheckFrame(f);
  return WithFrameRollback(&store_, f, [&]() {
    const FrameState before = store_.CopyFrame(f);

    geometry::TriangulationOptions opt;
    opt.homogeneous_epsilon = cfg_.triangulation.homogeneous_epsilon;

    TriangulationReport report;
    std::vector<MarkerId> solved;
    std::vector<Eigen::Vector3d> points;
    for (MarkerId m = 0; m < num_markers(); ++m) {
      const std::vector<CameraId> cams = store_.EligibleCameras(m, f);
      if (cams.size() < 2) {
        if (cams.size() == 1) report.insufficient++;
        continue;
      }

      std::vector<ViewObservation> views;
      views.reserve(cams.size());
      for (const CameraId c : cams) {
        bool fallback = false;
        ViewObservation v;
        v.camera = c;
        v.uv_px = TriangulationInput(c, store_.observation(m, c, f).uv_px, &fallback);
        if (fallback) report.undistort_fallbacks++;
        views.push_back(v);
      }

      const geometry::TriangulationResult r = geometry::TriangulateMultiview(cameras_, views, opt);
      if (!r.success) {
        if (r.error == ErrorCode::kDegenerateGeometry) {
          report.degenerate++;
          std::cerr << "[mvlabel] warning: degenerate geometry for marker " << m << " frame " << f
                    << ", keeping the previous 3-D point\n";
        } else {
          report.insufficient++;
        }
        continue;
      }
      solved.push_back(m);
      points.push_back(r.X);
    }

    for (std::size_t i = 0; i < solved.size(); ++i) {
      store_.SetWorldPoint(solved[i], f, points[i]);
      ReprojectAndRestore(solved[i], f, before);
    }
    report.triangulated = static_cast<int>(solved.size());

    if (cfg_.verbose) {
      std::cerr << "[mvlabel] triangulate frame " << f << ": solved=" << report.triangulated
                << " insufficient=" << report.insufficient << " degenerate=" << report.degenerate
                << "\n";
    }
    return report;
  });
}

geometry::TriangulationResult LabelSession::ForceTriangulate(CameraId held_camera, MarkerId m, FrameId f,
                                                             const Eigen::Vector2d& uv_px) {
  store_.CheckCamera(held_camera);
  return WithFrameRollback(&store_, f, [&]() {
    Click(m, held_camera, f, uv_px);
    const FrameState before = store_.CopyFrame(f);

    geometry::TriangulationResult r;
    const std::vector<CameraId> cams = store_.EligibleCameras(m, f);
    if (cams.size() < 2) {
      r.error = ErrorCode::kInsufficientViews;
      r.num_views = static_cast<int>(cams.size());
      return r;
    }

    std::vector<ViewObservation> views;
    views.reserve(cams.size());
    for (const CameraId c : cams) {
      bool fallback = false;
      ViewObservation v;
      v.camera = c;
      v.uv_px = TriangulationInput(c, store_.observation(m, c, f).uv_px, &fallback);
      views.push_back(v);
    }

    geometry::TriangulationOptions opt;
    opt.homogeneous_epsilon = cfg_.triangulation.homogeneous_epsilon;
    r = geometry::ForceTriangulateMultiview(cameras_, views, held_camera, opt);
    if (!r.success) {
      std::cerr << "[mvlabel] warning: forced triangulation failed for marker " << m << " frame " << f
                << " (" << ErrorCodeName(r.error) << ")\n";
      return r;
    }

    store_.SetWorldPoint(m, f, r.X);
    ReprojectAndRestore(m, f, before);
    return r;
  });
}

TriangulationReport LabelSession::SwapIdentities(CameraId c, FrameId f) {
  MVLABEL_REQUIRE_CODE(store_.num_animals() == 2, ErrorCode::kUnsupportedAnimalCount,
                       "SwapIdentities needs exactly 2 animals, session has " +
                           std::to_string(store_.num_animals()));
  return WithFrameRollback(&store_, f, [&]() {
    SwapAnimals(c, f, AnimalRange(store_, 0), AnimalRange(store_, 1), &store_);
    for (MarkerId m = 0; m < num_markers(); ++m) store_.RederiveStatus(m, c, f);
    if (cfg_.verbose) std::cerr << "[mvlabel] swapped identities in camera " << c << " frame " << f << "\n";
    return Triangulate(f);
  });
}

void LabelSession::SetFrameLabeled(FrameId f) {
  store_.CheckFrame(f);
  for (MarkerId m = 0; m < num_markers(); ++m) {
    for (CameraId c = 0; c < num_cameras(); ++c) {
      Observation obs = store_.observation(m, c, f);
      if (!obs.has_position()) continue;
      obs.status = LabelStatus::kLabeled;
      store_.PutObservation(m, c, f, obs);
    }
  }
}

void LabelSession::CopyFrame(FrameId f) {
  clipboard_ = store_.CopyFrame(f);
}

void LabelSession::PasteFrame(FrameId f) {
  MVLABEL_REQUIRE(clipboard_.has_value(), "PasteFrame: nothing has been copied");
  store_.RestoreFrame(f, *clipboard_);
}

void LabelSession::LoadFrom3D(const Eigen::MatrixXd& points_3d) {
  MVLABEL_REQUIRE(points_3d.rows() == num_frames() && points_3d.cols() == 3 * num_markers(),
                  "LoadFrom3D: expected a " + std::to_string(num_frames()) + " x " +
                      std::to_string(3 * num_markers()) + " matrix, got " +
                      std::to_string(points_3d.rows()) + " x " + std::to_string(points_3d.cols()));
  const bool distort = !cfg_.undistorted_images;

  int loaded = 0;
  for (FrameId f = 0; f < num_frames(); ++f) {
    for (MarkerId m = 0; m < num_markers(); ++m) {
      const Eigen::Vector3d X = points_3d.block<1, 3>(f, 3 * m).transpose();
      if (!X.allFinite()) continue;

      bool has_labeled = false;
      for (CameraId c = 0; c < num_cameras(); ++c) {
        if (store_.observation(m, c, f).status == LabelStatus::kLabeled) has_labeled = true;
      }
      if (has_labeled) continue;

      // A marker with no camera left to initialize keeps no world point.
      int written = 0;
      for (CameraId c = 0; c < num_cameras(); ++c) {
        if (store_.observation(m, c, f).status == LabelStatus::kInvisible) continue;
        const Eigen::Vector2d uv = Reproject(X, cameras_[c], distort);
        if (!uv.allFinite()) continue;
        store_.SetInitialPosition(m, c, f, uv);
        store_.SetObservation(m, c, f, uv, LabelStatus::kInitialized);
        written++;
      }
      if (written == 0) continue;
      store_.SetWorldPoint(m, f, X);
      loaded++;
    }
  }

  if (cfg_.verbose) std::cerr << "[mvlabel] loaded " << loaded << " world points from 3-D data\n";
}

TriangulationReport LabelSession::TriangulateAll() {
  const int n = num_frames();
  std::vector<TriangulationReport> reports(n);
  std::vector<std::string> errors(n);

#ifdef MVLABEL_USE_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
  for (int f = 0; f < n; ++f) {
    try {
      reports[f] = Triangulate(f);
    } catch (const std::exception& e) {
      errors[f] = e.what();
    }
  }

  TriangulationReport total;
  for (int f = 0; f < n; ++f) {
    MVLABEL_REQUIRE(errors[f].empty(), "TriangulateAll: frame " + std::to_string(f) + ": " + errors[f]);
    total += reports[f];
  }
  if (cfg_.verbose) {
    std::cerr << "[mvlabel] triangulated all frames: solved=" << total.triangulated
              << " insufficient=" << total.insufficient << " degenerate=" << total.degenerate << "\n";
  }
  return total;
}

std::optional<TriangulationReport> LabelSession::Apply(const AnnotationEvent& event) {
  const MarkerId m = ResolveMarker(event.marker);
  switch (event.type) {
    case EventType::kSelectMarker:
      SelectMarker(m);
      return std::nullopt;
    case EventType::kClick:
      Click(m, event.camera, event.frame, event.uv_px);
      return std::nullopt;
    case EventType::kDrag: {
      const geometry::TriangulationResult r = ForceTriangulate(event.camera, m, event.frame, event.uv_px);
      TriangulationReport report;
      if (r.success) {
        report.triangulated = 1;
      } else if (r.error == ErrorCode::kDegenerateGeometry) {
        report.degenerate = 1;
      } else if (r.error == ErrorCode::kInsufficientViews) {
        report.insufficient = 1;
      }
      return report;
    }
    case EventType::kDelete:
      DeleteObservation(m, event.camera, event.frame);
      return std::nullopt;
    case EventType::kTriangulate:
      return Triangulate(event.frame);
    case EventType::kSwapIdentities:
      return SwapIdentities(event.camera, event.frame);
    case EventType::kToggleInvisible:
      ToggleInvisible(m, event.frame);
      return std::nullopt;
    case EventType::kResetMarker:
      ResetMarker(m, event.frame);
      return std::nullopt;
    case EventType::kResetFrame:
      ResetFrame(event.frame);
      return std::nullopt;
    case EventType::kSetFrameLabeled:
      SetFrameLabeled(event.frame);
      return std::nullopt;
    case EventType::kCopyFrame:
      CopyFrame(event.frame);
      return std::nullopt;
    case EventType::kPasteFrame:
      PasteFrame(event.frame);
      return std::nullopt;
  }
  Throw(__FILE__, __LINE__, "Apply: unhandled event type");
}

bool LabelSession::IsFrameLabeled(FrameId f) const {
  store_.CheckFrame(f);
  for (MarkerId m = 0; m < num_markers(); ++m) {
    bool all_labeled = true;
    for (CameraId c = 0; c < num_cameras() && all_labeled; ++c) {
      all_labeled = store_.observation(m, c, f).status == LabelStatus::kLabeled;
    }
    if (all_labeled) return true;
  }
  return false;
}

int LabelSession::LabeledFrameCount() const {
  int count = 0;
  for (FrameId f = 0; f < num_frames(); ++f) {
    if (IsFrameLabeled(f)) count++;
  }
  return count;
}

Eigen::Vector2d LabelSession::ProjectWorldPoint(MarkerId m, CameraId c, FrameId f) const {
  store_.CheckCamera(c);
  const Eigen::Vector3d& X = store_.world_point(m, f);
  if (!X.allFinite()) return MissingPoint2d();
  return Reproject(X, cameras_[c], !cfg_.undistorted_images);
}

}  // namespace mvlabel::annotation
