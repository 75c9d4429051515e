#include <mvlabel/annotation/correspondence_store.hpp>
#include <mvlabel/common.hpp>

#include <cmath>
#include <string>

namespace mvlabel::annotation {

double RoundToDecimals(double v, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(v * scale) / scale;
}

CorrespondenceStore::CorrespondenceStore(int num_markers, int num_cameras, int num_frames,
                                         int num_animals, int rounding_decimals)
    : num_markers_(num_markers),
      num_cameras_(num_cameras),
      num_frames_(num_frames),
      num_animals_(num_animals),
      rounding_decimals_(rounding_decimals) {
  MVLABEL_REQUIRE(num_markers > 0, "CorrespondenceStore: num_markers must be > 0");
  MVLABEL_REQUIRE(num_cameras > 0, "CorrespondenceStore: num_cameras must be > 0");
  MVLABEL_REQUIRE(num_frames > 0, "CorrespondenceStore: num_frames must be > 0");
  MVLABEL_REQUIRE(num_animals > 0, "CorrespondenceStore: num_animals must be > 0");
  MVLABEL_REQUIRE(num_markers % num_animals == 0,
                  "CorrespondenceStore: num_markers (" + std::to_string(num_markers) +
                      ") is not a multiple of num_animals (" + std::to_string(num_animals) + ")");
  MVLABEL_REQUIRE(rounding_decimals >= 0, "CorrespondenceStore: negative rounding_decimals");

  const std::size_t n_obs =
      static_cast<std::size_t>(num_markers) * num_cameras * static_cast<std::size_t>(num_frames);
  observations_.assign(n_obs, Observation());
  initial_.assign(n_obs, MissingPoint2d());
  world_.assign(static_cast<std::size_t>(num_markers) * num_frames, MissingPoint3d());
}

void CorrespondenceStore::CheckMarker(MarkerId m) const {
  MVLABEL_REQUIRE(m >= 0 && m < num_markers_, "Invalid marker id " + std::to_string(m));
}

void CorrespondenceStore::CheckCamera(CameraId c) const {
  MVLABEL_REQUIRE(c >= 0 && c < num_cameras_, "Invalid camera id " + std::to_string(c));
}

void CorrespondenceStore::CheckFrame(FrameId f) const {
  MVLABEL_REQUIRE(f >= 0 && f < num_frames_, "Invalid frame id " + std::to_string(f));
}

const Observation& CorrespondenceStore::observation(MarkerId m, CameraId c, FrameId f) const {
  CheckMarker(m);
  CheckCamera(c);
  CheckFrame(f);
  return observations_[ObsIndex(m, c, f)];
}

void CorrespondenceStore::SetObservation(MarkerId m, CameraId c, FrameId f,
                                         const Eigen::Vector2d& uv_px, LabelStatus status,
                                         bool hand_labeled) {
  Observation obs;
  obs.status = status;
  if (IsEligibleStatus(status)) {
    obs.uv_px = uv_px;
    obs.hand_labeled = hand_labeled && status == LabelStatus::kLabeled;
  }
  PutObservation(m, c, f, obs);
}

void CorrespondenceStore::PutObservation(MarkerId m, CameraId c, FrameId f, const Observation& obs) {
  CheckMarker(m);
  CheckCamera(c);
  CheckFrame(f);
  MVLABEL_REQUIRE(obs.has_position() == IsEligibleStatus(obs.status),
                  std::string("Observation position does not match status ") +
                      LabelStatusName(obs.status));
  MVLABEL_REQUIRE(!obs.hand_labeled || obs.status == LabelStatus::kLabeled,
                  "Hand-labeled observation must be Labeled");
  observations_[ObsIndex(m, c, f)] = obs;
}

void CorrespondenceStore::ClearObservation(MarkerId m, CameraId c, FrameId f) {
  PutObservation(m, c, f, Observation());
}

std::vector<CameraId> CorrespondenceStore::EligibleCameras(MarkerId m, FrameId f) const {
  CheckMarker(m);
  CheckFrame(f);
  std::vector<CameraId> cams;
  for (CameraId c = 0; c < num_cameras_; ++c) {
    if (IsEligibleStatus(observations_[ObsIndex(m, c, f)].status)) cams.push_back(c);
  }
  return cams;
}

bool CorrespondenceStore::IsTriangulatable(MarkerId m, FrameId f) const {
  return EligibleCameras(m, f).size() >= 2;
}

std::vector<MarkerId> CorrespondenceStore::TriangulatableMarkers(FrameId f) const {
  CheckFrame(f);
  std::vector<MarkerId> markers;
  for (MarkerId m = 0; m < num_markers_; ++m) {
    if (IsTriangulatable(m, f)) markers.push_back(m);
  }
  return markers;
}

void CorrespondenceStore::MarkInvisible(MarkerId m, FrameId f) {
  CheckMarker(m);
  CheckFrame(f);
  Observation invisible;
  invisible.status = LabelStatus::kInvisible;
  for (CameraId c = 0; c < num_cameras_; ++c) {
    observations_[ObsIndex(m, c, f)] = invisible;
  }
  world_[PointIndex(m, f)] = MissingPoint3d();
}

void CorrespondenceStore::ClearInvisible(MarkerId m, FrameId f) {
  CheckMarker(m);
  CheckFrame(f);
  for (CameraId c = 0; c < num_cameras_; ++c) {
    Observation& obs = observations_[ObsIndex(m, c, f)];
    if (obs.status == LabelStatus::kInvisible) obs = Observation();
  }
}

bool CorrespondenceStore::IsInvisible(MarkerId m, FrameId f) const {
  CheckMarker(m);
  CheckFrame(f);
  for (CameraId c = 0; c < num_cameras_; ++c) {
    if (observations_[ObsIndex(m, c, f)].status != LabelStatus::kInvisible) return false;
  }
  return true;
}

const Eigen::Vector2d& CorrespondenceStore::initial_position(MarkerId m, CameraId c, FrameId f) const {
  CheckMarker(m);
  CheckCamera(c);
  CheckFrame(f);
  return initial_[ObsIndex(m, c, f)];
}

void CorrespondenceStore::SetInitialPosition(MarkerId m, CameraId c, FrameId f,
                                             const Eigen::Vector2d& uv_px) {
  CheckMarker(m);
  CheckCamera(c);
  CheckFrame(f);
  initial_[ObsIndex(m, c, f)] = uv_px.allFinite() ? uv_px : MissingPoint2d();
}

void CorrespondenceStore::ClearInitialPositions(FrameId f) {
  CheckFrame(f);
  const std::size_t begin = ObsIndex(0, 0, f);
  const std::size_t end = begin + static_cast<std::size_t>(num_markers_) * num_cameras_;
  for (std::size_t i = begin; i < end; ++i) initial_[i] = MissingPoint2d();
}

LabelStatus CorrespondenceStore::DeriveStatus(const Eigen::Vector2d& current_px,
                                              const Eigen::Vector2d& initial_px) const {
  if (!current_px.allFinite()) return LabelStatus::kUnlabeled;
  if (!initial_px.allFinite()) return LabelStatus::kLabeled;

  for (int k = 0; k < 2; ++k) {
    if (RoundToDecimals(current_px(k), rounding_decimals_) !=
        RoundToDecimals(initial_px(k), rounding_decimals_)) {
      return LabelStatus::kLabeled;
    }
  }
  return LabelStatus::kInitialized;
}

void CorrespondenceStore::RederiveStatus(MarkerId m, CameraId c, FrameId f) {
  CheckMarker(m);
  CheckCamera(c);
  CheckFrame(f);
  const std::size_t idx = ObsIndex(m, c, f);
  Observation& obs = observations_[idx];
  if (obs.status == LabelStatus::kInvisible) return;

  obs.status = DeriveStatus(obs.uv_px, initial_[idx]);
  if (obs.status != LabelStatus::kLabeled) obs.hand_labeled = false;
}

void CorrespondenceStore::RederiveStatus(FrameId f) {
  CheckFrame(f);
  for (MarkerId m = 0; m < num_markers_; ++m) {
    for (CameraId c = 0; c < num_cameras_; ++c) {
      RederiveStatus(m, c, f);
    }
  }
}

void CorrespondenceStore::SetDerivedPosition(MarkerId m, CameraId c, FrameId f,
                                             const Eigen::Vector2d& uv_px) {
  CheckMarker(m);
  CheckCamera(c);
  CheckFrame(f);
  const std::size_t idx = ObsIndex(m, c, f);
  if (observations_[idx].status == LabelStatus::kInvisible) return;

  Observation obs;
  obs.status = DeriveStatus(uv_px, initial_[idx]);
  if (obs.status != LabelStatus::kUnlabeled) obs.uv_px = uv_px;
  observations_[idx] = obs;
}

const Eigen::Vector3d& CorrespondenceStore::world_point(MarkerId m, FrameId f) const {
  CheckMarker(m);
  CheckFrame(f);
  return world_[PointIndex(m, f)];
}

void CorrespondenceStore::SetWorldPoint(MarkerId m, FrameId f, const Eigen::Vector3d& X) {
  CheckMarker(m);
  CheckFrame(f);
  world_[PointIndex(m, f)] = X.allFinite() ? X : MissingPoint3d();
}

void CorrespondenceStore::ClearWorldPoint(MarkerId m, FrameId f) {
  CheckMarker(m);
  CheckFrame(f);
  world_[PointIndex(m, f)] = MissingPoint3d();
}

FrameState CorrespondenceStore::CopyFrame(FrameId f) const {
  CheckFrame(f);
  FrameState state;
  state.num_markers = num_markers_;
  state.num_cameras = num_cameras_;

  const std::size_t begin = ObsIndex(0, 0, f);
  const std::size_t count = static_cast<std::size_t>(num_markers_) * num_cameras_;
  state.observations.assign(observations_.begin() + begin, observations_.begin() + begin + count);
  state.initial_positions.assign(initial_.begin() + begin, initial_.begin() + begin + count);

  const std::size_t pbegin = PointIndex(0, f);
  state.world_points.assign(world_.begin() + pbegin, world_.begin() + pbegin + num_markers_);
  return state;
}

void CorrespondenceStore::RestoreFrame(FrameId f, const FrameState& state) {
  CheckFrame(f);
  MVLABEL_REQUIRE(state.num_markers == num_markers_ && state.num_cameras == num_cameras_,
                  "RestoreFrame: frame state shape mismatch");
  const std::size_t count = static_cast<std::size_t>(num_markers_) * num_cameras_;
  MVLABEL_REQUIRE(state.observations.size() == count && state.initial_positions.size() == count &&
                      state.world_points.size() == static_cast<std::size_t>(num_markers_),
                  "RestoreFrame: frame state size mismatch");

  const std::size_t begin = ObsIndex(0, 0, f);
  for (std::size_t i = 0; i < count; ++i) {
    observations_[begin + i] = state.observations[i];
    initial_[begin + i] = state.initial_positions[i];
  }
  const std::size_t pbegin = PointIndex(0, f);
  for (int m = 0; m < num_markers_; ++m) world_[pbegin + m] = state.world_points[m];
}

}  // namespace mvlabel::annotation
