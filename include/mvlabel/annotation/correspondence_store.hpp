#pragma once

#include <mvlabel/types.hpp>

#include <Eigen/Core>

#include <cstddef>
#include <vector>

namespace mvlabel::annotation {

// Everything the store holds for one frame. Frames are independent of each
// other, so a FrameState can be restored into any frame of a store with the
// same marker and camera counts.
struct FrameState {
  int num_markers = 0;
  int num_cameras = 0;
  std::vector<Observation> observations;          // [marker][camera]
  std::vector<Eigen::Vector2d> initial_positions;  // [marker][camera]
  std::vector<Eigen::Vector3d> world_points;       // [marker]
};

// Authoritative per-(marker, camera, frame) annotation state plus the
// per-(marker, frame) world points derived from it. Storage is dense and
// frame-major so that each frame is one contiguous slice.
//
// Invariant: an observation has a position iff its status is Initialized or
// Labeled; hand_labeled implies Labeled.
class CorrespondenceStore {
 public:
  CorrespondenceStore() = default;
  CorrespondenceStore(int num_markers, int num_cameras, int num_frames, int num_animals = 1,
                      int rounding_decimals = 3);

  int num_markers() const noexcept { return num_markers_; }
  int num_cameras() const noexcept { return num_cameras_; }
  int num_frames() const noexcept { return num_frames_; }
  int num_animals() const noexcept { return num_animals_; }
  int markers_per_animal() const noexcept { return num_markers_ / num_animals_; }
  int rounding_decimals() const noexcept { return rounding_decimals_; }

  const Observation& observation(MarkerId m, CameraId c, FrameId f) const;

  // Positions are dropped for Unlabeled/Invisible; Initialized/Labeled need a finite
  // position. hand_labeled is kept only for Labeled.
  void SetObservation(MarkerId m, CameraId c, FrameId f, const Eigen::Vector2d& uv_px,
                      LabelStatus status, bool hand_labeled = false);

  // Writes a complete observation after checking it against the invariant.
  void PutObservation(MarkerId m, CameraId c, FrameId f, const Observation& obs);

  void ClearObservation(MarkerId m, CameraId c, FrameId f);

  // Cameras whose status is Initialized or Labeled, ascending.
  std::vector<CameraId> EligibleCameras(MarkerId m, FrameId f) const;
  bool IsTriangulatable(MarkerId m, FrameId f) const;
  std::vector<MarkerId> TriangulatableMarkers(FrameId f) const;

  // All cameras -> Invisible, positions and the world point cleared.
  void MarkInvisible(MarkerId m, FrameId f);
  // Invisible cameras -> Unlabeled.
  void ClearInvisible(MarkerId m, FrameId f);
  bool IsInvisible(MarkerId m, FrameId f) const;

  const Eigen::Vector2d& initial_position(MarkerId m, CameraId c, FrameId f) const;
  void SetInitialPosition(MarkerId m, CameraId c, FrameId f, const Eigen::Vector2d& uv_px);
  void ClearInitialPositions(FrameId f);

  // Unlabeled without a current position; Labeled if there is no initial position
  // or the two differ after rounding; Initialized otherwise.
  LabelStatus DeriveStatus(const Eigen::Vector2d& current_px, const Eigen::Vector2d& initial_px) const;

  // Re-derives status from position vs. initial position. Invisible observations
  // are left untouched.
  void RederiveStatus(MarkerId m, CameraId c, FrameId f);
  void RederiveStatus(FrameId f);

  // Stores a position that did not come from the user and derives its status.
  // Invisible observations are left untouched.
  void SetDerivedPosition(MarkerId m, CameraId c, FrameId f, const Eigen::Vector2d& uv_px);

  const Eigen::Vector3d& world_point(MarkerId m, FrameId f) const;
  bool HasWorldPoint(MarkerId m, FrameId f) const { return world_point(m, f).allFinite(); }
  void SetWorldPoint(MarkerId m, FrameId f, const Eigen::Vector3d& X);
  void ClearWorldPoint(MarkerId m, FrameId f);

  FrameState CopyFrame(FrameId f) const;
  void RestoreFrame(FrameId f, const FrameState& state);

  void CheckMarker(MarkerId m) const;
  void CheckCamera(CameraId c) const;
  void CheckFrame(FrameId f) const;

 private:
  std::size_t ObsIndex(MarkerId m, CameraId c, FrameId f) const {
    return (static_cast<std::size_t>(f) * num_markers_ + m) * num_cameras_ + c;
  }
  std::size_t PointIndex(MarkerId m, FrameId f) const {
    return static_cast<std::size_t>(f) * num_markers_ + m;
  }

  int num_markers_ = 0;
  int num_cameras_ = 0;
  int num_frames_ = 0;
  int num_animals_ = 1;
  int rounding_decimals_ = 3;

  std::vector<Observation> observations_;
  std::vector<Eigen::Vector2d> initial_;
  std::vector<Eigen::Vector3d> world_;
};

double RoundToDecimals(double v, int decimals);

}  // namespace mvlabel::annotation
