#pragma once

#include <mvlabel/annotation/correspondence_store.hpp>
#include <mvlabel/annotation/events.hpp>
#include <mvlabel/config.hpp>
#include <mvlabel/geometry/camera.hpp>
#include <mvlabel/geometry/triangulation.hpp>
#include <mvlabel/skeleton.hpp>
#include <mvlabel/types.hpp>

#include <Eigen/Core>

#include <optional>
#include <vector>

namespace mvlabel::annotation {

struct TriangulationReport {
  int triangulated = 0;
  int insufficient = 0;  // markers with exactly one eligible camera
  int degenerate = 0;
  int undistort_fallbacks = 0;

  TriangulationReport& operator+=(const TriangulationReport& o) {
    triangulated += o.triangulated;
    insufficient += o.insufficient;
    degenerate += o.degenerate;
    undistort_fallbacks += o.undistort_fallbacks;
    return *this;
  }
};

// One annotation session: calibrated cameras, the marker skeleton, the video
// frames being labeled, and the correspondence state for all of them.
//
// Every operation either completes or throws with the store unchanged.
// Geometric failures (too few views, degenerate rays) are not exceptions; they
// are counted in the returned report and leave the affected world points as
// they were.
class LabelSession {
 public:
  LabelSession(std::vector<geometry::RawCalibration> calibrations, Skeleton skeleton,
               std::vector<int> frames_to_label, const SessionConfig& cfg = SessionConfig());

  const SessionConfig& config() const noexcept { return cfg_; }
  const std::vector<geometry::RawCalibration>& calibrations() const noexcept { return raw_; }
  const std::vector<geometry::Camera>& cameras() const noexcept { return cameras_; }
  const Skeleton& skeleton() const noexcept { return skeleton_; }
  const std::vector<int>& frames_to_label() const noexcept { return frames_to_label_; }

  const CorrespondenceStore& store() const noexcept { return store_; }
  CorrespondenceStore* mutable_store() { return &store_; }

  int num_markers() const { return store_.num_markers(); }
  int num_cameras() const { return store_.num_cameras(); }
  int num_frames() const { return store_.num_frames(); }

  MarkerId selected_marker() const noexcept { return selected_marker_; }
  void SelectMarker(MarkerId m);

  // Direct placement by the user. Labeled and hand-labeled unless uv_px equals
  // the loaded initial position, in which case it stays Initialized. Also
  // overrides Invisible for this camera.
  void Click(MarkerId m, CameraId c, FrameId f, const Eigen::Vector2d& uv_px);
  void DeleteObservation(MarkerId m, CameraId c, FrameId f);

  // All cameras back to Unlabeled and the world point cleared. Initial
  // positions are kept.
  void ResetMarker(MarkerId m, FrameId f);
  // Like ResetMarker for every marker, and forgets the frame's initial positions.
  void ResetFrame(FrameId f);

  // Invisible -> Unlabeled in every camera if any camera is Invisible,
  // otherwise marks the marker Invisible everywhere.
  void ToggleInvisible(MarkerId m, FrameId f);

  // Triangulates every marker with at least two eligible cameras, reprojects
  // into all non-Invisible cameras and restores the eligible observations.
  TriangulationReport Triangulate(FrameId f);

  // Places the held point like Click, then solves with the held view
  // dominating the fit. Reprojection and restore as in Triangulate. The click
  // is kept when the solve fails.
  geometry::TriangulationResult ForceTriangulate(CameraId held_camera, MarkerId m, FrameId f,
                                                 const Eigen::Vector2d& uv_px);

  // Exchanges animal 0 and animal 1 in camera c, re-derives the statuses of
  // that camera and re-triangulates the frame.
  TriangulationReport SwapIdentities(CameraId c, FrameId f);

  // Every observation with a position becomes Labeled.
  void SetFrameLabeled(FrameId f);

  void CopyFrame(FrameId f);
  bool HasClipboard() const { return clipboard_.has_value(); }
  // Throws if nothing was copied.
  void PasteFrame(FrameId f);

  // points_3d is [num_frames, 3 * num_markers], one x, y, z triple per marker.
  // Markers Labeled in any camera are kept as they are. Others take the world
  // point, and each non-Labeled, non-Invisible camera gets its projection as an
  // Initialized observation that also becomes the initial position.
  void LoadFrom3D(const Eigen::MatrixXd& points_3d);

  TriangulationReport TriangulateAll();

  // Returns the report when the event triangulated anything.
  std::optional<TriangulationReport> Apply(const AnnotationEvent& event);

  // Frames with at least one marker Labeled in every camera.
  int LabeledFrameCount() const;
  bool IsFrameLabeled(FrameId f) const;

  // Image-space projection of the stored world point, distorted unless the
  // session works on undistorted images. NaN when there is no world point.
  Eigen::Vector2d ProjectWorldPoint(MarkerId m, CameraId c, FrameId f) const;

 private:
  Eigen::Vector2d TriangulationInput(CameraId c, const Eigen::Vector2d& uv_px, bool* fallback) const;
  void ReprojectAndRestore(MarkerId m, FrameId f, const FrameState& before);
  MarkerId ResolveMarker(MarkerId m) const;

  SessionConfig cfg_;
  std::vector<geometry::RawCalibration> raw_;
  std::vector<geometry::Camera> cameras_;
  Skeleton skeleton_;
  std::vector<int> frames_to_label_;
  CorrespondenceStore store_;

  MarkerId selected_marker_ = 0;
  std::optional<FrameState> clipboard_;
};

}  // namespace mvlabel::annotation
