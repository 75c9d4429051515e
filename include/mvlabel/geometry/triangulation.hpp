#pragma once

#include <mvlabel/common.hpp>
#include <mvlabel/geometry/camera.hpp>
#include <mvlabel/types.hpp>

#include <Eigen/Core>

#include <vector>

namespace mvlabel::geometry {

// Extra copies of the held view's equation pair in ForceTriangulateMultiview.
// A fixed factor, not a per-observation weight.
constexpr int kHeldViewReplication = 100;

struct TriangulationOptions {
  double homogeneous_epsilon = 1e-10;
};

struct TriangulationResult {
  bool success = false;
  Eigen::Vector3d X = MissingPoint3d();
  ErrorCode error = ErrorCode::kNone;
  int num_views = 0;  // distinct cameras
};

// Linear multi-view DLT on already-undistorted pixel coordinates. Each row pair
// is scaled to unit norm before stacking. Fails with kInsufficientViews for
// fewer than two distinct cameras and kDegenerateGeometry when the homogeneous
// coordinate of the solution vanishes.
TriangulationResult TriangulateDLT(const std::vector<Eigen::Matrix<double, 3, 4>>& P,
                                   const std::vector<Eigen::Vector2d>& x_px,
                                   const TriangulationOptions& opt = TriangulationOptions());

// views[i].camera indexes into cameras.
TriangulationResult TriangulateMultiview(const std::vector<Camera>& cameras,
                                         const std::vector<ViewObservation>& views,
                                         const TriangulationOptions& opt = TriangulationOptions());

// Same solve with the held camera's view appended `replication` more times, so
// that it dominates the fit. held_camera must be among the views.
TriangulationResult ForceTriangulateMultiview(const std::vector<Camera>& cameras,
                                              const std::vector<ViewObservation>& views,
                                              CameraId held_camera,
                                              const TriangulationOptions& opt = TriangulationOptions(),
                                              int replication = kHeldViewReplication);

// Pixel distance between the undistorted projection of X and uv_obs_px.
double ReprojectionErrorPx(const Camera& cam, const Eigen::Vector3d& X_world,
                           const Eigen::Vector2d& uv_obs_px);

}  // namespace mvlabel::geometry
