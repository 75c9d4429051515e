#pragma once

#include <mvlabel/common.hpp>
#include <mvlabel/config.hpp>
#include <mvlabel/types.hpp>

#include <Eigen/Core>

#include <vector>

namespace mvlabel::geometry {

// How r, t and K of a raw calibration record are laid out.
//   kRowVector:    x_cam = X_world * r + t (row vectors), K stored transposed
//                  with the principal point in its last row. Session files use this.
//   kColumnVector: x_cam = r * X_world + t, K upper-triangular.
enum class PoseConvention {
  kRowVector = 0,
  kColumnVector = 1,
};

const char* PoseConventionName(PoseConvention convention);

struct RawCalibration {
  Eigen::Matrix3d K = Eigen::Matrix3d::Identity();
  std::vector<double> radial_distortion = {0.0, 0.0};  // k1, k2 [, k3]
  Eigen::Vector2d tangential_distortion = Eigen::Vector2d::Zero();  // p1, p2
  Eigen::Matrix3d r = Eigen::Matrix3d::Identity();
  Eigen::Vector3d t = Eigen::Vector3d::Zero();
  int image_height_px = 0;
  int image_width_px = 0;
  PoseConvention convention = PoseConvention::kRowVector;
};

struct UndistortResult {
  bool converged = false;
  Eigen::Vector2d uv_px = MissingPoint2d();  // input coordinate when not converged
  int iterations = 0;
  ErrorCode error = ErrorCode::kNone;
};

// Calibrated pinhole camera in the canonical column convention. Immutable once built.
class Camera {
 public:
  Camera() = default;
  Camera(const Intrinsics& intr, const Pose& pose) : intr_(intr), pose_(pose) {}

  const Intrinsics& intrinsics() const noexcept { return intr_; }
  const Pose& pose() const noexcept { return pose_; }

  WorldPose world_pose() const;

  Eigen::Matrix3d IntrinsicsMatrix() const;
  Eigen::Matrix<double, 3, 4> ProjectionMatrix() const;

  // NaN when the point is behind the camera.
  Eigen::Vector2d Project(const Eigen::Vector3d& X_world, bool apply_distortion) const;

  Eigen::Vector2d PixelToNormalized(const Eigen::Vector2d& uv_px) const;
  Eigen::Vector2d NormalizedToPixel(const Eigen::Vector2d& xy) const;

  Eigen::Vector2d DistortNormalized(const Eigen::Vector2d& xy) const;

  // Undistorted pixel -> distorted pixel.
  Eigen::Vector2d DistortPixel(const Eigen::Vector2d& uv_px) const;

  // Distorted pixel -> undistorted pixel, by fixed-point iteration on the
  // normalized coordinates.
  UndistortResult UndistortPixel(const Eigen::Vector2d& uv_px,
                                 const UndistortConfig& cfg = UndistortConfig()) const;

 private:
  Intrinsics intr_;
  Pose pose_;
};

// The single conversion from a raw calibration record to the canonical pose.
// Throws Error(kInvalidCalibration) on nonzero skew or det(R) away from +1.
Camera ResolvePose(const RawCalibration& raw, const CalibrationConfig& cfg = CalibrationConfig());

std::vector<Camera> ResolvePoses(const std::vector<RawCalibration>& raws,
                                 const CalibrationConfig& cfg = CalibrationConfig());

}  // namespace mvlabel::geometry
