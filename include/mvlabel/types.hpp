#pragma once

#include <Eigen/Core>

#include <cstdint>
#include <limits>
#include <vector>

namespace mvlabel {

// All ids are 0-based.
using MarkerId = int;
using CameraId = int;
using FrameId = int;

enum class LabelStatus : std::uint8_t {
  kUnlabeled = 0,
  kInitialized = 1,
  kLabeled = 2,
  kInvisible = 3,
};

const char* LabelStatusName(LabelStatus status);

inline bool IsEligibleStatus(LabelStatus status) {
  return status == LabelStatus::kInitialized || status == LabelStatus::kLabeled;
}

inline Eigen::Vector2d MissingPoint2d() {
  return Eigen::Vector2d::Constant(std::numeric_limits<double>::quiet_NaN());
}

inline Eigen::Vector3d MissingPoint3d() {
  return Eigen::Vector3d::Constant(std::numeric_limits<double>::quiet_NaN());
}

// Pinhole intrinsics with radial (k1, k2, k3) and tangential (p1, p2) distortion.
// Distortion is applied in normalized image coordinates.
struct Intrinsics {
  double fx_px = 0.0;
  double fy_px = 0.0;
  double cx_px = 0.0;
  double cy_px = 0.0;
  double k1 = 0.0;
  double k2 = 0.0;
  double k3 = 0.0;
  double p1 = 0.0;
  double p2 = 0.0;
  int width_px = 0;
  int height_px = 0;

  bool HasDistortion() const {
    return k1 != 0.0 || k2 != 0.0 || k3 != 0.0 || p1 != 0.0 || p2 != 0.0;
  }
};

struct Pose {
  // World-to-camera: X_cam = R * X_world + t
  Eigen::Matrix3d R = Eigen::Matrix3d::Identity();
  Eigen::Vector3d t = Eigen::Vector3d::Zero();
};

inline Eigen::Vector3d CameraCenterWorld(const Pose& pose) {
  return -pose.R.transpose() * pose.t;
}

// Camera-to-world orientation and camera center in world coordinates.
struct WorldPose {
  Eigen::Matrix3d Rw = Eigen::Matrix3d::Identity();
  Eigen::Vector3d C = Eigen::Vector3d::Zero();
};

// 2-D state of one marker in one camera at one frame.
struct Observation {
  Eigen::Vector2d uv_px = MissingPoint2d();
  LabelStatus status = LabelStatus::kUnlabeled;
  bool hand_labeled = false;

  bool has_position() const { return uv_px.allFinite(); }
};

// NaN-aware equality: two missing positions compare equal.
bool SameObservation(const Observation& a, const Observation& b);

// A pixel observation of one marker in one camera, as fed to triangulation.
struct ViewObservation {
  CameraId camera = -1;
  Eigen::Vector2d uv_px = Eigen::Vector2d::Zero();
};

}  // namespace mvlabel
