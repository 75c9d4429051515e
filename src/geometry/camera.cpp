#include <mvlabel/geometry/camera.hpp>

#include <Eigen/LU>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace mvlabel::geometry {

namespace {

bool NearZero(double v, double tol) {
  return std::abs(v) <= tol;
}

}  // namespace

const char* PoseConventionName(PoseConvention convention) {
  switch (convention) {
    case PoseConvention::kRowVector:
      return "row_vector";
    case PoseConvention::kColumnVector:
      return "column_vector";
  }
  return "unknown";
}

WorldPose Camera::world_pose() const {
  WorldPose wp;
  wp.Rw = pose_.R.transpose();
  wp.C = CameraCenterWorld(pose_);
  return wp;
}

Eigen::Matrix3d Camera::IntrinsicsMatrix() const {
  Eigen::Matrix3d K = Eigen::Matrix3d::Identity();
  K(0, 0) = intr_.fx_px;
  K(1, 1) = intr_.fy_px;
  K(0, 2) = intr_.cx_px;
  K(1, 2) = intr_.cy_px;
  return K;
}

Eigen::Matrix<double, 3, 4> Camera::ProjectionMatrix() const {
  Eigen::Matrix<double, 3, 4> Rt;
  Rt.block<3, 3>(0, 0) = pose_.R;
  Rt.col(3) = pose_.t;
  return IntrinsicsMatrix() * Rt;
}

Eigen::Vector2d Camera::Project(const Eigen::Vector3d& X_world, bool apply_distortion) const {
  const Eigen::Vector3d Xc = pose_.R * X_world + pose_.t;

  const double Z = Xc.z();
  if (Z <= std::numeric_limits<double>::epsilon() || !std::isfinite(Z)) {
    return MissingPoint2d();
  }

  Eigen::Vector2d xy(Xc.x() / Z, Xc.y() / Z);
  if (apply_distortion) xy = DistortNormalized(xy);
  return NormalizedToPixel(xy);
}

Eigen::Vector2d Camera::PixelToNormalized(const Eigen::Vector2d& uv_px) const {
  return Eigen::Vector2d((uv_px.x() - intr_.cx_px) / intr_.fx_px,
                         (uv_px.y() - intr_.cy_px) / intr_.fy_px);
}

Eigen::Vector2d Camera::NormalizedToPixel(const Eigen::Vector2d& xy) const {
  return Eigen::Vector2d(intr_.fx_px * xy.x() + intr_.cx_px, intr_.fy_px * xy.y() + intr_.cy_px);
}

Eigen::Vector2d Camera::DistortNormalized(const Eigen::Vector2d& xy) const {
  const double x = xy.x();
  const double y = xy.y();
  const double r2 = x * x + y * y;
  const double radial = 1.0 + r2 * (intr_.k1 + r2 * (intr_.k2 + r2 * intr_.k3));

  const double xd = x * radial + 2.0 * intr_.p1 * x * y + intr_.p2 * (r2 + 2.0 * x * x);
  const double yd = y * radial + intr_.p1 * (r2 + 2.0 * y * y) + 2.0 * intr_.p2 * x * y;
  return Eigen::Vector2d(xd, yd);
}

Eigen::Vector2d Camera::DistortPixel(const Eigen::Vector2d& uv_px) const {
  return NormalizedToPixel(DistortNormalized(PixelToNormalized(uv_px)));
}

UndistortResult Camera::UndistortPixel(const Eigen::Vector2d& uv_px, const UndistortConfig& cfg) const {
  UndistortResult res;
  if (!uv_px.allFinite()) {
    res.error = ErrorCode::kInvalidArgument;
    return res;
  }

  if (!intr_.HasDistortion()) {
    res.converged = true;
    res.uv_px = uv_px;
    return res;
  }

  const Eigen::Vector2d x0 = PixelToNormalized(uv_px);
  Eigen::Vector2d x = x0;

  for (int iter = 0;; ++iter) {
    const Eigen::Vector2d residual = DistortNormalized(x) - x0;
    const double err_px =
        std::max(std::abs(residual.x() * intr_.fx_px), std::abs(residual.y() * intr_.fy_px));
    if (std::isfinite(err_px) && err_px < cfg.tolerance_px) {
      res.converged = true;
      res.iterations = iter;
      res.uv_px = NormalizedToPixel(x);
      return res;
    }
    if (iter >= cfg.max_iterations || !std::isfinite(err_px)) {
      res.iterations = iter;
      break;
    }

    // x = (x0 - tangential(x)) / radial(x)
    const double r2 = x.squaredNorm();
    const double radial = 1.0 + r2 * (intr_.k1 + r2 * (intr_.k2 + r2 * intr_.k3));
    if (std::abs(radial) <= std::numeric_limits<double>::epsilon()) {
      res.iterations = iter;
      break;
    }
    const double dx = 2.0 * intr_.p1 * x.x() * x.y() + intr_.p2 * (r2 + 2.0 * x.x() * x.x());
    const double dy = intr_.p1 * (r2 + 2.0 * x.y() * x.y()) + 2.0 * intr_.p2 * x.x() * x.y();
    x = Eigen::Vector2d((x0.x() - dx) / radial, (x0.y() - dy) / radial);
  }

  res.converged = false;
  res.error = ErrorCode::kUndistortionDidNotConverge;
  res.uv_px = uv_px;
  return res;
}

Camera ResolvePose(const RawCalibration& raw, const CalibrationConfig& cfg) {
  const bool row = raw.convention == PoseConvention::kRowVector;

  Eigen::Matrix3d K = row ? Eigen::Matrix3d(raw.K.transpose()) : raw.K;
  MVLABEL_REQUIRE_CODE(K.allFinite(), ErrorCode::kInvalidCalibration, "Intrinsic matrix is not finite");
  MVLABEL_REQUIRE_CODE(!NearZero(K(2, 2), std::numeric_limits<double>::epsilon()),
                       ErrorCode::kInvalidCalibration, "Intrinsic matrix has K(2,2) == 0");
  K /= K(2, 2);

  const double tol = cfg.skew_tolerance;
  if (!NearZero(K(0, 1), tol) || !NearZero(K(1, 0), tol) || !NearZero(K(2, 0), tol) ||
      !NearZero(K(2, 1), tol)) {
    std::ostringstream oss;
    oss << "Intrinsic matrix has nonzero skew terms (" << PoseConventionName(raw.convention)
        << " layout): K =\n"
        << raw.K;
    Throw(ErrorCode::kInvalidCalibration, __FILE__, __LINE__, oss.str());
  }
  MVLABEL_REQUIRE_CODE(K(0, 0) > 0.0 && K(1, 1) > 0.0, ErrorCode::kInvalidCalibration,
                       "Focal lengths must be positive");

  const Eigen::Matrix3d R = row ? Eigen::Matrix3d(raw.r.transpose()) : raw.r;
  MVLABEL_REQUIRE_CODE(R.allFinite() && raw.t.allFinite(), ErrorCode::kInvalidCalibration,
                       "Extrinsics are not finite");
  const double det = R.determinant();
  if (std::abs(det - 1.0) > cfg.rotation_det_tolerance) {
    std::ostringstream oss;
    oss << "Rotation determinant is " << det << ", expected +1";
    Throw(ErrorCode::kInvalidCalibration, __FILE__, __LINE__, oss.str());
  }

  const std::size_t n_radial = raw.radial_distortion.size();
  MVLABEL_REQUIRE_CODE(n_radial == 2 || n_radial == 3, ErrorCode::kInvalidCalibration,
                       "Radial distortion must have 2 or 3 coefficients");
  MVLABEL_REQUIRE_CODE(raw.image_height_px >= 0 && raw.image_width_px >= 0,
                       ErrorCode::kInvalidCalibration, "Image size must be non-negative");

  Intrinsics intr;
  intr.fx_px = K(0, 0);
  intr.fy_px = K(1, 1);
  intr.cx_px = K(0, 2);
  intr.cy_px = K(1, 2);
  intr.k1 = raw.radial_distortion[0];
  intr.k2 = raw.radial_distortion[1];
  intr.k3 = n_radial == 3 ? raw.radial_distortion[2] : 0.0;
  intr.p1 = raw.tangential_distortion.x();
  intr.p2 = raw.tangential_distortion.y();
  intr.width_px = raw.image_width_px;
  intr.height_px = raw.image_height_px;

  Pose pose;
  pose.R = R;
  pose.t = raw.t;  // the same three numbers in both conventions
  return Camera(intr, pose);
}

std::vector<Camera> ResolvePoses(const std::vector<RawCalibration>& raws, const CalibrationConfig& cfg) {
  std::vector<Camera> cams;
  cams.reserve(raws.size());
  for (const auto& raw : raws) cams.push_back(ResolvePose(raw, cfg));
  return cams;
}

}  // namespace mvlabel::geometry
