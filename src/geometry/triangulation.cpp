#include <mvlabel/geometry/triangulation.hpp>

#include <Eigen/SVD>

#include <cmath>
#include <limits>
#include <unordered_set>

namespace mvlabel::geometry {

namespace {

int CountDistinctCameras(const std::vector<ViewObservation>& views) {
  std::unordered_set<CameraId> seen;
  for (const auto& v : views) seen.insert(v.camera);
  return static_cast<int>(seen.size());
}

void CollectProjections(const std::vector<Camera>& cameras,
                        const std::vector<ViewObservation>& views,
                        std::vector<Eigen::Matrix<double, 3, 4>>* P,
                        std::vector<Eigen::Vector2d>* x) {
  P->reserve(P->size() + views.size());
  x->reserve(x->size() + views.size());
  for (const auto& v : views) {
    MVLABEL_REQUIRE(v.camera >= 0 && v.camera < static_cast<int>(cameras.size()),
                    "Triangulation: invalid camera id");
    P->push_back(cameras[v.camera].ProjectionMatrix());
    x->push_back(v.uv_px);
  }
}

}  // namespace

TriangulationResult TriangulateDLT(const std::vector<Eigen::Matrix<double, 3, 4>>& P,
                                   const std::vector<Eigen::Vector2d>& x_px,
                                   const TriangulationOptions& opt) {
  MVLABEL_REQUIRE(P.size() == x_px.size(), "TriangulateDLT: size mismatch");

  TriangulationResult res;
  res.num_views = static_cast<int>(P.size());
  if (P.size() < 2) {
    res.error = ErrorCode::kInsufficientViews;
    return res;
  }

  const int n = static_cast<int>(P.size());
  Eigen::MatrixXd A(2 * n, 4);
  for (int i = 0; i < n; ++i) {
    const Eigen::Matrix<double, 3, 4>& Pi = P[i];
    const Eigen::Vector2d& xi = x_px[i];
    if (!xi.allFinite()) {
      res.error = ErrorCode::kInvalidArgument;
      return res;
    }
    A.row(2 * i) = xi.x() * Pi.row(2) - Pi.row(0);
    A.row(2 * i + 1) = xi.y() * Pi.row(2) - Pi.row(1);
  }
  for (int r = 0; r < A.rows(); ++r) {
    const double norm = A.row(r).norm();
    if (norm > std::numeric_limits<double>::epsilon()) A.row(r) /= norm;
  }

  Eigen::JacobiSVD<Eigen::MatrixXd> svdA(A, Eigen::ComputeFullV);
  const Eigen::Vector4d Xh = svdA.matrixV().col(3);
  if (!Xh.allFinite() || std::abs(Xh(3)) <= opt.homogeneous_epsilon) {
    res.error = ErrorCode::kDegenerateGeometry;
    return res;
  }

  const Eigen::Vector3d X = Xh.head<3>() / Xh(3);
  if (!X.allFinite()) {
    res.error = ErrorCode::kDegenerateGeometry;
    return res;
  }

  res.success = true;
  res.X = X;
  return res;
}

TriangulationResult TriangulateMultiview(const std::vector<Camera>& cameras,
                                         const std::vector<ViewObservation>& views,
                                         const TriangulationOptions& opt) {
  const int distinct = CountDistinctCameras(views);
  if (distinct < 2) {
    TriangulationResult res;
    res.num_views = distinct;
    res.error = ErrorCode::kInsufficientViews;
    return res;
  }

  std::vector<Eigen::Matrix<double, 3, 4>> P;
  std::vector<Eigen::Vector2d> x;
  CollectProjections(cameras, views, &P, &x);

  TriangulationResult res = TriangulateDLT(P, x, opt);
  res.num_views = distinct;
  return res;
}

TriangulationResult ForceTriangulateMultiview(const std::vector<Camera>& cameras,
                                              const std::vector<ViewObservation>& views,
                                              CameraId held_camera,
                                              const TriangulationOptions& opt,
                                              int replication) {
  MVLABEL_REQUIRE(replication >= 0, "ForceTriangulateMultiview: negative replication");

  const ViewObservation* held = nullptr;
  for (const auto& v : views) {
    if (v.camera == held_camera) held = &v;
  }
  MVLABEL_REQUIRE(held != nullptr, "ForceTriangulateMultiview: held camera is not among the views");

  const int distinct = CountDistinctCameras(views);
  if (distinct < 2) {
    TriangulationResult res;
    res.num_views = distinct;
    res.error = ErrorCode::kInsufficientViews;
    return res;
  }

  std::vector<Eigen::Matrix<double, 3, 4>> P;
  std::vector<Eigen::Vector2d> x;
  CollectProjections(cameras, views, &P, &x);

  const Eigen::Matrix<double, 3, 4> P_held = cameras[held_camera].ProjectionMatrix();
  P.reserve(P.size() + replication);
  x.reserve(x.size() + replication);
  for (int i = 0; i < replication; ++i) {
    P.push_back(P_held);
    x.push_back(held->uv_px);
  }

  TriangulationResult res = TriangulateDLT(P, x, opt);
  res.num_views = distinct;
  return res;
}

double ReprojectionErrorPx(const Camera& cam, const Eigen::Vector3d& X_world,
                           const Eigen::Vector2d& uv_obs_px) {
  const Eigen::Vector2d uv_pred = cam.Project(X_world, false);
  if (!uv_pred.allFinite()) return std::numeric_limits<double>::max();
  return (uv_pred - uv_obs_px).norm();
}

}  // namespace mvlabel::geometry
