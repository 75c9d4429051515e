#include <mvlabel/annotation/reprojection.hpp>
#include <mvlabel/common.hpp>

namespace mvlabel::annotation {

Eigen::Vector2d Reproject(const Eigen::Vector3d& X_world, const geometry::Camera& cam,
                          bool apply_distortion) {
  return cam.Project(X_world, apply_distortion);
}

int ReprojectAll(MarkerId m, FrameId f, const std::vector<geometry::Camera>& cameras,
                 bool apply_distortion, CorrespondenceStore* store) {
  MVLABEL_REQUIRE(store, "ReprojectAll: store is null");
  MVLABEL_REQUIRE(static_cast<int>(cameras.size()) == store->num_cameras(),
                  "ReprojectAll: camera count does not match the store");

  const Eigen::Vector3d X = store->world_point(m, f);
  if (!X.allFinite()) return 0;

  // Project everything first so that a bad camera leaves the store untouched.
  std::vector<Eigen::Vector2d> uv(cameras.size());
  for (CameraId c = 0; c < store->num_cameras(); ++c) {
    uv[c] = Reproject(X, cameras[c], apply_distortion);
  }

  int written = 0;
  for (CameraId c = 0; c < store->num_cameras(); ++c) {
    if (store->observation(m, c, f).status == LabelStatus::kInvisible) continue;
    store->SetDerivedPosition(m, c, f, uv[c]);
    ++written;
  }
  return written;
}

}  // namespace mvlabel::annotation
