#pragma once

#include <mvlabel/annotation/correspondence_store.hpp>
#include <mvlabel/geometry/camera.hpp>
#include <mvlabel/types.hpp>

#include <Eigen/Core>

#include <vector>

namespace mvlabel::annotation {

Eigen::Vector2d Reproject(const Eigen::Vector3d& X_world, const geometry::Camera& cam,
                          bool apply_distortion);

// Projects the current world point of (m, f) into every camera whose status is
// not Invisible and stores it with a derived status. Returns the number of
// cameras written; 0 when the world point is absent.
int ReprojectAll(MarkerId m, FrameId f, const std::vector<geometry::Camera>& cameras,
                 bool apply_distortion, CorrespondenceStore* store);

}  // namespace mvlabel::annotation
