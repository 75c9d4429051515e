#pragma once

#include <mvlabel/annotation/label_session.hpp>
#include <mvlabel/geometry/camera.hpp>

#include <string>
#include <vector>

namespace mvlabel::io {

// ASCII PLY of the world points of frame f, colored by marker.
bool ExportWorldPointsPLY(const std::string& path, const annotation::LabelSession& session, FrameId f);

// ASCII PLY of the camera centers.
bool ExportCamerasPLY(const std::string& path, const std::vector<geometry::Camera>& cameras);

// Training-data export through cv::FileStorage. For every camera, over the
// labeled frames: data_2d [n, 2 * markers] reprojected pixels (distorted unless
// the session works on undistorted images), data_3d [n, 3 * markers] and
// data_frame (video frame index). Also writes handLabeled2D and camnames.
bool ExportLabelData(const std::string& path, const annotation::LabelSession& session);

}  // namespace mvlabel::io
