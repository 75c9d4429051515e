#pragma once

#include <mvlabel/annotation/label_session.hpp>
#include <mvlabel/io/frame_source.hpp>

#include <opencv2/core.hpp>

#include <string>

namespace mvlabel::io {

// Draws the current observations of frame f on one camera image: skeleton
// segments between markers that have a position, filled dots for Labeled and
// rings for Initialized markers.
cv::Mat RenderOverlay(const annotation::LabelSession& session, CameraId c, FrameId f, const cv::Mat& image);

// Writes one overlay image per camera to out_dir, reading the video frame
// frames_to_label[f] from source.
bool ExportOverlayImages(const std::string& out_dir, const annotation::LabelSession& session,
                         const FrameSource& source, FrameId f);

}  // namespace mvlabel::io
