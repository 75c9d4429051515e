#pragma once

#include <mvlabel/types.hpp>

#include <opencv2/core.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace mvlabel::io {

// Decoded images by (camera, video frame index).
class FrameSource {
 public:
  virtual ~FrameSource() = default;

  virtual int num_cameras() const = 0;
  virtual int num_frames(CameraId c) const = 0;

  // BGR image. Throws on a missing or unreadable frame.
  virtual cv::Mat ReadFrame(CameraId c, int frame) const = 0;
};

// One directory of image files per camera; frame k is the k-th file in
// lexicographic order.
class ImageSequenceSource : public FrameSource {
 public:
  // Every subdirectory of root that contains images is a camera, in sorted order.
  static ImageSequenceSource FromDirectory(const std::string& root);
  static ImageSequenceSource FromCameraDirectories(const std::vector<std::string>& dirs);

  int num_cameras() const override { return static_cast<int>(frames_.size()); }
  int num_frames(CameraId c) const override;
  cv::Mat ReadFrame(CameraId c, int frame) const override;

  const std::filesystem::path& frame_path(CameraId c, int frame) const;

 private:
  std::vector<std::vector<std::filesystem::path>> frames_;
};

}  // namespace mvlabel::io
