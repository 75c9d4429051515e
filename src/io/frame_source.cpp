#include <mvlabel/io/frame_source.hpp>
#include <mvlabel/common.hpp>

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace mvlabel::io {

namespace fs = std::filesystem;

namespace {

std::string ToLower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool HasImageExtension(const fs::path& p) {
  const std::string ext = ToLower(p.extension().string());
  return ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".tif" || ext == ".tiff" ||
         ext == ".bmp";
}

std::vector<fs::path> ListImages(const fs::path& dir) {
  std::vector<fs::path> paths;
  for (const auto& ent : fs::directory_iterator(dir)) {
    if (!ent.is_regular_file()) continue;
    if (!HasImageExtension(ent.path())) continue;
    paths.push_back(ent.path());
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}

}  // namespace

ImageSequenceSource ImageSequenceSource::FromDirectory(const std::string& root) {
  const fs::path base(root);
  MVLABEL_REQUIRE_CODE(fs::is_directory(base), ErrorCode::kIo, "frames_dir is not a directory: " + root);

  std::vector<fs::path> dirs;
  for (const auto& ent : fs::directory_iterator(base)) {
    if (ent.is_directory()) dirs.push_back(ent.path());
  }
  std::sort(dirs.begin(), dirs.end());

  ImageSequenceSource src;
  for (const fs::path& d : dirs) {
    std::vector<fs::path> images = ListImages(d);
    if (!images.empty()) src.frames_.push_back(std::move(images));
  }
  MVLABEL_REQUIRE_CODE(!src.frames_.empty(), ErrorCode::kIo, "No camera image directories in " + root);
  return src;
}

ImageSequenceSource ImageSequenceSource::FromCameraDirectories(const std::vector<std::string>& dirs) {
  ImageSequenceSource src;
  for (const std::string& d : dirs) {
    MVLABEL_REQUIRE_CODE(fs::is_directory(d), ErrorCode::kIo, "Not a directory: " + d);
    std::vector<fs::path> images = ListImages(d);
    MVLABEL_REQUIRE_CODE(!images.empty(), ErrorCode::kIo, "No images found in directory: " + d);
    src.frames_.push_back(std::move(images));
  }
  return src;
}

int ImageSequenceSource::num_frames(CameraId c) const {
  MVLABEL_REQUIRE(c >= 0 && c < num_cameras(), "Invalid camera id " + std::to_string(c));
  return static_cast<int>(frames_[c].size());
}

const fs::path& ImageSequenceSource::frame_path(CameraId c, int frame) const {
  MVLABEL_REQUIRE(frame >= 0 && frame < num_frames(c),
                  "Frame " + std::to_string(frame) + " out of range for camera " + std::to_string(c));
  return frames_[c][frame];
}

cv::Mat ImageSequenceSource::ReadFrame(CameraId c, int frame) const {
  const fs::path& p = frame_path(c, frame);
  cv::Mat img = cv::imread(p.string(), cv::IMREAD_COLOR);
  MVLABEL_REQUIRE_CODE(!img.empty(), ErrorCode::kIo, "Failed to read image: " + p.string());
  return img;
}

}  // namespace mvlabel::io
