#include <mvlabel/config.hpp>
#include <mvlabel/common.hpp>

#include <opencv2/core.hpp>

namespace mvlabel {

namespace {

template <typename T>
void ReadIfPresent(const cv::FileNode& node, const char* key, T* value) {
  const cv::FileNode v = node[key];
  if (!v.empty()) {
    v >> *value;
  }
}

void ReadBoolIfPresent(const cv::FileNode& node, const char* key, bool* value) {
  const cv::FileNode v = node[key];
  if (!v.empty()) {
    int tmp = 0;
    v >> tmp;
    *value = (tmp != 0);
  }
}

}  // namespace

SessionConfig SessionConfig::FromYAML(const std::string& path) {
  SessionConfig cfg;
  if (path.empty()) {
    return cfg;
  }

  cv::FileStorage fs(path, cv::FileStorage::READ);
  MVLABEL_REQUIRE_CODE(fs.isOpened(), ErrorCode::kIo, "Failed to open config file: " + path);

  ReadIfPresent(fs.root(), "num_animals", &cfg.num_animals);
  ReadBoolIfPresent(fs.root(), "undistorted_images", &cfg.undistorted_images);
  ReadBoolIfPresent(fs.root(), "autosave", &cfg.autosave);
  ReadBoolIfPresent(fs.root(), "verbose", &cfg.verbose);

  {
    cv::FileNode c = fs["calibration"];
    if (!c.empty()) {
      ReadIfPresent(c, "skew_tolerance", &cfg.calibration.skew_tolerance);
      ReadIfPresent(c, "rotation_det_tolerance", &cfg.calibration.rotation_det_tolerance);
    }
  }

  {
    cv::FileNode u = fs["undistort"];
    if (!u.empty()) {
      ReadIfPresent(u, "max_iterations", &cfg.undistort.max_iterations);
      ReadIfPresent(u, "tolerance_px", &cfg.undistort.tolerance_px);
    }
  }

  {
    cv::FileNode s = fs["status"];
    if (!s.empty()) {
      ReadIfPresent(s, "rounding_decimals", &cfg.status.rounding_decimals);
    }
  }

  {
    cv::FileNode t = fs["triangulation"];
    if (!t.empty()) {
      ReadIfPresent(t, "homogeneous_epsilon", &cfg.triangulation.homogeneous_epsilon);
    }
  }

  MVLABEL_REQUIRE(cfg.num_animals >= 1, "num_animals must be >= 1");
  MVLABEL_REQUIRE(cfg.undistort.max_iterations >= 1, "undistort.max_iterations must be >= 1");
  MVLABEL_REQUIRE(cfg.undistort.tolerance_px > 0.0, "undistort.tolerance_px must be > 0");
  MVLABEL_REQUIRE(cfg.status.rounding_decimals >= 0, "status.rounding_decimals must be >= 0");

  return cfg;
}

void SessionConfig::SaveYAML(const std::string& path) const {
  cv::FileStorage fs(path, cv::FileStorage::WRITE);
  MVLABEL_REQUIRE_CODE(fs.isOpened(), ErrorCode::kIo, "Failed to open config file for write: " + path);

  fs << "num_animals" << num_animals;
  fs << "undistorted_images" << (undistorted_images ? 1 : 0);
  fs << "autosave" << (autosave ? 1 : 0);
  fs << "verbose" << (verbose ? 1 : 0);

  fs << "calibration"
     << "{"
     << "skew_tolerance" << calibration.skew_tolerance << "rotation_det_tolerance"
     << calibration.rotation_det_tolerance << "}";

  fs << "undistort"
     << "{"
     << "max_iterations" << undistort.max_iterations << "tolerance_px" << undistort.tolerance_px
     << "}";

  fs << "status"
     << "{"
     << "rounding_decimals" << status.rounding_decimals << "}";

  fs << "triangulation"
     << "{"
     << "homogeneous_epsilon" << triangulation.homogeneous_epsilon << "}";
}

}  // namespace mvlabel
