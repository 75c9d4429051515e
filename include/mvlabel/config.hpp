#pragma once

#include <string>

namespace mvlabel {

struct CalibrationConfig {
  double skew_tolerance = 1e-6;          // |K(0,1)| and off-pattern terms, in pixels
  double rotation_det_tolerance = 1e-3;  // |det(R) - 1|
};

struct UndistortConfig {
  int max_iterations = 20;
  double tolerance_px = 1e-3;
};

struct StatusConfig {
  int rounding_decimals = 3;  // moved-vs-initial comparison precision
};

struct TriangulationConfig {
  double homogeneous_epsilon = 1e-10;  // on the unit-norm DLT solution
};

struct SessionConfig {
  int num_animals = 1;
  bool undistorted_images = false;  // false: clicks live in distorted image coordinates
  bool autosave = true;
  bool verbose = true;

  CalibrationConfig calibration;
  UndistortConfig undistort;
  StatusConfig status;
  TriangulationConfig triangulation;

  static SessionConfig FromYAML(const std::string& path);
  void SaveYAML(const std::string& path) const;
};

}  // namespace mvlabel
