#include <mvlabel/skeleton.hpp>
#include <mvlabel/common.hpp>

#include <algorithm>
#include <iostream>
#include <string>

namespace mvlabel {

namespace {

const Eigen::Vector3d kAnimalThemes[] = {
    {0.2, 0.4, 0.8},  // blue
    {0.8, 0.3, 0.2},  // red
    {0.2, 0.8, 0.4},  // green
    {0.8, 0.8, 0.2},  // yellow
    {0.6, 0.2, 0.8},  // purple
    {0.8, 0.5, 0.2},  // orange
};
constexpr int kNumThemes = static_cast<int>(sizeof(kAnimalThemes) / sizeof(kAnimalThemes[0]));

bool Contains(const std::string& s, const std::string& needle) {
  return s.find(needle) != std::string::npos;
}

// COCO-17 style layouts: a nose plus eight left_ and eight right_ joints.
std::vector<Eigen::Vector3d> BaseMarkerColors(const std::vector<std::string>& names) {
  const int n = static_cast<int>(names.size());
  const int n_left = static_cast<int>(std::count_if(
      names.begin(), names.end(), [](const std::string& s) { return Contains(s, "left_"); }));
  const int n_right = static_cast<int>(std::count_if(
      names.begin(), names.end(), [](const std::string& s) { return Contains(s, "right_"); }));
  const auto nose = std::find(names.begin(), names.end(), std::string("nose"));

  std::vector<Eigen::Vector3d> colors(n, Eigen::Vector3d::Ones());
  if (n != 17 || n_left != 8 || n_right != 8 || nose == names.end()) return colors;

  // The gradient follows the order of each side's joints in the list.
  int i_left = 0;
  int i_right = 0;
  for (int k = 0; k < n; ++k) {
    if (Contains(names[k], "left_")) {
      const double s = static_cast<double>(i_left++) / 7.0;
      colors[k] = Eigen::Vector3d(0.6 - 0.6 * s, 0.8 - 0.8 * s, 1.0 - 0.2 * s);
    } else if (Contains(names[k], "right_")) {
      const double s = static_cast<double>(i_right++) / 7.0;
      colors[k] = Eigen::Vector3d(1.0 - 0.2 * s, 0.6 - 0.6 * s, 0.6 - 0.6 * s);
    }
  }
  colors[nose - names.begin()] = Eigen::Vector3d(1.0, 1.0, 0.0);
  return colors;
}

}  // namespace

void Skeleton::Validate() const {
  const int n = num_markers();
  for (const Segment& s : segments) {
    MVLABEL_REQUIRE(s.from >= 0 && s.from < n && s.to >= 0 && s.to < n,
                    "Skeleton segment refers to a missing marker (" + std::to_string(s.from) + ", " +
                        std::to_string(s.to) + ")");
  }
  MVLABEL_REQUIRE(segment_colors.empty() || segment_colors.size() == segments.size(),
                  "Skeleton: segment color count does not match segment count");
  MVLABEL_REQUIRE(marker_colors.empty() || static_cast<int>(marker_colors.size()) == n,
                  "Skeleton: marker color count does not match marker count");
}

Eigen::Vector3d Skeleton::MarkerColor(MarkerId m) const {
  if (m >= 0 && m < static_cast<int>(marker_colors.size())) return marker_colors[m];
  return Eigen::Vector3d::Ones();
}

Skeleton ReplicateSkeleton(const Skeleton& base, int num_animals) {
  MVLABEL_REQUIRE(num_animals >= 1, "ReplicateSkeleton: num_animals must be >= 1");
  base.Validate();
  if (num_animals > kNumThemes) {
    std::cerr << "[mvlabel] warning: " << num_animals << " animals but only " << kNumThemes
              << " color themes, colors will repeat\n";
  }

  const int n = base.num_markers();
  const std::vector<Eigen::Vector3d> base_colors = BaseMarkerColors(base.joint_names);

  Skeleton out;
  for (int a = 0; a < num_animals; ++a) {
    const std::string suffix = "_" + std::to_string(a + 1);
    for (const std::string& name : base.joint_names) out.joint_names.push_back(name + suffix);
    for (const Segment& s : base.segments) {
      out.segments.push_back(Segment{s.from + a * n, s.to + a * n});
      out.segment_colors.push_back(kAnimalThemes[a % kNumThemes]);
    }
    out.marker_colors.insert(out.marker_colors.end(), base_colors.begin(), base_colors.end());
  }
  return out;
}

}  // namespace mvlabel
