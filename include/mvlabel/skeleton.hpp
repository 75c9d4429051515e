#pragma once

#include <mvlabel/types.hpp>

#include <Eigen/Core>

#include <string>
#include <vector>

namespace mvlabel {

// Directed edge between two markers.
struct Segment {
  MarkerId from = 0;
  MarkerId to = 0;
};

// Display metadata for the marker set. Colors are RGB in [0, 1].
struct Skeleton {
  std::vector<std::string> joint_names;
  std::vector<Segment> segments;
  std::vector<Eigen::Vector3d> segment_colors;  // one per segment
  std::vector<Eigen::Vector3d> marker_colors;   // one per marker; may be empty

  int num_markers() const { return static_cast<int>(joint_names.size()); }

  // Throws if a segment refers to a missing marker or a color list has the wrong size.
  void Validate() const;

  Eigen::Vector3d MarkerColor(MarkerId m) const;
};

// Duplicates `base` for num_animals animals: names get a "_<k>" suffix (1-based),
// segments are offset by k * base.num_markers(), and each animal's segments use
// one color theme. Per-marker colors follow the COCO-17 left/right gradient when
// the base skeleton has that layout, white otherwise.
Skeleton ReplicateSkeleton(const Skeleton& base, int num_animals);

}  // namespace mvlabel
