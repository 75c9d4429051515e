#pragma once

#include <mvlabel/annotation/correspondence_store.hpp>
#include <mvlabel/types.hpp>

namespace mvlabel::annotation {

// Contiguous block of marker ids [first, first + count).
struct MarkerRange {
  MarkerId first = 0;
  int count = 0;

  MarkerId end() const { return first + count; }
  bool Overlaps(const MarkerRange& other) const {
    return first < other.end() && other.first < end();
  }
};

// Marker block owned by one animal (0-based).
MarkerRange AnimalRange(const CorrespondenceStore& store, int animal);

// Exchanges the full observation (position, status, hand-labeled flag) of every
// marker in a with the marker at the same offset in b, for one camera and frame.
// World points, initial positions and other cameras/frames are not touched.
// Throws kUnsupportedAnimalCount unless the store has exactly two animals, and
// kInvalidRange for unequal, overlapping, empty or out-of-bounds ranges. Nothing
// is written when it throws.
void SwapAnimals(CameraId c, FrameId f, const MarkerRange& a, const MarkerRange& b,
                 CorrespondenceStore* store);

}  // namespace mvlabel::annotation
