#include <mvlabel/annotation/identity.hpp>
#include <mvlabel/common.hpp>

#include <string>
#include <vector>

namespace mvlabel::annotation {

MarkerRange AnimalRange(const CorrespondenceStore& store, int animal) {
  MVLABEL_REQUIRE(animal >= 0 && animal < store.num_animals(),
                  "Invalid animal index " + std::to_string(animal));
  MarkerRange r;
  r.count = store.markers_per_animal();
  r.first = animal * r.count;
  return r;
}

void SwapAnimals(CameraId c, FrameId f, const MarkerRange& a, const MarkerRange& b,
                 CorrespondenceStore* store) {
  MVLABEL_REQUIRE(store, "SwapAnimals: store is null");
  MVLABEL_REQUIRE_CODE(store->num_animals() == 2, ErrorCode::kUnsupportedAnimalCount,
                       "SwapAnimals: identity swap needs exactly 2 animals, session has " +
                           std::to_string(store->num_animals()));
  MVLABEL_REQUIRE_CODE(a.count == b.count, ErrorCode::kInvalidRange,
                       "SwapAnimals: ranges differ in length");
  MVLABEL_REQUIRE_CODE(a.count > 0, ErrorCode::kInvalidRange, "SwapAnimals: empty range");
  MVLABEL_REQUIRE_CODE(a.first >= 0 && b.first >= 0 && a.end() <= store->num_markers() &&
                           b.end() <= store->num_markers(),
                       ErrorCode::kInvalidRange, "SwapAnimals: range outside the marker set");
  MVLABEL_REQUIRE_CODE(!a.Overlaps(b), ErrorCode::kInvalidRange, "SwapAnimals: ranges overlap");
  store->CheckCamera(c);
  store->CheckFrame(f);

  std::vector<Observation> block_a;
  std::vector<Observation> block_b;
  block_a.reserve(a.count);
  block_b.reserve(b.count);
  for (int k = 0; k < a.count; ++k) {
    block_a.push_back(store->observation(a.first + k, c, f));
    block_b.push_back(store->observation(b.first + k, c, f));
  }

  for (int k = 0; k < a.count; ++k) {
    store->PutObservation(a.first + k, c, f, block_b[k]);
    store->PutObservation(b.first + k, c, f, block_a[k]);
  }
}

}  // namespace mvlabel::annotation
