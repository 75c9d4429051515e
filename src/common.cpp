#include <mvlabel/common.hpp>
#include <mvlabel/types.hpp>

namespace mvlabel {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "None";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kInvalidCalibration:
      return "InvalidCalibration";
    case ErrorCode::kUndistortionDidNotConverge:
      return "UndistortionDidNotConverge";
    case ErrorCode::kInsufficientViews:
      return "InsufficientViews";
    case ErrorCode::kDegenerateGeometry:
      return "DegenerateGeometry";
    case ErrorCode::kUnsupportedAnimalCount:
      return "UnsupportedAnimalCount";
    case ErrorCode::kInvalidRange:
      return "InvalidRange";
    case ErrorCode::kIo:
      return "Io";
  }
  return "Unknown";
}

const char* LabelStatusName(LabelStatus status) {
  switch (status) {
    case LabelStatus::kUnlabeled:
      return "Unlabeled";
    case LabelStatus::kInitialized:
      return "Initialized";
    case LabelStatus::kLabeled:
      return "Labeled";
    case LabelStatus::kInvisible:
      return "Invisible";
  }
  return "Unknown";
}

bool SameObservation(const Observation& a, const Observation& b) {
  if (a.status != b.status || a.hand_labeled != b.hand_labeled) return false;
  if (a.has_position() != b.has_position()) return false;
  if (!a.has_position()) return true;
  return a.uv_px == b.uv_px;
}

}  // namespace mvlabel
