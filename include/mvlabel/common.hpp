#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace mvlabel {

enum class ErrorCode {
  kNone = 0,
  kInvalidArgument,
  kInvalidCalibration,
  kUndistortionDidNotConverge,
  kInsufficientViews,
  kDegenerateGeometry,
  kUnsupportedAnimalCount,
  kInvalidRange,
  kIo,
};

const char* ErrorCodeName(ErrorCode code);

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
  Error(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_ = ErrorCode::kInvalidArgument;
};

[[noreturn]] inline void Throw(ErrorCode code, const char* file, int line, const std::string& msg) {
  std::ostringstream oss;
  oss << file << ":" << line << ": " << msg;
  throw Error(code, oss.str());
}

[[noreturn]] inline void Throw(const char* file, int line, const std::string& msg) {
  Throw(ErrorCode::kInvalidArgument, file, line, msg);
}

}  // namespace mvlabel

#define MVLABEL_REQUIRE(cond, msg)                   \
  do {                                               \
    if (!(cond)) {                                   \
      ::mvlabel::Throw(__FILE__, __LINE__, (msg));   \
    }                                                \
  } while (0)

#define MVLABEL_REQUIRE_CODE(cond, code, msg)                \
  do {                                                       \
    if (!(cond)) {                                           \
      ::mvlabel::Throw((code), __FILE__, __LINE__, (msg));   \
    }                                                        \
  } while (0)
