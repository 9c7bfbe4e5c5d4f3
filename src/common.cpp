#include "taskr/common.hpp"

#include <sstream>

namespace taskr {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryNotFound:
      return "Directory not found";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kDatabaseError:
      return "Database error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::toString() const {
  std::string text(errorCodeToString(code_));
  text += ": ";
  text += message_;
  return text;
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef TASKR_BUILD_ID
  return Version{0, 5, 0, TASKR_BUILD_ID};
#else
  return Version{0, 5, 0, ""};
#endif
}

}  // namespace taskr
