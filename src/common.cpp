#include "runewrap/common.hpp"

#include <sstream>

namespace runewrap {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kIndentTooWide:
      return "Indent too wide";
    case ErrorCode::kDecodingError:
      return "Decoding error";
    case ErrorCode::kIoError:
      return "I/O error";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Error::describe() const {
  std::string text(errorCodeToString(code_));
  if (!message_.empty()) {
    text += ": ";
    text += message_;
  }
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
#ifdef RUNEWRAP_VERSION_MAJOR
  return Version{RUNEWRAP_VERSION_MAJOR, RUNEWRAP_VERSION_MINOR, RUNEWRAP_VERSION_PATCH, ""};
#else
  return Version{0, 1, 0, "dev"};
#endif
}

}  // namespace runewrap
