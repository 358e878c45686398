#include "strata/common.hpp"

#include <sstream>

namespace strata {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kNotRegistered:
      return "Not registered";
    case ErrorCode::kTypeMismatch:
      return "Type mismatch";
    case ErrorCode::kDisposed:
      return "Disposed";
    case ErrorCode::kAmbiguousScope:
      return "Ambiguous scope";
    case ErrorCode::kDuplicateRegistration:
      return "Duplicate registration";
    case ErrorCode::kOutOfOrderScopeDispose:
      return "Out of order scope dispose";
    case ErrorCode::kCircularDependency:
      return "Circular dependency";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
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
#ifdef STRATA_VERSION_BUILD
  return Version{STRATA_VERSION_MAJOR, STRATA_VERSION_MINOR, STRATA_VERSION_PATCH,
                 STRATA_VERSION_BUILD};
#else
  return Version{0, 1, 0, ""};
#endif
}

}  // namespace strata
