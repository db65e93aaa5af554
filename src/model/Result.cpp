#include "model/Result.hpp"

namespace herd::model {

const char* error_code_name(ErrorCode c) {
  switch (c) {
    case ErrorCode::None: return "none";
    case ErrorCode::DiscoveryError: return "discovery-error";
    case ErrorCode::MatchUnavailable: return "match-unavailable";
    case ErrorCode::ExecutableMissing: return "executable-missing";
    case ErrorCode::LaunchRejected: return "launch-rejected";
    case ErrorCode::NotFound: return "not-found";
    case ErrorCode::AccessDenied: return "access-denied";
    case ErrorCode::Timeout: return "timeout";
    case ErrorCode::Other: return "other";
  }
  return "unknown";
}

} // namespace herd::model
