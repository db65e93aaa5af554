#pragma once
#include <cstdint>
#include <string>
#include <utility>

namespace herd::model {

enum class ErrorCode {
  None,
  DiscoveryError,     // base directory missing or unreadable
  MatchUnavailable,   // process inspection unavailable
  ExecutableMissing,  // launch: executable not on disk
  LaunchRejected,     // launch: OS refused fork/exec
  NotFound,           // terminate: process already gone (counts as success)
  AccessDenied,       // terminate: EPERM
  Timeout,            // terminate: still alive after the final wait
  Other
};

[[nodiscard]] const char* error_code_name(ErrorCode c);

// Outcome of one OS-call boundary.
struct OpResult {
  bool ok{false};
  ErrorCode code{ErrorCode::None};
  std::string message;

  static OpResult success(std::string msg, ErrorCode c = ErrorCode::None) {
    return OpResult{true, c, std::move(msg)};
  }
  static OpResult failure(ErrorCode c, std::string msg) {
    return OpResult{false, c, std::move(msg)};
  }
};

} // namespace herd::model
