#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "model/Result.hpp"

namespace herd::app {

struct LaunchOutcome {
  herd::model::OpResult result;
  int32_t pid{0}; // valid when result.ok
};

// Process-launch capability.
class IProcessLauncher {
public:
  virtual ~IProcessLauncher() = default;
  // Start exe with working directory cwd. The child is never left as a
  // child of ours; detach additionally puts it in its own session so it
  // survives the supervisor's terminal going away.
  [[nodiscard]] virtual LaunchOutcome launch(const std::string& exe, const std::string& cwd, bool detach) = 0;
};

enum class StopSignal { Graceful, Force };

enum class WaitStatus { Exited, TimedOut, Error };

// Process-termination capability. send() reports ESRCH as NotFound and
// EPERM as AccessDenied.
class IProcessTerminator {
public:
  virtual ~IProcessTerminator() = default;
  [[nodiscard]] virtual herd::model::OpResult send(int32_t pid, StopSignal sig) = 0;
  [[nodiscard]] virtual WaitStatus wait_exit(int32_t pid, std::chrono::milliseconds timeout) = 0;
};

// fork/setsid/exec launcher.
class PosixLauncher : public IProcessLauncher {
public:
  LaunchOutcome launch(const std::string& exe, const std::string& cwd, bool detach) override;
};

// kill(2) plus a pidfd wait (io_uring when available, poll(2) otherwise,
// /proc polling when pidfd_open is unsupported).
class PosixTerminator : public IProcessTerminator {
public:
  herd::model::OpResult send(int32_t pid, StopSignal sig) override;
  WaitStatus wait_exit(int32_t pid, std::chrono::milliseconds timeout) override;

  // True when /proc/<pid> is gone or the process is a zombie.
  [[nodiscard]] static bool proc_gone(int32_t pid);
};

} // namespace herd::app
