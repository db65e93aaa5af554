#include "app/ProcessOps.hpp"
#include "util/Log.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace herd::app {

namespace {

// Message from the grandchild to the launcher over a close-on-exec pipe:
// either its pid (exec succeeded, pipe closed by exec) or pid + errno.
struct ChildReport {
  int32_t pid;
  int err;
};

bool write_full(int fd, const void* buf, size_t len) {
  const char* p = static_cast<const char*>(buf);
  while (len > 0) {
    ssize_t n = ::write(fd, p, len);
    if (n < 0) { if (errno == EINTR) continue; return false; }
    p += n; len -= static_cast<size_t>(n);
  }
  return true;
}

// Returns bytes read, 0 on EOF, -1 on error.
ssize_t read_full(int fd, void* buf, size_t len) {
  char* p = static_cast<char*>(buf);
  size_t got = 0;
  while (got < len) {
    ssize_t n = ::read(fd, p + got, len - got);
    if (n < 0) { if (errno == EINTR) continue; return -1; }
    if (n == 0) break;
    got += static_cast<size_t>(n);
  }
  return static_cast<ssize_t>(got);
}

// Runs in the forked child only; never returns.
[[noreturn]] void exec_child(const std::string& exe, const std::string& cwd, int report_fd) {
  ChildReport rep{static_cast<int32_t>(::getpid()), 0};
  int devnull = ::open("/dev/null", O_RDWR);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(devnull, STDOUT_FILENO);
    ::dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO) ::close(devnull);
  }
  if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
    rep.err = errno;
    (void)write_full(report_fd, &rep, sizeof(rep));
    ::_exit(127);
  }
  // Report our pid first; exec closes the pipe on success
  (void)write_full(report_fd, &rep.pid, sizeof(rep.pid));
  char* const argv[] = {const_cast<char*>(exe.c_str()), nullptr};
  ::execv(exe.c_str(), argv);
  rep.err = errno;
  (void)write_full(report_fd, &rep.err, sizeof(rep.err));
  ::_exit(127);
}

} // namespace

LaunchOutcome PosixLauncher::launch(const std::string& exe, const std::string& cwd, bool detach) {
  LaunchOutcome out;
  struct stat st{};
  if (::stat(exe.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    out.result = herd::model::OpResult::failure(herd::model::ErrorCode::ExecutableMissing,
                                                "executable not found: " + exe);
    return out;
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    out.result = herd::model::OpResult::failure(herd::model::ErrorCode::LaunchRejected,
                                                std::string("pipe2: ") + std::strerror(errno));
    return out;
  }

  pid_t first = ::fork();
  if (first < 0) {
    int e = errno;
    ::close(fds[0]); ::close(fds[1]);
    out.result = herd::model::OpResult::failure(herd::model::ErrorCode::LaunchRejected,
                                                std::string("fork: ") + std::strerror(e));
    return out;
  }
  if (first == 0) {
    ::close(fds[0]);
    // Intermediate: optionally a new session, then hand the real child over
    // to init so no zombie is left whichever way it ends
    if (detach && ::setsid() < 0) {
      ChildReport rep{0, errno};
      (void)write_full(fds[1], &rep, sizeof(rep));
      ::_exit(127);
    }
    pid_t second = ::fork();
    if (second < 0) {
      ChildReport rep{0, errno};
      (void)write_full(fds[1], &rep, sizeof(rep));
      ::_exit(127);
    }
    if (second == 0) exec_child(exe, cwd, fds[1]);
    ::_exit(0);
  }

  ::close(fds[1]);
  int status = 0;
  while (::waitpid(first, &status, 0) < 0 && errno == EINTR) {}

  ChildReport rep{0, 0};
  ssize_t n = read_full(fds[0], &rep, sizeof(rep));
  ::close(fds[0]);
  if (n == static_cast<ssize_t>(sizeof(int32_t))) {
    // pid only: exec succeeded
    out.pid = rep.pid;
    out.result = herd::model::OpResult::success("started pid " + std::to_string(rep.pid));
    return out;
  }
  int err = (n == static_cast<ssize_t>(sizeof(rep))) ? rep.err : EIO;
  out.result = herd::model::OpResult::failure(herd::model::ErrorCode::LaunchRejected,
                                              "launch " + exe + ": " + std::strerror(err ? err : EIO));
  herd::util::log_error("launcher", "%s", out.result.message.c_str());
  return out;
}

} // namespace herd::app
