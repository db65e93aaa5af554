#include "app/ProcessOps.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#ifdef HERD_HAVE_URING
#include <liburing.h>
#endif
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <thread>

#ifndef SYS_pidfd_open
#define SYS_pidfd_open 434
#endif

namespace herd::app {

using herd::model::ErrorCode;
using herd::model::OpResult;

namespace {

int pidfd_open(int32_t pid) {
  return static_cast<int>(::syscall(SYS_pidfd_open, static_cast<pid_t>(pid), 0));
}

#ifdef HERD_HAVE_URING
// 1 readable, 0 timeout, -1 ring unavailable (caller falls back to poll)
int uring_wait_readable(int fd, std::chrono::milliseconds timeout) {
  struct io_uring ring{};
  if (io_uring_queue_init(2, &ring, 0) < 0) return -1;
  struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
  io_uring_prep_poll_add(sqe, fd, POLLIN);
  io_uring_sqe_set_data64(sqe, 1);
  if (io_uring_submit(&ring) < 0) { io_uring_queue_exit(&ring); return -1; }
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  struct __kernel_timespec ts{};
  ts.tv_sec = secs.count();
  ts.tv_nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - secs).count();
  struct io_uring_cqe* cqe = nullptr;
  int rc = 0;
  int ret;
  while ((ret = io_uring_wait_cqe_timeout(&ring, &cqe, &ts)) == -EINTR) {}
  if (ret == 0 && cqe) {
    rc = (cqe->res >= 0) ? 1 : -1;
    io_uring_cqe_seen(&ring, cqe);
  } else if (ret != -ETIME) {
    rc = -1;
  }
  io_uring_queue_exit(&ring);
  return rc;
}
#endif

// 1 readable, 0 timeout, -1 error
int poll_wait_readable(int fd, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (left.count() < 0) left = std::chrono::milliseconds(0);
    struct pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    int rv = ::poll(&pfd, 1, static_cast<int>(left.count()));
    if (rv > 0) return 1;
    if (rv == 0) return 0;
    if (errno != EINTR) return -1;
  }
}

} // namespace

bool PosixTerminator::proc_gone(int32_t pid) {
  auto state = herd::util::read_state(pid);
  return !state || *state == 'Z' || *state == 'X';
}

OpResult PosixTerminator::send(int32_t pid, StopSignal sig) {
  int signo = (sig == StopSignal::Graceful) ? SIGTERM : SIGKILL;
  if (::kill(static_cast<pid_t>(pid), signo) == 0) {
    return OpResult::success(std::string(sig == StopSignal::Graceful ? "SIGTERM" : "SIGKILL") + " sent to " + std::to_string(pid));
  }
  int e = errno;
  if (e == ESRCH) return OpResult{true, ErrorCode::NotFound, "pid " + std::to_string(pid) + " already gone"};
  if (e == EPERM) return OpResult::failure(ErrorCode::AccessDenied, "access denied for pid " + std::to_string(pid));
  return OpResult::failure(ErrorCode::Other, "kill " + std::to_string(pid) + ": " + std::strerror(e));
}

WaitStatus PosixTerminator::wait_exit(int32_t pid, std::chrono::milliseconds timeout) {
  int fd = pidfd_open(pid);
  if (fd < 0) {
    if (errno == ESRCH) return WaitStatus::Exited;
    // No pidfd support: poll /proc
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
      if (proc_gone(pid)) return WaitStatus::Exited;
      if (std::chrono::steady_clock::now() >= deadline) return WaitStatus::TimedOut;
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }

  int rc = -1;
#ifdef HERD_HAVE_URING
  rc = uring_wait_readable(fd, timeout);
#endif
  if (rc < 0) rc = poll_wait_readable(fd, timeout);
  ::close(fd);
  if (rc > 0) return WaitStatus::Exited;
  if (rc == 0) return proc_gone(pid) ? WaitStatus::Exited : WaitStatus::TimedOut;
  herd::util::log_error("terminator", "waiting on pid %d failed: %s", pid, std::strerror(errno));
  return WaitStatus::Error;
}

} // namespace herd::app
