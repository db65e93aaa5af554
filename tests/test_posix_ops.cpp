#include "minitest.hpp"
#include "fixtures.hpp"
#include "app/LifecycleController.hpp"
#include "app/IdentityMatcher.hpp"
#include "app/ProcessOps.hpp"
#include "collectors/ProcfsProcessSource.hpp"
#include "util/PathKey.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <cerrno>
#include <sys/wait.h>
#include <unistd.h>

using namespace std::chrono_literals;
using herd::app::PosixLauncher;
using herd::app::PosixTerminator;
using herd::model::ErrorCode;

TEST(posix_launch_missing_executable) {
  PosixLauncher l;
  auto out = l.launch("/nonexistent/herd/Telegram", "/tmp", true);
  ASSERT_FALSE(out.result.ok);
  ASSERT_TRUE(out.result.code == ErrorCode::ExecutableMissing);
}

TEST(posix_launch_not_executable_is_rejected) {
  auto dir = fixtures::scratch("posix_noexec");
  fixtures::write_file(dir / "Telegram", "not a program\n");
  PosixLauncher l;
  auto out = l.launch((dir / "Telegram").string(), dir.string(), true);
  ASSERT_FALSE(out.result.ok);
  ASSERT_TRUE(out.result.code == ErrorCode::LaunchRejected);
  fixtures::cleanup(dir);
}

TEST(posix_launch_detaches_and_terminates) {
  auto dir = fixtures::scratch("posix_launch");
  auto exe = dir / "Telegram";
  fixtures::make_exec(exe, "#!/bin/sh\nexec sleep 30\n");

  PosixLauncher launcher;
  PosixTerminator terminator;
  auto out = launcher.launch(exe.string(), dir.string(), true);
  ASSERT_TRUE(out.result.ok);
  ASSERT_TRUE(out.pid > 0);
  std::this_thread::sleep_for(50ms); // let the shell exec sleep
  ASSERT_FALSE(PosixTerminator::proc_gone(out.pid));
  // Own session, led by the already reaped intermediate child
  pid_t sid = ::getsid(out.pid);
  ASSERT_TRUE(sid > 0);
  ASSERT_NE(sid, ::getsid(0));
  ASSERT_NE(sid, out.pid);
  ASSERT_NE(sid, ::getpid());

  // The scan finds it through its working directory (exe is now sleep)
  herd::model::Profile prof;
  prof.key = prof.folder = herd::util::normalize_path(dir.string());
  prof.display_name = "Telegram";
  prof.exe_path = herd::util::normalize_path(exe.string());
  herd::collectors::ProcfsProcessSource src("");
  herd::model::ProcessList live;
  ASSERT_TRUE(src.sample(live));
  auto snap = herd::app::match({prof}, live.processes);
  ASSERT_TRUE(snap.pid_of(prof.key).has_value());
  ASSERT_EQ(*snap.pid_of(prof.key), out.pid);

  herd::app::LifecycleController lc(launcher, terminator, herd::app::LifecycleTimings{2000ms, 2000ms, 10ms});
  auto r = lc.terminate(out.pid, false);
  ASSERT_TRUE(r.ok);
  ASSERT_TRUE(PosixTerminator::proc_gone(out.pid));
  fixtures::cleanup(dir);
}

TEST(posix_launch_without_detach_leaves_no_child) {
  auto dir = fixtures::scratch("posix_attached");
  auto exe = dir / "Telegram";
  fixtures::make_exec(exe, "#!/bin/sh\nexec sleep 30\n");

  PosixLauncher launcher;
  PosixTerminator terminator;
  auto out = launcher.launch(exe.string(), dir.string(), false);
  ASSERT_TRUE(out.result.ok);
  ASSERT_TRUE(out.pid > 0);
  // Same session as ours, but reparented: not ours to reap
  ASSERT_EQ(::getsid(out.pid), ::getsid(0));
  errno = 0;
  ASSERT_EQ(::waitpid(out.pid, nullptr, WNOHANG), -1);
  ASSERT_EQ(errno, ECHILD);

  herd::app::LifecycleController lc(launcher, terminator, herd::app::LifecycleTimings{2000ms, 2000ms, 10ms});
  ASSERT_TRUE(lc.terminate(out.pid, true).ok);
  fixtures::cleanup(dir);
}

TEST(posix_terminate_unknown_pid_is_not_found) {
  PosixTerminator t;
  // Above the default pid_max of 4194304
  auto r = t.send(99999999, herd::app::StopSignal::Graceful);
  ASSERT_TRUE(r.ok);
  ASSERT_TRUE(r.code == ErrorCode::NotFound);
}

TEST(posix_wait_exit_times_out_on_live_process) {
  PosixTerminator t;
  auto start = std::chrono::steady_clock::now();
  auto st = t.wait_exit(static_cast<int32_t>(::getpid()), 100ms);
  ASSERT_TRUE(st == herd::app::WaitStatus::TimedOut);
  ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 90ms);
}
