#include "app/Config.hpp"
#include "app/Supervisor.hpp"
#include "util/Log.hpp"
#include "util/PathKey.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

static std::string stamp() {
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

static void report(const std::string& who, const std::string& msg) {
  std::cout << "[" << stamp() << "] [" << who << "] " << msg << "\n" << std::flush;
}

static void report(const std::string& who, const herd::model::OpResult& r) {
  if (r.ok) report(who, r.message);
  else report(who, r.message + " [" + herd::model::error_code_name(r.code) + "]");
}

static void print_usage() {
  std::cout <<
    "Usage: herd [--base DIR] [--config FILE] COMMAND [ARGS]\n"
    "Commands:\n"
    "  list                         profiles found under the base directory\n"
    "  status                       profiles with their current pid\n"
    "  watch [--interval-ms N] [--iterations N]\n"
    "                               scan continuously and print pid changes\n"
    "  open NAME...                 launch profiles\n"
    "  kill [--force] NAME...       terminate profiles (SIGTERM, then SIGKILL)\n"
    "  restart NAME...              terminate then launch again\n"
    "  toggle NAME...               kill when running, open otherwise\n"
    "  open-all [--max-parallel N]  launch every profile\n"
    "  kill-all --yes [--force]     terminate every running profile\n"
    "  set-base DIR                 remember DIR as the base directory\n"
    "NAME is a folder name, a 1-based index from 'list', or a folder path.\n";
}

static bool parse_int(const std::string& s, int& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

static const herd::model::Profile* lookup(const herd::app::StateStore& st, const std::string& name) {
  if (const auto* p = st.find_by_name(name)) return p;
  if (const auto* p = st.find(herd::util::normalize_path(name))) return p;
  int idx = 0;
  if (parse_int(name, idx) && idx >= 1 && static_cast<size_t>(idx) <= st.profiles().size())
    return &st.profiles()[static_cast<size_t>(idx - 1)];
  return nullptr;
}

static void print_table(const herd::app::StateStore& st, bool with_status) {
  size_t i = 0;
  for (const auto& p : st.profiles()) {
    ++i;
    std::cout << i << "\t" << p.display_name;
    if (with_status) {
      std::cout << "\t" << (p.pid ? "RUNNING" : "STOPPED") << "\t" << (p.pid ? std::to_string(*p.pid) : std::string("-"));
    }
    std::cout << "\t" << p.exe_path << "\n";
  }
}

static void print_change(const herd::model::PidChange& c) {
  if (c.after) report(c.display_name, "RUNNING pid " + std::to_string(*c.after));
  else report(c.display_name, "STOPPED" + (c.before ? " (was pid " + std::to_string(*c.before) + ")" : std::string()));
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  std::string base_override, config_override, cmd;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (cmd.empty() && a == "--base" && i + 1 < argc) base_override = argv[++i];
    else if (cmd.empty() && a == "--config" && i + 1 < argc) config_override = argv[++i];
    else if (a == "-h" || a == "--help") { print_usage(); return 0; }
    else if (cmd.empty()) cmd = a;
    else args.push_back(a);
  }
  if (cmd.empty()) { print_usage(); return 2; }

  auto cfg_path = config_override.empty() ? herd::app::config_file_path() : config_override;
  auto cfg = herd::app::load_config(cfg_path);

  if (cmd == "set-base") {
    if (args.size() != 1) { print_usage(); return 2; }
    auto r = herd::app::discover(args[0], cfg.match.rules);
    if (!r.ok()) { std::cerr << "herd: " << r.detail << "\n"; return 1; }
    if (!herd::app::save_base_dir(cfg_path, args[0])) return 1;
    std::cout << "base directory set to " << args[0] << " (" << r.profiles.size() << " profiles)\n";
    return 0;
  }

  std::string base = base_override.empty() ? cfg.supervisor.base_dir : base_override;
  if (base.empty()) {
    std::cerr << "herd: no base directory; pass --base DIR or run 'herd set-base DIR'\n";
    return 2;
  }

  auto sup = herd::app::Supervisor::make_default(cfg.match.name_filter);
  auto settings = cfg.scan_settings();
  sup->set_settings(settings);
  auto disc = sup->rescan(base, cfg.match.rules);
  if (!disc.ok()) { std::cerr << "herd: " << disc.detail << "\n"; return 1; }

  if (cmd == "list") { print_table(sup->state(), false); return 0; }

  // Every remaining command needs current pids
  (void)sup->refresh_now();
  auto& st = sup->state();
  auto& lc = sup->lifecycle();

  if (cmd == "status") { print_table(st, true); return 0; }

  if (cmd == "watch") {
    int iterations = 0; // 0 => until Ctrl+C
    for (size_t i = 0; i < args.size(); ++i) {
      if (args[i] == "--interval-ms" && i + 1 < args.size()) {
        int ms = 0;
        if (parse_int(args[++i], ms)) settings.interval = std::chrono::milliseconds(ms);
      } else if (args[i] == "--iterations" && i + 1 < args.size()) {
        if (!parse_int(args[++i], iterations)) iterations = 0;
      }
    }
    settings.enabled = true;
    sup->set_settings(settings);
    st.set_listener(print_change);
    for (const auto& p : st.profiles()) print_change(herd::model::PidChange{p.key, p.display_name, std::nullopt, p.pid});
    sup->start();
    for (int i = 0; (iterations <= 0 || i < iterations) && !g_stop.load(); ++i) {
      std::this_thread::sleep_for(herd::app::Supervisor::kDrainTick);
      (void)sup->pump();
    }
    sup->stop();
    herd::util::log_info("watch", "%llu scan(s), %llu snapshot(s) dropped",
                         static_cast<unsigned long long>(sup->scanner().cycles()),
                         static_cast<unsigned long long>(sup->queue().dropped()));
    return 0;
  }

  if (cmd == "open-all") {
    int maxp = settings.max_parallel;
    for (size_t i = 0; i + 1 < args.size(); ++i)
      if (args[i] == "--max-parallel" && !parse_int(args[i + 1], maxp)) maxp = settings.max_parallel;
    int failed = 0;
    for (const auto& o : lc.open_all(st.profiles(), maxp)) {
      report(o.display_name, o.result);
      if (!o.result.ok) ++failed;
    }
    return failed == 0 ? 0 : 1;
  }

  if (cmd == "kill-all") {
    bool yes = false, force = false;
    for (const auto& a : args) { if (a == "--yes" || a == "-y") yes = true; else if (a == "--force") force = true; }
    if (!yes) {
      std::cerr << "herd: kill-all terminates " << st.running_count() << " running profile(s); repeat with --yes\n";
      return 2;
    }
    int failed = 0;
    for (const auto& o : lc.kill_all(st.profiles(), force)) {
      report(o.display_name, o.result);
      if (!o.result.ok) ++failed;
    }
    return failed == 0 ? 0 : 1;
  }

  if (cmd == "open" || cmd == "kill" || cmd == "restart" || cmd == "toggle") {
    bool force = false;
    std::vector<std::string> names;
    for (const auto& a : args) { if (a == "--force") force = true; else names.push_back(a); }
    if (names.empty()) { print_usage(); return 2; }
    int failed = 0;
    for (const auto& n : names) {
      const auto* p = lookup(st, n);
      if (!p) { report(n, "no such profile"); ++failed; continue; }
      herd::model::OpResult r;
      if (cmd == "open") r = lc.open(*p);
      else if (cmd == "restart") r = lc.restart(*p);
      else if (cmd == "toggle") r = lc.toggle(*p);
      else if (p->pid) r = lc.terminate(*p->pid, force);
      else r = herd::model::OpResult::success("not running");
      report(p->display_name, r);
      if (!r.ok) ++failed;
    }
    return failed == 0 ? 0 : 1;
  }

  std::cerr << "herd: unknown command '" << cmd << "'\n";
  print_usage();
  return 2;
}
