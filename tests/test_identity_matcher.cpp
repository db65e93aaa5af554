#include "minitest.hpp"
#include "app/IdentityMatcher.hpp"

#include <optional>
#include <string>
#include <vector>

using herd::app::match;
using herd::app::match_detailed;
using herd::app::MatchTier;
using herd::model::LiveProcess;
using herd::model::Profile;

static Profile make_profile(const std::string& folder, const std::string& exe_name = "Telegram") {
  Profile p;
  p.key = folder;
  p.folder = folder;
  p.display_name = folder.substr(folder.rfind('/') + 1);
  p.exe_path = folder + "/" + exe_name;
  return p;
}

static LiveProcess proc(int pid, const std::string& exe, const std::string& cwd = "") {
  return LiveProcess{pid, "Telegram", exe, cwd};
}

TEST(match_exact_exe) {
  std::vector<Profile> profiles{make_profile("/opt/tg/T1"), make_profile("/opt/tg/T2")};
  auto snap = match(profiles, {proc(100, "/opt/tg/T2/Telegram"), proc(200, "/usr/bin/bash")});
  ASSERT_FALSE(snap.degraded);
  ASSERT_EQ(snap.entries.size(), 2u);
  ASSERT_TRUE(snap.pid_of("/opt/tg/T1") == std::nullopt);
  ASSERT_TRUE(snap.pid_of("/opt/tg/T2") == std::optional<int32_t>(100));
}

TEST(match_exact_exe_is_case_insensitive) {
  std::vector<Profile> profiles{make_profile("/opt/tg/T1")};
  auto snap = match(profiles, {proc(7, "/OPT/TG/t1/telegram")});
  ASSERT_TRUE(snap.pid_of("/opt/tg/T1") == std::optional<int32_t>(7));
}

TEST(match_by_working_directory) {
  std::vector<Profile> profiles{make_profile("/opt/tg/T1")};
  auto d = match_detailed(profiles, {proc(55, "/usr/lib/telegram/Telegram", "/opt/tg/T1/")});
  ASSERT_TRUE(d.snapshot.pid_of("/opt/tg/T1") == std::optional<int32_t>(55));
  ASSERT_TRUE(d.tiers[0] == MatchTier::ExactCwd);
}

TEST(match_by_exe_prefix) {
  std::vector<Profile> profiles{make_profile("/opt/tg/T1")};
  auto d = match_detailed(profiles, {proc(9, "/opt/tg/T1/bin/Updater")});
  ASSERT_TRUE(d.snapshot.pid_of("/opt/tg/T1") == std::optional<int32_t>(9));
  ASSERT_TRUE(d.tiers[0] == MatchTier::ExePrefix);
}

TEST(match_prefix_needs_separator_boundary) {
  std::vector<Profile> profiles{make_profile("/opt/tg/T1")};
  auto snap = match(profiles, {proc(9, "/opt/tg/T10/Telegram")});
  ASSERT_TRUE(snap.pid_of("/opt/tg/T1") == std::nullopt);
}

TEST(match_exact_tier_not_displaced_by_prefix_tier) {
  // Nested layout: /t/A is a prefix of /t/A/B/Telegram, which is B's exact exe
  auto outer = make_profile("/t/A", "Telegram");
  auto inner = make_profile("/t/A/B", "Telegram");
  std::vector<Profile> profiles{outer, inner};
  // The prefix-capable process comes first in enumeration order
  auto d = match_detailed(profiles, {proc(300, "/t/A/B/Telegram"), proc(400, "/t/A/Telegram")});
  ASSERT_TRUE(d.snapshot.pid_of("/t/A/B") == std::optional<int32_t>(300));
  ASSERT_TRUE(d.tiers[1] == MatchTier::ExactExe);
  ASSERT_TRUE(d.snapshot.pid_of("/t/A") == std::optional<int32_t>(400));
  ASSERT_TRUE(d.tiers[0] == MatchTier::ExactExe);
}

TEST(match_higher_tier_wins_over_earlier_lower_tier_candidate) {
  std::vector<Profile> profiles{make_profile("/t/A")};
  // pid 1 only matches by prefix, pid 2 by cwd, pid 3 exactly; exact must win
  auto d = match_detailed(profiles, {proc(1, "/t/A/helper"), proc(2, "/x/y", "/t/A"), proc(3, "/t/A/Telegram")});
  ASSERT_TRUE(d.snapshot.pid_of("/t/A") == std::optional<int32_t>(3));
  ASSERT_TRUE(d.tiers[0] == MatchTier::ExactExe);
}

TEST(match_one_process_may_satisfy_several_profiles) {
  auto outer = make_profile("/t/A");
  auto inner = make_profile("/t/A/B");
  std::vector<Profile> profiles{outer, inner};
  auto snap = match(profiles, {proc(300, "/t/A/B/Telegram")});
  ASSERT_TRUE(snap.pid_of("/t/A/B") == std::optional<int32_t>(300));
  ASSERT_TRUE(snap.pid_of("/t/A") == std::optional<int32_t>(300)); // prefix tier
}

TEST(match_ignores_unreadable_fields) {
  std::vector<Profile> profiles{make_profile("/t/A")};
  auto snap = match(profiles, {proc(5, "", "")});
  ASSERT_TRUE(snap.pid_of("/t/A") == std::nullopt);
}

TEST(match_unavailable_reports_every_profile_unknown) {
  std::vector<Profile> profiles{make_profile("/t/A"), make_profile("/t/B")};
  auto snap = herd::app::match_unavailable(profiles);
  ASSERT_TRUE(snap.degraded);
  ASSERT_EQ(snap.entries.size(), 2u);
  for (const auto& [k, v] : snap.entries) ASSERT_FALSE(v.has_value());
}
