#include "minitest.hpp"
#include "fixtures.hpp"
#include "app/ProfileCatalog.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;
using herd::app::discover;
using herd::app::ExecutableRules;

static std::vector<std::string> names_of(const herd::app::DiscoveryResult& r) {
  std::vector<std::string> out;
  for (const auto& p : r.profiles) out.push_back(p.display_name);
  return out;
}

TEST(catalog_orders_by_numeric_suffix) {
  auto root = fixtures::scratch("cat_order");
  for (const char* d : {"Instance 10", "Instance 2", "Instance 1"})
    fixtures::make_exec(root / d / "Telegram");
  auto r = discover(root);
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(names_of(r), (std::vector<std::string>{"Instance 1", "Instance 2", "Instance 10"}));
  fixtures::cleanup(root);
}

TEST(catalog_unnumbered_names_sort_after_numbered) {
  auto root = fixtures::scratch("cat_unnumbered");
  for (const char* d : {"beta", "Telegram 3", "alpha", "Telegram 1"})
    fixtures::make_exec(root / d / "Telegram");
  auto r = discover(root);
  ASSERT_EQ(names_of(r), (std::vector<std::string>{"Telegram 1", "Telegram 3", "alpha", "beta"}));
  fixtures::cleanup(root);
}

TEST(catalog_skips_folders_without_executable) {
  auto root = fixtures::scratch("cat_skip");
  fixtures::make_exec(root / "Telegram 1" / "Telegram");
  fixtures::make_exec(root / "Telegram 2" / "telegram-desktop");
  fixtures::make_exec(root / "Telegram 3" / "Telegram.exe");
  fixtures::write_file(root / "Telegram 4" / "readme.txt", "no binary here\n");
  fixtures::write_file(root / "stray-file", "not a folder\n");
  auto r = discover(root);
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.profiles.size(), 3u);
  ASSERT_EQ(r.skipped, 1u);
  ASSERT_EQ(names_of(r), (std::vector<std::string>{"Telegram 1", "Telegram 2", "Telegram 3"}));
  ASSERT_EQ(r.profiles[1].exe_path, (root / "Telegram 2" / "telegram-desktop").string());
  fixtures::cleanup(root);
}

TEST(catalog_key_is_normalized_folder) {
  auto root = fixtures::scratch("cat_key");
  fixtures::make_exec(root / "Telegram 1" / "Telegram");
  auto r = discover(root / "." / "");
  ASSERT_EQ(r.profiles.size(), 1u);
  ASSERT_EQ(r.profiles[0].key, (root / "Telegram 1").string());
  ASSERT_EQ(r.profiles[0].folder, r.profiles[0].key);
  ASSERT_FALSE(r.profiles[0].pid.has_value());
  fixtures::cleanup(root);
}

TEST(catalog_repeat_discovery_is_identical) {
  auto root = fixtures::scratch("cat_idem");
  for (const char* d : {"P 5", "P 12", "P 1", "other"})
    fixtures::make_exec(root / d / "Telegram");
  auto a = discover(root);
  auto b = discover(root);
  ASSERT_EQ(a.profiles.size(), b.profiles.size());
  for (size_t i = 0; i < a.profiles.size(); ++i) {
    ASSERT_EQ(a.profiles[i].key, b.profiles[i].key);
    ASSERT_EQ(a.profiles[i].exe_path, b.profiles[i].exe_path);
  }
  fixtures::cleanup(root);
}

TEST(catalog_missing_base_is_discovery_error) {
  auto r = discover("/nonexistent/herd/base/dir");
  ASSERT_FALSE(r.ok());
  ASSERT_TRUE(r.status == herd::model::ErrorCode::DiscoveryError);
  ASSERT_TRUE(r.profiles.empty());
}

TEST(catalog_base_that_is_a_file_is_discovery_error) {
  auto root = fixtures::scratch("cat_file");
  fixtures::write_file(root / "plain", "x");
  auto r = discover(root / "plain");
  ASSERT_TRUE(r.status == herd::model::ErrorCode::DiscoveryError);
  fixtures::cleanup(root);
}

TEST(catalog_prefix_fallback_is_case_insensitive_and_needs_exec_bit) {
  auto root = fixtures::scratch("cat_fallback");
  fixtures::write_file(root / "A 1" / "telegram.log", "log\n");        // not executable
  fixtures::make_exec(root / "A 2" / "TELEGRAM-beta");
  fixtures::make_exec(root / "A 3" / "sub" / "Telegram");              // too deep
  auto r = discover(root);
  ASSERT_EQ(names_of(r), (std::vector<std::string>{"A 2"}));
  ASSERT_EQ(r.profiles[0].exe_path, (root / "A 2" / "TELEGRAM-beta").string());
  fixtures::cleanup(root);
}

TEST(catalog_custom_suffix_rules) {
  auto root = fixtures::scratch("cat_suffix");
  fixtures::write_file(root / "W 1" / "TelegramPortable_v4.EXE", "MZ");
  fixtures::write_file(root / "W 2" / "telegram.txt", "x");
  ExecutableRules rules;
  rules.candidates.clear();
  rules.prefix = "telegram";
  rules.suffix = ".exe";
  auto r = discover(root, rules);
  ASSERT_EQ(names_of(r), (std::vector<std::string>{"W 1"}));
  fixtures::cleanup(root);
}

TEST(catalog_candidates_win_over_prefix_fallback) {
  auto root = fixtures::scratch("cat_cand");
  fixtures::make_exec(root / "T 1" / "telegram-aaa");
  fixtures::make_exec(root / "T 1" / "Telegram");
  auto r = discover(root);
  ASSERT_EQ(r.profiles.size(), 1u);
  ASSERT_EQ(r.profiles[0].exe_path, (root / "T 1" / "Telegram").string());
  fixtures::cleanup(root);
}

TEST(profile_order_parses_trailing_digits) {
  auto o = herd::app::profile_order("Profile 042");
  ASSERT_TRUE(o.has_number);
  ASSERT_EQ(o.number, 42ull);
  ASSERT_FALSE(herd::app::profile_order("Profile").has_number);
  ASSERT_TRUE(herd::app::profile_order_less(herd::app::profile_order("x2"), herd::app::profile_order("a10")));
}
