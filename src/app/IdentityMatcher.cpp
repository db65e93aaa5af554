#include "app/IdentityMatcher.hpp"
#include "util/PathKey.hpp"

#include <string>

namespace herd::app {

namespace {

struct ProfileKeys { std::string exe; std::string folder; std::string folder_slash; };
struct ProcessKeys { int32_t pid; std::string exe; std::string cwd; };

} // namespace

MatchDetail match_detailed(const herd::model::ProfileList& profiles,
                           const std::vector<herd::model::LiveProcess>& live) {
  MatchDetail d;
  d.snapshot.entries.reserve(profiles.size());
  d.tiers.assign(profiles.size(), MatchTier::None);
  for (const auto& p : profiles) d.snapshot.entries.emplace_back(p.key, std::nullopt);

  std::vector<ProfileKeys> pk;
  pk.reserve(profiles.size());
  for (const auto& p : profiles) {
    ProfileKeys k{herd::util::match_key(p.exe_path), herd::util::match_key(p.folder), {}};
    k.folder_slash = (k.folder == "/") ? k.folder : k.folder + "/";
    pk.push_back(std::move(k));
  }
  std::vector<ProcessKeys> lk;
  lk.reserve(live.size());
  for (const auto& lp : live) {
    if (lp.pid <= 0) continue;
    lk.push_back(ProcessKeys{lp.pid, herd::util::match_key(lp.exe_path), herd::util::match_key(lp.cwd)});
  }

  auto run_tier = [&](MatchTier tier, auto&& pred) {
    for (size_t i = 0; i < profiles.size(); ++i) {
      if (d.tiers[i] != MatchTier::None) continue;
      for (const auto& proc : lk) {
        if (!pred(pk[i], proc)) continue;
        d.snapshot.entries[i].second = proc.pid;
        d.tiers[i] = tier;
        break;
      }
    }
  };

  run_tier(MatchTier::ExactExe, [](const ProfileKeys& p, const ProcessKeys& q){
    return !q.exe.empty() && !p.exe.empty() && q.exe == p.exe;
  });
  run_tier(MatchTier::ExactCwd, [](const ProfileKeys& p, const ProcessKeys& q){
    return !q.cwd.empty() && !p.folder.empty() && q.cwd == p.folder;
  });
  run_tier(MatchTier::ExePrefix, [](const ProfileKeys& p, const ProcessKeys& q){
    return !q.exe.empty() && !p.folder.empty() && q.exe.starts_with(p.folder_slash);
  });
  return d;
}

herd::model::PidSnapshot match(const herd::model::ProfileList& profiles,
                               const std::vector<herd::model::LiveProcess>& live) {
  return match_detailed(profiles, live).snapshot;
}

herd::model::PidSnapshot match_unavailable(const herd::model::ProfileList& profiles) {
  herd::model::PidSnapshot s;
  s.degraded = true;
  s.entries.reserve(profiles.size());
  for (const auto& p : profiles) s.entries.emplace_back(p.key, std::nullopt);
  return s;
}

} // namespace herd::app
