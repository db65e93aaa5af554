#pragma once
#include "model/Process.hpp"
#include "model/Profile.hpp"
#include "model/Snapshot.hpp"

namespace herd::app {

// Which heuristic bound a profile to a process.
enum class MatchTier { None = 0, ExactExe = 1, ExactCwd = 2, ExePrefix = 3 };

struct MatchDetail {
  herd::model::PidSnapshot snapshot;
  std::vector<MatchTier> tiers; // parallel to snapshot.entries
};

// Correlate profiles with live processes. Tiers are evaluated globally:
// every profile against tier 1, then the still unmatched ones against
// tier 2, then tier 3. A profile bound by a higher tier keeps that pid.
[[nodiscard]] herd::model::PidSnapshot match(const herd::model::ProfileList& profiles,
                                             const std::vector<herd::model::LiveProcess>& live);

[[nodiscard]] MatchDetail match_detailed(const herd::model::ProfileList& profiles,
                                         const std::vector<herd::model::LiveProcess>& live);

// Degraded snapshot: every pid unset.
[[nodiscard]] herd::model::PidSnapshot match_unavailable(const herd::model::ProfileList& profiles);

} // namespace herd::app
