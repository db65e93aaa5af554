#pragma once
#include "collectors/IProcessSource.hpp"
#include <string>

namespace herd::collectors {

// Walks /proc once per sample. Processes whose comm does not contain
// name_filter (case-insensitive) are skipped before the exe/cwd readlinks;
// an empty filter keeps everything.
class ProcfsProcessSource : public IProcessSource {
public:
  explicit ProcfsProcessSource(std::string name_filter = {});
  bool init() override;
  bool sample(herd::model::ProcessList& out) override;
  const char* name() const override { return "procfs"; }

private:
  std::string name_filter_;
};

} // namespace herd::collectors
