#pragma once
#include "model/Process.hpp"

namespace herd::collectors {

// OS process-inspection capability. Implementations are chosen once at
// startup; a source that fails init() is replaced by NullProcessSource.
class IProcessSource {
public:
  virtual ~IProcessSource() = default;

  // Return false if unavailable (no /proc, sandbox).
  [[nodiscard]] virtual bool init() { return true; }

  // Enumerate live processes into out. Return false when inspection failed
  // as a whole; the caller then treats every profile as unknown.
  [[nodiscard]] virtual bool sample(herd::model::ProcessList& out) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

// Degraded source: always unavailable.
class NullProcessSource : public IProcessSource {
public:
  bool init() override { return false; }
  bool sample(herd::model::ProcessList& out) override { out.processes.clear(); return false; }
  const char* name() const override { return "unavailable"; }
};

} // namespace herd::collectors
