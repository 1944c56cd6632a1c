#pragma once

// sandcell/degraded.hpp - Executor used when isolation is unreachable.
//
// Runs nothing. Each request is still validated (UnsupportedLanguage) and its
// source file name resolved, then answered with status=error,
// error_kind=SimulatedExecution, simulated=true, exit_code=-1 and an output
// that names the image and command that would have run. Results are never
// mistakable for real runs.

#include <string>
#include <utility>

#include "sandcell/config.hpp"
#include "sandcell/executor.hpp"
#include "sandcell/language.hpp"

namespace sandcell {

class DegradedExecutor final : public IExecutor {
 public:
  DegradedExecutor(const LanguageRegistry& registry, const EngineConfig& config, std::string reason)
      : registry_(registry), config_(config), reason_(std::move(reason)) {}

  ExecutionResult run(const ExecutionRequest& request, std::uint64_t timeout_ms,
                      const CancelToken* cancel) override;

  std::string mode() const override { return "degraded"; }

 private:
  const LanguageRegistry& registry_;
  const EngineConfig& config_;
  std::string reason_;
};

}  // namespace sandcell
