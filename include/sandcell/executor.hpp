#pragma once

// sandcell/executor.hpp - Batch execution.
//
// run() CONTRACT (both implementations):
//   - Never throws. Every failure becomes an ExecutionResult with
//     status=error and error_kind set.
//   - Unknown language -> UnsupportedLanguage before anything is allocated.
//   - Platform failures: exit_code=-1, output=failure detail.
//   - Program outcomes: measured exit_code, captured output.
//   - One ExecutionEvent is emitted per call.
//
// BATCH PIPELINE (BatchExecutionController):
//   lookup profile -> admission ticket -> workspace -> image -> provision ->
//   start -> stream stdin, collect output -> exit | timeout | cancel
//   Teardown is the reverse order of acquisition and happens through scoped
//   owners on every path: environment, then workspace, then admission slot.
//
// TIMEOUT:
//   Measured from environment start (image pulls and container creation do
//   not count against the program). 0 = default_timeout_ms; clamped to
//   max_timeout_ms.
//
// ISOLATION:
//   Whatever the backend could not apply (create-time report plus start-time
//   misses) is logged at warn and listed in ExecutionResult::unenforced. With
//   strict_isolation the run is refused instead: EnvironmentStartError before
//   any program output.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "sandcell/engine.hpp"
#include "sandcell/observability.hpp"
#include "sandcell/types.hpp"

namespace sandcell {

class IExecutor {
 public:
  virtual ~IExecutor() = default;

  virtual ExecutionResult run(const ExecutionRequest& request, std::uint64_t timeout_ms,
                              const CancelToken* cancel) = 0;

  // "docker", "host", or "degraded".
  virtual std::string mode() const = 0;
};

class BatchExecutionController final : public IExecutor {
 public:
  explicit BatchExecutionController(Engine& engine) : engine_(engine) {}

  ExecutionResult run(const ExecutionRequest& request, std::uint64_t timeout_ms,
                      const CancelToken* cancel) override;

  std::string mode() const override { return engine_.backend().backend_id(); }

 private:
  ExecutionResult run_pipeline(const ExecutionRequest& request, const std::string& execution_id,
                               std::uint64_t timeout_ms, const CancelToken* cancel, ExecutionEvent& ev);

  Engine& engine_;
};

// Real controller when the backend answers ping(); otherwise the degraded
// executor when allow_degraded_mode is set; otherwise nullptr with
// InfrastructureError.
std::unique_ptr<IExecutor> make_executor(Engine& engine, Error* error);

// Attaches digest and duration, emits the event. Shared by both executors.
void finish_execution(ExecutionResult& result, ExecutionEvent& ev,
                      std::chrono::steady_clock::time_point started);

// Result for a failure of the platform rather than the program.
ExecutionResult platform_failure(const std::string& execution_id, ErrorCode code, const std::string& detail);

}  // namespace sandcell
