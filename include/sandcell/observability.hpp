#pragma once

// sandcell/observability.hpp - Execution events and engine statistics.
//
// DESIGN:
//   ExecutionEvent is the observable unit of a batch execution. Every run()
//   emits exactly one, which is:
//     - recorded in the process-wide EngineStats (counters, histogram, ring);
//     - appended as one JSON line to $SANDCELL_EVENT_LOG when that is set;
//     - forwarded to an optional hook instead of the file when one is set.
//   Event emission never blocks the execution path beyond one short mutex
//   (ring buffer) and one append.
//
//   Events carry sizes and digests only. Never program output or stdin.
//
// EXTENSION_POINT: metrics_exporter
//   Current: JSONL file + `sandcell doctor` snapshot.
//   Upgrade: register a hook that forwards to a Prometheus or OTLP exporter.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "sandcell/types.hpp"

namespace sandcell {

struct ExecutionEvent {
  std::string execution_id;
  std::string language;
  std::string backend;
  bool ok{false};
  std::string error_kind;  // wire name, empty on success
  int32_t exit_code{-1};
  bool timed_out{false};
  bool simulated{false};

  // Duration breakdown (nanoseconds)
  uint64_t duration_ns{0};   // Whole run() call
  uint64_t admission_ns{0};  // Waiting for an admission slot
  uint64_t image_ns{0};      // ensure_available()
  uint64_t provision_ns{0};  // create + start
  uint64_t run_ns{0};        // start -> exit/timeout

  size_t bytes_source{0};
  size_t bytes_stdin{0};
  size_t bytes_output{0};
  std::string output_digest;
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us). Bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 40;  // Covers past one hour

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds. p in [0.0, 1.0]. 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats - process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; the ring buffer and error-kind map use
// their own mutexes.
class EngineStats {
 public:
  void record_execution(const ExecutionEvent& ev);
  void record_error(ErrorCode code);
  std::string to_json() const;

  // --- Batch executions ---
  std::atomic<uint64_t> total_executions{0};
  std::atomic<uint64_t> successful_executions{0};
  std::atomic<uint64_t> failed_executions{0};
  std::atomic<uint64_t> timed_out_executions{0};
  std::atomic<uint64_t> simulated_executions{0};

  // --- Image cache ---
  std::atomic<uint64_t> image_pulls{0};
  std::atomic<uint64_t> image_pull_failures{0};
  std::atomic<uint64_t> image_cache_hits{0};
  std::atomic<uint64_t> image_pull_waiters{0};  // joined an in-flight pull

  // --- Terminal sessions ---
  std::atomic<uint64_t> sessions_opened{0};
  std::atomic<uint64_t> sessions_failed{0};
  std::atomic<uint64_t> sessions_closed{0};
  std::atomic<uint64_t> sessions_reaped_idle{0};

  // --- Admission ---
  std::atomic<uint64_t> admission_rejections{0};
  std::atomic<uint64_t> admission_waits{0};
  std::atomic<uint64_t> environments_active{0};

  // --- Teardown ---
  std::atomic<uint64_t> cleanup_failures{0};

  LatencyHistogram latency_histogram;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<ExecutionEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<ExecutionEvent> ring_buffer_;
  size_t ring_head_{0};  // Next slot to overwrite once the ring is full

  mutable std::mutex errors_mu_;
  std::map<std::string, uint64_t> error_counts_;
};

EngineStats& global_engine_stats();

// Record + JSONL/hook export of one execution event.
void emit_execution_event(const ExecutionEvent& ev);

using ExecutionEventHook = void (*)(const ExecutionEvent&);
void set_execution_event_hook(ExecutionEventHook hook);

std::string execution_event_to_json(const ExecutionEvent& ev);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace sandcell
