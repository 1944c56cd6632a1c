#include "sandcell/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "sandcell/jsonlite.hpp"

namespace sandcell {

namespace {

// bit_width gives the bucket index in O(1) (BSR/CLZ). floor(log2(x)) + 1.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of bucket i. Bucket 0 covers [0,1)us -> 0.5us.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  append_fixed(out, "%.3f", mean_us() / 1000.0);
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_error(ErrorCode code) {
  if (code == ErrorCode::none) return;
  std::lock_guard<std::mutex> lk(errors_mu_);
  error_counts_[to_string(code)]++;
}

void EngineStats::record_execution(const ExecutionEvent& ev) {
  total_executions.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    successful_executions.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_executions.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.timed_out) timed_out_executions.fetch_add(1, std::memory_order_relaxed);
  if (ev.simulated) simulated_executions.fetch_add(1, std::memory_order_relaxed);
  if (auto code = error_code_from_string(ev.error_kind)) record_error(*code);

  latency_histogram.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<ExecutionEvent> EngineStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Oldest first.
  std::vector<ExecutionEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string EngineStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) { return std::to_string(a.load(std::memory_order_relaxed)); };

  std::string out;
  out.reserve(1024);
  out += "{\"executions\":{\"total\":" + n(total_executions);
  out += ",\"successful\":" + n(successful_executions);
  out += ",\"failed\":" + n(failed_executions);
  out += ",\"timed_out\":" + n(timed_out_executions);
  out += ",\"simulated\":" + n(simulated_executions);
  out += "},\"images\":{\"pulls\":" + n(image_pulls);
  out += ",\"pull_failures\":" + n(image_pull_failures);
  out += ",\"cache_hits\":" + n(image_cache_hits);
  out += ",\"joined_waiters\":" + n(image_pull_waiters);
  out += "},\"sessions\":{\"opened\":" + n(sessions_opened);
  out += ",\"failed\":" + n(sessions_failed);
  out += ",\"closed\":" + n(sessions_closed);
  out += ",\"reaped_idle\":" + n(sessions_reaped_idle);
  out += "},\"admission\":{\"rejections\":" + n(admission_rejections);
  out += ",\"waits\":" + n(admission_waits);
  out += ",\"active_environments\":" + n(environments_active);
  out += "},\"cleanup_failures\":" + n(cleanup_failures);
  out += ",\"latency\":" + latency_histogram.to_json();
  out += ",\"errors\":{";
  {
    std::lock_guard<std::mutex> lk(errors_mu_);
    bool first = true;
    for (const auto& [k, v] : error_counts_) {
      if (!first) out += ',';
      first = false;
      out += "\"" + k + "\":" + std::to_string(v);
    }
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

namespace {
std::atomic<ExecutionEventHook> g_event_hook{nullptr};
std::mutex g_event_log_mu;
}  // namespace

void set_execution_event_hook(ExecutionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

std::string execution_event_to_json(const ExecutionEvent& ev) {
  jsonlite::Object o;
  o["execution_id"] = ev.execution_id;
  o["language"] = ev.language;
  o["backend"] = ev.backend;
  o["ok"] = ev.ok;
  o["error_kind"] = ev.error_kind;
  o["exit_code"] = static_cast<double>(ev.exit_code);
  o["timed_out"] = ev.timed_out;
  o["simulated"] = ev.simulated;
  o["duration_ns"] = static_cast<std::uint64_t>(ev.duration_ns);
  o["admission_ns"] = static_cast<std::uint64_t>(ev.admission_ns);
  o["image_ns"] = static_cast<std::uint64_t>(ev.image_ns);
  o["provision_ns"] = static_cast<std::uint64_t>(ev.provision_ns);
  o["run_ns"] = static_cast<std::uint64_t>(ev.run_ns);
  o["bytes_source"] = static_cast<std::uint64_t>(ev.bytes_source);
  o["bytes_stdin"] = static_cast<std::uint64_t>(ev.bytes_stdin);
  o["bytes_output"] = static_cast<std::uint64_t>(ev.bytes_output);
  o["output_digest"] = ev.output_digest;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

void emit_execution_event(const ExecutionEvent& ev) {
  global_engine_stats().record_execution(ev);

  ExecutionEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // Activation: SANDCELL_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("SANDCELL_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  std::string line = execution_event_to_json(ev);
  line += '\n';
  std::lock_guard<std::mutex> lk(g_event_log_mu);
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace sandcell
