#include "sandcell/image_cache.hpp"

#include <exception>
#include <system_error>
#include <thread>

#include "sandcell/log.hpp"
#include "sandcell/observability.hpp"

namespace sandcell {

namespace {
// Cancellation is polled at this interval while waiting on a flight.
constexpr auto kCancelPoll = std::chrono::milliseconds(50);
}  // namespace

ImageCache::~ImageCache() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [&] { return active_pulls_ == 0; });
}

bool ImageCache::is_cached(const std::string& image) const {
  std::lock_guard<std::mutex> lk(mu_);
  return present_.contains(image);
}

void ImageCache::forget(const std::string& image) {
  std::lock_guard<std::mutex> lk(mu_);
  present_.erase(image);
}

void ImageCache::run_pull(const std::string& image, std::shared_ptr<Flight> flight) {
  Error err;
  bool ok = false;
  try {
    ok = backend_.pull_image(image, pull_timeout_ms_, &err);
  } catch (const std::exception& e) {
    set_error(&err, ErrorCode::infrastructure_error, std::string("pull threw: ") + e.what());
  }
  if (!ok && err.ok()) set_error(&err, ErrorCode::image_unavailable, "pull failed: " + image);

  if (ok) {
    log_info("image_cache", "pulled " + image);
  } else {
    counters_.pulls_failed.fetch_add(1, std::memory_order_relaxed);
    global_engine_stats().image_pull_failures.fetch_add(1, std::memory_order_relaxed);
    log_warn("image_cache", err.detail);
  }

  std::lock_guard<std::mutex> lk(mu_);
  flight->done = true;
  flight->ok = ok;
  flight->error = err;
  if (ok) present_.insert(image);
  in_flight_.erase(image);
  --active_pulls_;
  // Notify under the lock: once it is released this thread touches nothing
  // owned by the cache, so the destructor may proceed.
  cv_.notify_all();
}

bool ImageCache::ensure_available(const std::string& image, std::optional<Clock::time_point> deadline,
                                  const CancelToken* cancel, Error* error) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (present_.contains(image)) {
      counters_.cache_hits.fetch_add(1, std::memory_order_relaxed);
      global_engine_stats().image_cache_hits.fetch_add(1, std::memory_order_relaxed);
      return true;
    }
  }

  Error inspect_err;
  std::optional<bool> local;
  try {
    local = backend_.image_present(image, &inspect_err);
  } catch (const std::exception& e) {
    set_error(&inspect_err, ErrorCode::infrastructure_error, std::string("inspect threw: ") + e.what());
  }
  if (!local) {
    set_error(error, inspect_err.ok() ? ErrorCode::infrastructure_error : inspect_err.code,
              inspect_err.detail.empty() ? "image inspect failed: " + image : inspect_err.detail);
    return false;
  }

  std::unique_lock<std::mutex> lk(mu_);
  if (*local || present_.contains(image)) {
    present_.insert(image);
    counters_.cache_hits.fetch_add(1, std::memory_order_relaxed);
    global_engine_stats().image_cache_hits.fetch_add(1, std::memory_order_relaxed);
    return true;
  }

  std::shared_ptr<Flight> flight;
  if (auto it = in_flight_.find(image); it != in_flight_.end()) {
    flight = it->second;
    counters_.joined_waiters.fetch_add(1, std::memory_order_relaxed);
    global_engine_stats().image_pull_waiters.fetch_add(1, std::memory_order_relaxed);
  } else {
    flight = std::make_shared<Flight>();
    in_flight_.emplace(image, flight);
    ++active_pulls_;
    counters_.pulls_started.fetch_add(1, std::memory_order_relaxed);
    global_engine_stats().image_pulls.fetch_add(1, std::memory_order_relaxed);
    try {
      std::thread([this, image, flight] { run_pull(image, flight); }).detach();
    } catch (const std::system_error& e) {
      in_flight_.erase(image);
      --active_pulls_;
      flight->done = true;
      set_error(&flight->error, ErrorCode::infrastructure_error, std::string("pull thread: ") + e.what());
      cv_.notify_all();
    }
  }

  while (!flight->done) {
    if (cancel && cancel->cancelled()) {
      set_error(error, ErrorCode::execution_cancelled, "cancelled while waiting for image " + image);
      return false;
    }
    auto wake = Clock::now() + kCancelPoll;
    if (deadline) {
      if (Clock::now() >= *deadline) {
        set_error(error, ErrorCode::image_unavailable, "gave up waiting for pull of " + image);
        return false;
      }
      if (*deadline < wake) wake = *deadline;
    }
    cv_.wait_until(lk, wake);
  }

  if (!flight->ok) {
    set_error(error, flight->error.code, flight->error.detail);
    return false;
  }
  return true;
}

}  // namespace sandcell
