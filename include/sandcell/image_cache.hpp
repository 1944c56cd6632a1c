#pragma once

// sandcell/image_cache.hpp - Image presence cache with single-flight pulls.
//
// DESIGN:
//   present_    images known to be local (set on a successful inspect or pull)
//   in_flight_  image -> Flight, one per image while a pull runs
//
//   ensure_available():
//     1. present_ hit                      -> ok
//     2. backend inspect says present      -> remember, ok
//     3. under mu_: join the image's flight, or create it and start the
//        puller thread (exactly one per flight)
//     4. wait on the flight until it completes, the caller's deadline passes
//        or the caller is cancelled
//   The pull runs on its own thread, so a caller giving up never aborts the
//   pull other callers are waiting on.
//
// INVARIANTS:
//   - At most one pull per image at any time.
//   - Every caller joined to a flight sees that flight's outcome.
//   - Failures are not cached: the next caller after a failed flight starts a
//     new one.
//   - The backend must outlive the cache. The destructor waits for running
//     pulls.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "sandcell/backend.hpp"
#include "sandcell/types.hpp"

namespace sandcell {

struct ImageCacheCounters {
  std::atomic<std::uint64_t> pulls_started{0};
  std::atomic<std::uint64_t> pulls_failed{0};
  std::atomic<std::uint64_t> cache_hits{0};
  std::atomic<std::uint64_t> joined_waiters{0};
};

class ImageCache {
 public:
  using Clock = std::chrono::steady_clock;

  ImageCache(IIsolationBackend& backend, std::uint64_t pull_timeout_ms)
      : backend_(backend), pull_timeout_ms_(pull_timeout_ms) {}
  ~ImageCache();

  ImageCache(const ImageCache&) = delete;
  ImageCache& operator=(const ImageCache&) = delete;

  bool ensure_available(const std::string& image, std::optional<Clock::time_point> deadline,
                        const CancelToken* cancel, Error* error);

  bool is_cached(const std::string& image) const;

  // Drops a presence entry (e.g. after the image was removed out of band).
  void forget(const std::string& image);

  const ImageCacheCounters& counters() const { return counters_; }

 private:
  struct Flight {
    bool done{false};
    bool ok{false};
    Error error;
  };

  void run_pull(const std::string& image, std::shared_ptr<Flight> flight);

  IIsolationBackend& backend_;
  std::uint64_t pull_timeout_ms_;

  mutable std::mutex mu_;
  std::condition_variable cv_;  // Signalled when any flight completes
  std::set<std::string> present_;
  std::map<std::string, std::shared_ptr<Flight>> in_flight_;
  std::size_t active_pulls_{0};

  ImageCacheCounters counters_;
};

}  // namespace sandcell
