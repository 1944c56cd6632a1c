#include "sandcell/admission.hpp"

#include <algorithm>

#include "sandcell/log.hpp"
#include "sandcell/observability.hpp"

namespace sandcell {

AdmissionTicket& AdmissionTicket::operator=(AdmissionTicket&& other) noexcept {
  if (this != &other) {
    release();
    gate_ = other.gate_;
    other.gate_ = nullptr;
  }
  return *this;
}

void AdmissionTicket::release() {
  if (gate_) {
    gate_->release_slot();
    gate_ = nullptr;
  }
}

AdmissionTicket AdmissionGate::acquire(const CancelToken* cancel, Error* error) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + std::chrono::milliseconds(wait_ms_);

  std::unique_lock<std::mutex> lk(mu_);
  if (in_use_ >= capacity_ && wait_ms_ > 0) {
    global_engine_stats().admission_waits.fetch_add(1, std::memory_order_relaxed);
  }
  while (in_use_ >= capacity_) {
    if (cancel && cancel->cancelled()) {
      set_error(error, ErrorCode::execution_cancelled, "cancelled while waiting for admission");
      return AdmissionTicket();
    }
    const auto now = Clock::now();
    if (now >= deadline) {
      global_engine_stats().admission_rejections.fetch_add(1, std::memory_order_relaxed);
      log_info("admission", "rejected: " + std::to_string(in_use_) + "/" + std::to_string(capacity_) + " in use");
      set_error(error, ErrorCode::capacity_exceeded,
                "all " + std::to_string(capacity_) + " environment slots are in use");
      return AdmissionTicket();
    }
    // Bounded wait so cancellation is noticed.
    cv_.wait_until(lk, std::min(deadline, now + std::chrono::milliseconds(50)));
  }
  ++in_use_;
  global_engine_stats().environments_active.fetch_add(1, std::memory_order_relaxed);
  return AdmissionTicket(this);
}

void AdmissionGate::release_slot() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (in_use_ > 0) --in_use_;
  }
  global_engine_stats().environments_active.fetch_sub(1, std::memory_order_relaxed);
  cv_.notify_one();
}

std::uint32_t AdmissionGate::in_use() const {
  std::lock_guard<std::mutex> lk(mu_);
  return in_use_;
}

}  // namespace sandcell
