#pragma once

// sandcell/admission.hpp - Bound on simultaneous environments.
//
// One gate is shared by the batch controller and the terminal manager. A
// ticket is held from before workspace acquisition until after teardown, so
// the bound covers every live environment and workspace. When the gate is
// full, acquire() waits up to the configured time and then fails with
// CapacityExceeded. Per-environment limits are never lowered to make room.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "sandcell/types.hpp"

namespace sandcell {

class AdmissionGate;

// RAII slot. Movable, releases once.
class AdmissionTicket {
 public:
  AdmissionTicket() = default;
  explicit AdmissionTicket(AdmissionGate* gate) : gate_(gate) {}
  ~AdmissionTicket() { release(); }

  AdmissionTicket(AdmissionTicket&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
  AdmissionTicket& operator=(AdmissionTicket&& other) noexcept;
  AdmissionTicket(const AdmissionTicket&) = delete;
  AdmissionTicket& operator=(const AdmissionTicket&) = delete;

  bool valid() const { return gate_ != nullptr; }
  void release();

 private:
  AdmissionGate* gate_{nullptr};
};

class AdmissionGate {
 public:
  AdmissionGate(std::uint32_t capacity, std::uint64_t wait_ms) : capacity_(capacity), wait_ms_(wait_ms) {}

  // Invalid ticket + CapacityExceeded (or ExecutionCancelled) on failure.
  AdmissionTicket acquire(const CancelToken* cancel, Error* error);

  std::uint32_t in_use() const;
  std::uint32_t capacity() const { return capacity_; }

 private:
  friend class AdmissionTicket;
  void release_slot();

  const std::uint32_t capacity_;
  const std::uint64_t wait_ms_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::uint32_t in_use_{0};
};

}  // namespace sandcell
