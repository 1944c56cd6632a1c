#pragma once

// sandcell/terminal.hpp - Interactive terminal sessions.
//
// STATE MACHINE (per session):
//   created --provision+start ok--> active      emits "created"
//   created --any failure---------> (discarded) emits "error", never visible
//   active  --close | connection drop | idle timeout | environment exit-->
//           closing: kill + stop + remove environment, release workspace
//           and admission slot
//   closing --> closed                          emits "closed"
//   closed is terminal: input/resize get InputAfterClose until the record is
//   evicted (closed_session_retention_ms), SessionNotFound after that.
//
// THREADS (per session):
//   actor  consumes the session's event queue in order (input, resize,
//          close) and performs the teardown
//   pump   reads environment output and emits "output" events
//   Output is emitted under the session mutex and only while the session is
//   active, so nothing is emitted after "closed" and no output overtakes
//   "created".
//
// LOCKING:
//   registry_mu_  lookup/insert/erase of the session map only
//   session mu    state, queue, last_activity
//   Never acquired in the order session -> registry.
//
// SINKS:
//   Outbound events go to the ITerminalSink given at create(). on_event() is
//   called from session threads, possibly concurrently for different
//   sessions, and must not call back into the manager.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "sandcell/engine.hpp"

namespace sandcell {

enum class SessionState { created, active, closing, closed };
std::string to_string(SessionState state);

enum class TerminalEventType { input, resize, close };

struct TerminalEvent {
  TerminalEventType type{TerminalEventType::input};
  std::string data;
  std::uint16_t cols{0};
  std::uint16_t rows{0};

  static TerminalEvent input(std::string data) { return {TerminalEventType::input, std::move(data), 0, 0}; }
  static TerminalEvent resize(std::uint16_t cols, std::uint16_t rows) {
    return {TerminalEventType::resize, {}, cols, rows};
  }
  static TerminalEvent close() { return {TerminalEventType::close, {}, 0, 0}; }
};

enum class OutboundType { created, output, error, closed };
std::string to_string(OutboundType type);

struct OutboundEvent {
  std::string session_id;
  OutboundType type{OutboundType::output};
  std::string data;  // output bytes, or the error message
};

class ITerminalSink {
 public:
  virtual ~ITerminalSink() = default;
  virtual void on_event(const OutboundEvent& event) = 0;
};

class TerminalSessionManager {
 public:
  using Clock = std::chrono::steady_clock;

  // Starts the reaper thread.
  explicit TerminalSessionManager(Engine& engine);
  ~TerminalSessionManager();

  TerminalSessionManager(const TerminalSessionManager&) = delete;
  TerminalSessionManager& operator=(const TerminalSessionManager&) = delete;

  // Provisions and starts a session. Empty language = "shell". Returns the
  // session id once it is active; on failure emits "error" to sink and
  // returns nullopt with *error set. After shutdown() every create fails
  // with InfrastructureError.
  std::optional<std::string> create(const std::string& language, const std::string& connection_id,
                                    std::shared_ptr<ITerminalSink> sink, Error* error);

  // Queues an event. SessionNotFound for unknown or evicted ids,
  // InputAfterClose for input/resize once closing has begun. close on a
  // closing or closed session is accepted and does nothing.
  bool submit(const std::string& session_id, TerminalEvent event, Error* error);

  // Queues close and waits until the session is closed.
  bool close(const std::string& session_id, Error* error);

  // Closes every session of a connection and waits (bounded like close())
  // for each to finish. Returns how many were active.
  std::size_t connection_dropped(const std::string& connection_id);

  // Closes sessions idle longer than session_idle_timeout_ms.
  std::size_t reap_idle();

  // Forgets sessions closed longer than closed_session_retention_ms.
  std::size_t evict_closed();

  std::optional<SessionState> state(const std::string& session_id) const;
  std::size_t active_count() const;

  // Closes everything and stops all threads. Idempotent.
  void shutdown();

 private:
  struct Session;

  std::shared_ptr<Session> find(const std::string& session_id) const;
  std::chrono::milliseconds close_wait_limit() const;
  // Both loops run on threads owned by the session and joined before the
  // session record is dropped.
  void actor_loop(Session& session);
  void pump_loop(Session& session);
  void teardown(Session& session, const std::string& reason);
  void reaper_loop();

  Engine& engine_;

  mutable std::mutex registry_mu_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  bool shut_down_{false};  // guarded by registry_mu_; create() refuses once set

  std::mutex reaper_mu_;
  std::condition_variable reaper_cv_;
  bool stopping_{false};
  std::thread reaper_;
};

}  // namespace sandcell
