#include "sandcell/terminal.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

#include "sandcell/hash.hpp"
#include "sandcell/jsonlite.hpp"
#include "sandcell/log.hpp"
#include "sandcell/observability.hpp"

namespace sandcell {

namespace {

constexpr int kPumpWaitMs = 50;
constexpr std::uint64_t kInputWriteTimeoutMs = 2000;
constexpr std::uint64_t kMinReaperIntervalMs = 10;

}  // namespace

std::string to_string(SessionState state) {
  switch (state) {
    case SessionState::created:
      return "created";
    case SessionState::active:
      return "active";
    case SessionState::closing:
      return "closing";
    case SessionState::closed:
      return "closed";
  }
  return "unknown";
}

std::string to_string(OutboundType type) {
  switch (type) {
    case OutboundType::created:
      return "created";
    case OutboundType::output:
      return "output";
    case OutboundType::error:
      return "error";
    case OutboundType::closed:
      return "closed";
  }
  return "unknown";
}

// Member order is teardown order in reverse: on a failed create() the
// channel is reaped first, then the environment removed, then the workspace
// and the admission slot released.
struct TerminalSessionManager::Session {
  std::string id;
  std::string language;
  std::string connection_id;
  std::shared_ptr<ITerminalSink> sink;

  mutable std::mutex mu;
  std::condition_variable cv;
  SessionState state{SessionState::created};
  Clock::time_point last_activity{Clock::now()};
  Clock::time_point closed_at{};
  std::deque<TerminalEvent> queue;
  std::string close_reason;

  AdmissionTicket ticket;
  std::unique_ptr<ScopedWorkspace> workspace;
  std::unique_ptr<ScopedEnvironment> env;
  std::unique_ptr<IEnvironmentChannel> channel;

  std::atomic<bool> pump_stop{false};
  std::thread pump;
  std::thread actor;

  void emit(OutboundType type, std::string data) {
    if (!sink) return;
    try {
      sink->on_event(OutboundEvent{id, type, std::move(data)});
    } catch (const std::exception& e) {
      log_warn("terminal", id + ": sink failed: " + e.what());
    }
  }

  // Caller holds mu. False when closing has already begun.
  bool request_close_locked(const std::string& reason) {
    if (state != SessionState::active) return false;
    state = SessionState::closing;
    close_reason = reason;
    queue.push_back(TerminalEvent::close());
    cv.notify_all();
    return true;
  }

  // The actor's teardown joins the pump, so the actor goes first.
  void join_threads() {
    if (actor.joinable()) actor.join();
    if (pump.joinable()) pump.join();
  }
};

TerminalSessionManager::TerminalSessionManager(Engine& engine) : engine_(engine) {
  reaper_ = std::thread([this] { reaper_loop(); });
}

TerminalSessionManager::~TerminalSessionManager() { shutdown(); }

std::optional<std::string> TerminalSessionManager::create(const std::string& language,
                                                          const std::string& connection_id,
                                                          std::shared_ptr<ITerminalSink> sink, Error* error) {
  const std::string id = new_opaque_id("term");
  auto session = std::make_shared<Session>();
  session->id = id;
  session->connection_id = connection_id;
  session->sink = std::move(sink);

  auto fail = [&](const Error& err) -> std::optional<std::string> {
    global_engine_stats().sessions_failed.fetch_add(1, std::memory_order_relaxed);
    global_engine_stats().record_error(err.code);
    log_warn("terminal", id + ": create failed: " + to_string(err.code) + ": " + err.detail);
    // Release everything before the caller learns of the failure.
    session->channel.reset();
    session->env.reset();
    session->workspace.reset();
    session->ticket.release();
    session->emit(OutboundType::error, err.detail);
    set_error(error, err.code, err.detail);
    return std::nullopt;
  };

  Error err;
  try {
    const LanguageProfile* profile = engine_.registry().lookup(language.empty() ? "shell" : language, &err);
    if (!profile) return fail(err);
    session->language = to_string(profile->id);

    session->ticket = engine_.admission().acquire(nullptr, &err);
    if (!session->ticket.valid()) return fail(err);

    auto ws = engine_.workspaces().acquire_empty(id, &err);
    if (!ws) return fail(err);
    session->workspace = std::make_unique<ScopedWorkspace>(engine_.workspaces(), std::move(*ws));

    const auto pull_deadline = Clock::now() + std::chrono::milliseconds(engine_.config().pull_timeout_ms);
    if (!engine_.images().ensure_available(profile->image, pull_deadline, nullptr, &err)) return fail(err);

    auto created =
        engine_.provisioner().provision(*profile, session->workspace->get(), EnvironmentMode::interactive, &err);
    if (!created) return fail(err);
    session->env = std::make_unique<ScopedEnvironment>(engine_.provisioner(), std::move(*created));

    session->channel = engine_.provisioner().start(session->env->get(), &err);
    if (!session->channel) return fail(err);

    auto unenforced = session->env->get().capabilities.unsupported;
    for (auto& c : session->channel->unenforced()) unenforced.push_back(std::move(c));
    if (!unenforced.empty()) {
      std::string missing;
      for (const auto& c : unenforced) missing += (missing.empty() ? "" : ",") + c;
      log_warn("terminal", id + ": not enforced: " + missing);
    }
  } catch (const std::exception& e) {
    set_error(&err, ErrorCode::infrastructure_error, e.what());
    return fail(err);
  }

  const std::string image = session->env->get().image;

  // Threads start under both locks: the session is never visible to other
  // callers before it is active, and the pump blocks on mu until "created"
  // is out.
  std::unique_lock<std::mutex> rlk(registry_mu_);
  if (shut_down_) {
    rlk.unlock();
    set_error(&err, ErrorCode::infrastructure_error, "terminal manager is shut down");
    return fail(err);
  }
  std::unique_lock<std::mutex> slk(session->mu);
  std::string start_error;
  try {
    session->actor = std::thread([this, s = session.get()] { actor_loop(*s); });
    session->pump = std::thread([this, s = session.get()] { pump_loop(*s); });
  } catch (const std::system_error& e) {
    start_error = std::string("thread start failed: ") + e.what();
  }

  session->state = SessionState::active;
  session->last_activity = Clock::now();
  if (!start_error.empty()) {
    log_error("terminal", id + ": " + start_error);
    const bool actor_running = session->actor.joinable();
    if (actor_running) session->request_close_locked(start_error);
    slk.unlock();
    rlk.unlock();
    if (actor_running) {
      session->join_threads();
    } else {
      teardown(*session, start_error);
    }
    session->emit(OutboundType::error, start_error);
    set_error(error, ErrorCode::infrastructure_error, start_error);
    global_engine_stats().sessions_failed.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  sessions_.emplace(id, session);
  rlk.unlock();
  session->emit(OutboundType::created, {});
  slk.unlock();

  global_engine_stats().sessions_opened.fetch_add(1, std::memory_order_relaxed);
  log_info("terminal", id + " opened (" + session->language + ", " + image + ")");
  return id;
}

// Teardown makes at most two backend calls (stop, remove).
std::chrono::milliseconds TerminalSessionManager::close_wait_limit() const {
  return std::chrono::milliseconds(2 * engine_.config().backend_call_timeout_ms + 5000);
}

std::shared_ptr<TerminalSessionManager::Session> TerminalSessionManager::find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lk(registry_mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

bool TerminalSessionManager::submit(const std::string& session_id, TerminalEvent event, Error* error) {
  auto session = find(session_id);
  if (!session) {
    set_error(error, ErrorCode::session_not_found, "no session " + session_id);
    return false;
  }
  if (event.type == TerminalEventType::resize && (event.cols == 0 || event.rows == 0)) {
    set_error(error, ErrorCode::invalid_request, "resize needs cols > 0 and rows > 0");
    return false;
  }

  std::lock_guard<std::mutex> lk(session->mu);
  if (event.type == TerminalEventType::close) {
    session->request_close_locked("closed by client");
    return true;
  }
  if (session->state != SessionState::active) {
    set_error(error, ErrorCode::input_after_close, "session " + session_id + " is " + to_string(session->state));
    return false;
  }
  session->last_activity = Clock::now();
  session->queue.push_back(std::move(event));
  session->cv.notify_all();
  return true;
}

bool TerminalSessionManager::close(const std::string& session_id, Error* error) {
  auto session = find(session_id);
  if (!session) {
    set_error(error, ErrorCode::session_not_found, "no session " + session_id);
    return false;
  }
  std::unique_lock<std::mutex> lk(session->mu);
  session->request_close_locked("closed by client");
  if (!session->cv.wait_for(lk, close_wait_limit(), [&] { return session->state == SessionState::closed; })) {
    set_error(error, ErrorCode::infrastructure_error, "session " + session_id + " did not close in time");
    return false;
  }
  return true;
}

std::size_t TerminalSessionManager::connection_dropped(const std::string& connection_id) {
  std::vector<std::shared_ptr<Session>> owned;
  {
    std::lock_guard<std::mutex> lk(registry_mu_);
    for (const auto& kv : sessions_) {
      if (kv.second->connection_id == connection_id) owned.push_back(kv.second);
    }
  }

  std::size_t closed = 0;
  for (const auto& s : owned) {
    std::lock_guard<std::mutex> lk(s->mu);
    if (s->request_close_locked("connection dropped")) ++closed;
  }
  const auto limit = close_wait_limit();
  for (const auto& s : owned) {
    std::unique_lock<std::mutex> lk(s->mu);
    if (!s->cv.wait_for(lk, limit, [&] { return s->state == SessionState::closed; })) {
      log_warn("terminal", s->id + ": did not close in time after connection drop");
    }
  }
  if (closed > 0) log_info("terminal", "connection " + connection_id + " dropped, closed " + std::to_string(closed));
  return closed;
}

std::size_t TerminalSessionManager::reap_idle() {
  const auto idle = std::chrono::milliseconds(engine_.config().session_idle_timeout_ms);
  const auto now = Clock::now();

  std::vector<std::shared_ptr<Session>> all;
  {
    std::lock_guard<std::mutex> lk(registry_mu_);
    for (const auto& kv : sessions_) all.push_back(kv.second);
  }

  std::size_t reaped = 0;
  for (const auto& s : all) {
    std::lock_guard<std::mutex> lk(s->mu);
    if (s->state == SessionState::active && now - s->last_activity > idle && s->request_close_locked("idle timeout")) {
      ++reaped;
      log_info("terminal", s->id + " idle, closing");
    }
  }
  global_engine_stats().sessions_reaped_idle.fetch_add(reaped, std::memory_order_relaxed);
  return reaped;
}

std::size_t TerminalSessionManager::evict_closed() {
  const auto retention = std::chrono::milliseconds(engine_.config().closed_session_retention_ms);
  const auto now = Clock::now();

  std::vector<std::shared_ptr<Session>> evicted;
  {
    std::lock_guard<std::mutex> lk(registry_mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      bool expired = false;
      {
        std::lock_guard<std::mutex> slk(it->second->mu);
        expired = it->second->state == SessionState::closed && now - it->second->closed_at >= retention;
      }
      if (expired) {
        evicted.push_back(std::move(it->second));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  // The actor may still be returning from teardown; join outside the lock.
  for (const auto& s : evicted) s->join_threads();
  return evicted.size();
}

std::optional<SessionState> TerminalSessionManager::state(const std::string& session_id) const {
  auto session = find(session_id);
  if (!session) return std::nullopt;
  std::lock_guard<std::mutex> lk(session->mu);
  return session->state;
}

std::size_t TerminalSessionManager::active_count() const {
  std::vector<std::shared_ptr<Session>> all;
  {
    std::lock_guard<std::mutex> lk(registry_mu_);
    for (const auto& kv : sessions_) all.push_back(kv.second);
  }
  return static_cast<std::size_t>(std::count_if(all.begin(), all.end(), [](const std::shared_ptr<Session>& s) {
    std::lock_guard<std::mutex> lk(s->mu);
    return s->state != SessionState::closed;
  }));
}

void TerminalSessionManager::shutdown() {
  {
    std::lock_guard<std::mutex> lk(reaper_mu_);
    stopping_ = true;
  }
  reaper_cv_.notify_all();
  if (reaper_.joinable()) reaper_.join();

  std::map<std::string, std::shared_ptr<Session>> all;
  {
    std::lock_guard<std::mutex> lk(registry_mu_);
    shut_down_ = true;
    all.swap(sessions_);
  }
  for (const auto& kv : all) {
    std::lock_guard<std::mutex> lk(kv.second->mu);
    kv.second->request_close_locked("shutdown");
  }
  for (const auto& kv : all) kv.second->join_threads();
}

void TerminalSessionManager::actor_loop(Session& session) {
  while (true) {
    TerminalEvent ev;
    {
      std::unique_lock<std::mutex> lk(session.mu);
      session.cv.wait(lk, [&] { return !session.queue.empty(); });
      ev = std::move(session.queue.front());
      session.queue.pop_front();
    }

    switch (ev.type) {
      case TerminalEventType::input:
        if (!session.channel->write_all(ev.data, kInputWriteTimeoutMs)) {
          log_debug("terminal", session.id + ": input not delivered");
        }
        break;
      case TerminalEventType::resize:
        if (!session.channel->resize(ev.cols, ev.rows)) {
          log_debug("terminal", session.id + ": resize not applied");
        }
        break;
      case TerminalEventType::close: {
        std::string reason;
        {
          std::lock_guard<std::mutex> lk(session.mu);
          reason = session.close_reason;
        }
        teardown(session, reason);
        return;
      }
    }
  }
}

void TerminalSessionManager::pump_loop(Session& session) {
  std::string chunk;
  while (!session.pump_stop.load(std::memory_order_acquire)) {
    // chunk keeps the incomplete UTF-8 tail of the previous read.
    const bool open = session.channel->read_output(chunk, kPumpWaitMs);
    const std::size_t whole = open ? jsonlite::utf8_complete_prefix(chunk) : chunk.size();
    std::lock_guard<std::mutex> lk(session.mu);
    if (whole > 0 && session.state == SessionState::active) {
      session.emit(OutboundType::output, chunk.substr(0, whole));
    }
    chunk.erase(0, whole);
    if (!open) {
      session.request_close_locked("environment exited");
      return;
    }
  }
}

void TerminalSessionManager::teardown(Session& session, const std::string& reason) {
  if (session.channel) session.channel->kill();
  if (session.env) {
    Error err;
    if (!engine_.provisioner().stop(session.env->get(), &err)) {
      log_warn("terminal", session.id + ": stop failed: " + err.detail);
    }
  }
  session.pump_stop.store(true, std::memory_order_release);
  if (session.pump.joinable()) session.pump.join();

  session.channel.reset();
  session.env.reset();
  session.workspace.reset();
  session.ticket.release();

  {
    std::lock_guard<std::mutex> lk(session.mu);
    session.state = SessionState::closed;
    session.closed_at = Clock::now();
    session.queue.clear();
    session.emit(OutboundType::closed, reason);
  }
  session.cv.notify_all();
  global_engine_stats().sessions_closed.fetch_add(1, std::memory_order_relaxed);
  log_info("terminal", session.id + " closed (" + reason + ")");
}

void TerminalSessionManager::reaper_loop() {
  const auto interval =
      std::chrono::milliseconds(std::max<std::uint64_t>(engine_.config().reaper_interval_ms, kMinReaperIntervalMs));
  std::unique_lock<std::mutex> lock(reaper_mu_);
  while (!stopping_) {
    reaper_cv_.wait_for(lock, interval, [this] { return stopping_; });
    if (stopping_) break;
    lock.unlock();
    try {
      reap_idle();
      evict_closed();
    } catch (const std::exception& e) {
      log_error("terminal", std::string("reaper: ") + e.what());
    }
    lock.lock();
  }
}

}  // namespace sandcell
