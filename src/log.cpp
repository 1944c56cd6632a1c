#include "sandcell/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "sandcell/jsonlite.hpp"

namespace sandcell {

namespace {

struct LogSettings {
  std::atomic<int> level{static_cast<int>(LogLevel::warn)};
  std::atomic<bool> json{false};

  LogSettings() {
    if (const char* e = std::getenv("SANDCELL_LOG_LEVEL"); e && e[0]) {
      level.store(static_cast<int>(parse_log_level(e)));
    }
    if (const char* e = std::getenv("SANDCELL_LOG_FORMAT"); e && std::string_view(e) == "json") {
      json.store(true);
    }
  }
};

LogSettings& settings() {
  static LogSettings s;
  return s;
}

// Serializes whole lines so concurrent workers never interleave bytes.
std::mutex g_write_mu;

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "warn";
}

LogLevel parse_log_level(std::string_view name) {
  if (name == "debug") return LogLevel::debug;
  if (name == "info") return LogLevel::info;
  if (name == "error") return LogLevel::error;
  return LogLevel::warn;
}

void set_log_level(LogLevel level) { settings().level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(settings().level.load()); }

void set_log_json(bool json) { settings().json.store(json); }

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= settings().level.load(std::memory_order_relaxed);
}

void log(LogLevel level, std::string_view component, std::string_view message) {
  if (!log_enabled(level)) return;

  std::string line;
  line.reserve(64 + message.size());
  if (settings().json.load(std::memory_order_relaxed)) {
    const auto ts_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    line += "{\"component\":\"";
    line += jsonlite::escape(std::string(component));
    line += "\",\"level\":\"";
    line += to_string(level);
    line += "\",\"msg\":\"";
    line += jsonlite::escape(std::string(message));
    line += "\",\"ts_ms\":";
    line += std::to_string(ts_ms);
    line += "}\n";
  } else {
    line += "[sandcell] ";
    line += to_string(level);
    line += ' ';
    line += component;
    line += ": ";
    line += message;
    line += '\n';
  }

  std::lock_guard<std::mutex> lk(g_write_mu);
  std::fwrite(line.data(), 1, line.size(), stderr);
}

}  // namespace sandcell
