#pragma once

// sandcell/log.hpp - Operator log lines on stderr.
//
// FORMAT:
//   text (default):  [sandcell] warn workspace: remove failed: ...
//   json:            {"component":"workspace","level":"warn","msg":"...","ts_ms":...}
//
// CONFIGURATION (read once, on first use):
//   SANDCELL_LOG_LEVEL   debug | info | warn | error   (default: warn)
//   SANDCELL_LOG_FORMAT  text | json                   (default: text)
//
// Log lines never carry program output or stdin content. Execution ids,
// images and error details only.

#include <string>
#include <string_view>

namespace sandcell {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);

// Parses "debug"/"info"/"warn"/"error". Unknown -> warn.
LogLevel parse_log_level(std::string_view name);

void set_log_level(LogLevel level);
LogLevel log_level();
void set_log_json(bool json);

bool log_enabled(LogLevel level);
void log(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) { log(LogLevel::debug, component, message); }
inline void log_info(std::string_view component, std::string_view message) { log(LogLevel::info, component, message); }
inline void log_warn(std::string_view component, std::string_view message) { log(LogLevel::warn, component, message); }
inline void log_error(std::string_view component, std::string_view message) { log(LogLevel::error, component, message); }

}  // namespace sandcell
