#include "sandcell/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <set>

#include "sandcell/jsonlite.hpp"
#include "sandcell/language.hpp"

namespace fs = std::filesystem;

namespace sandcell {

namespace {

constexpr const char* kConfigVersion = "1";

// Upper bounds that catch unit mistakes (seconds written as ms, MiB as bytes).
constexpr uint64_t kMaxTimeoutCeilingMs = 24ull * 60 * 60 * 1000;
constexpr uint64_t kMinMemoryBytes = 4ull * 1024 * 1024;

const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys = {
      "config_version", "backend", "docker_binary", "workspace_root",
      "container_mount_path", "batch_limits", "interactive_limits",
      "default_timeout_ms", "max_timeout_ms", "pull_timeout_ms",
      "backend_call_timeout_ms", "max_output_bytes",
      "max_concurrent_environments", "admission_wait_ms",
      "session_idle_timeout_ms", "closed_session_retention_ms",
      "reaper_interval_ms", "allow_degraded_mode", "strict_isolation", "stdin_mode", "images",
  };
  return keys;
}

bool is_u64(const jsonlite::Value& v) { return std::holds_alternative<std::uint64_t>(v.v); }
bool is_number(const jsonlite::Value& v) {
  return std::holds_alternative<std::uint64_t>(v.v) || std::holds_alternative<double>(v.v);
}
bool is_string(const jsonlite::Value& v) { return std::holds_alternative<std::string>(v.v); }
bool is_bool(const jsonlite::Value& v) { return std::holds_alternative<bool>(v.v); }
bool is_object(const jsonlite::Value& v) { return std::holds_alternative<jsonlite::Object>(v.v); }

void check_limits(const std::string& key, const jsonlite::Object& limits,
                  ConfigValidationResult& r) {
  for (const auto& [k, v] : limits) {
    if (k == "memory_bytes") {
      if (!is_u64(v)) r.errors.push_back(key + ".memory_bytes must be a non-negative integer");
      else if (std::get<std::uint64_t>(v.v) < kMinMemoryBytes)
        r.errors.push_back(key + ".memory_bytes below 4 MiB");
    } else if (k == "cpu_quota_fraction") {
      const double f = jsonlite::get_double(limits, k, -1.0);
      if (!is_number(v) || f <= 0.0 || f > 64.0)
        r.errors.push_back(key + ".cpu_quota_fraction must be in (0, 64]");
    } else if (k == "pids_limit") {
      if (!is_u64(v) || std::get<std::uint64_t>(v.v) == 0)
        r.errors.push_back(key + ".pids_limit must be a positive integer");
    } else {
      r.warnings.push_back("unknown key " + key + "." + k);
    }
  }
}

void apply_limits(const jsonlite::Object& limits, ResourceLimits& out) {
  out.memory_bytes = jsonlite::get_u64(limits, "memory_bytes", out.memory_bytes);
  out.cpu_quota_fraction = jsonlite::get_double(limits, "cpu_quota_fraction", out.cpu_quota_fraction);
  out.pids_limit = static_cast<uint32_t>(jsonlite::get_u64(limits, "pids_limit", out.pids_limit));
}

bool env_u64(const char* name, uint64_t& out) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (end == e || *end != '\0') return false;
  out = v;
  return true;
}

std::string env_string(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : std::string();
}

}  // namespace

std::string to_string(StdinMode mode) {
  return mode == StdinMode::stream ? "stream" : "file";
}

std::string EngineConfig::resolved_workspace_root() const {
  if (!workspace_root.empty()) return workspace_root;
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec) tmp = "/tmp";
  return (tmp / "sandcell").string();
}

uint64_t EngineConfig::effective_timeout_ms(uint64_t requested_ms) const {
  if (requested_ms == 0) return default_timeout_ms;
  return requested_ms > max_timeout_ms ? max_timeout_ms : requested_ms;
}

void EngineConfig::apply_env() {
  if (auto v = env_string("SANDCELL_BACKEND"); !v.empty()) backend = v;
  if (auto v = env_string("SANDCELL_DOCKER_BIN"); !v.empty()) docker_binary = v;
  if (auto v = env_string("SANDCELL_WORKSPACE_ROOT"); !v.empty()) workspace_root = v;

  uint64_t n = 0;
  if (env_u64("SANDCELL_MAX_CONCURRENT", n) && n > 0) max_concurrent_environments = static_cast<uint32_t>(n);
  if (env_u64("SANDCELL_ADMISSION_WAIT_MS", n)) admission_wait_ms = n;
  if (env_u64("SANDCELL_DEFAULT_TIMEOUT_MS", n) && n > 0) default_timeout_ms = n;
  if (env_u64("SANDCELL_MAX_TIMEOUT_MS", n) && n > 0) max_timeout_ms = n;
  if (env_u64("SANDCELL_MAX_OUTPUT_BYTES", n) && n > 0) max_output_bytes = static_cast<size_t>(n);
  if (env_u64("SANDCELL_SESSION_IDLE_TIMEOUT_MS", n) && n > 0) session_idle_timeout_ms = n;

  if (auto v = env_string("SANDCELL_STDIN_MODE"); v == "file") stdin_mode = StdinMode::file;
  else if (v == "stream") stdin_mode = StdinMode::stream;

  if (env_string("SANDCELL_DEGRADED_DISABLED") == "1") allow_degraded_mode = false;
  if (auto v = env_string("SANDCELL_STRICT_ISOLATION"); v == "1") strict_isolation = true;
  else if (v == "0") strict_isolation = false;
}

EngineConfig EngineConfig::from_env() {
  EngineConfig c;
  c.apply_env();
  return c;
}

ConfigValidationResult validate_config(const std::string& config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back(err->code + ": " + err->message);
    return r;
  }

  r.config_version = jsonlite::get_string(obj, "config_version", "");
  if (r.config_version.empty()) {
    r.warnings.push_back("config_version missing, assuming " + std::string(kConfigVersion));
    r.config_version = kConfigVersion;
  } else if (r.config_version != kConfigVersion) {
    r.errors.push_back("unsupported config_version " + r.config_version);
  }

  for (const auto& [k, v] : obj) {
    if (!known_keys().contains(k)) {
      r.warnings.push_back("unknown key " + k);
      continue;
    }
    if (k == "config_version") continue;
    if (k == "backend") {
      const auto b = jsonlite::get_string(obj, k, "");
      if (b != "docker" && b != "host") r.errors.push_back("backend must be \"docker\" or \"host\"");
    } else if (k == "docker_binary" || k == "workspace_root") {
      if (!is_string(v) || std::get<std::string>(v.v).empty()) r.errors.push_back(k + " must be a non-empty string");
    } else if (k == "container_mount_path") {
      const auto p = jsonlite::get_string(obj, k, "");
      if (p.size() < 2 || p[0] != '/') r.errors.push_back("container_mount_path must be an absolute path other than /");
    } else if (k == "batch_limits" || k == "interactive_limits") {
      if (!is_object(v)) r.errors.push_back(k + " must be an object");
      else check_limits(k, std::get<jsonlite::Object>(v.v), r);
    } else if (k == "default_timeout_ms" || k == "max_timeout_ms" || k == "pull_timeout_ms" ||
               k == "backend_call_timeout_ms" || k == "session_idle_timeout_ms" ||
               k == "reaper_interval_ms") {
      if (!is_u64(v) || std::get<std::uint64_t>(v.v) == 0) r.errors.push_back(k + " must be a positive integer");
      else if (std::get<std::uint64_t>(v.v) > kMaxTimeoutCeilingMs) r.errors.push_back(k + " exceeds 24h");
    } else if (k == "admission_wait_ms" || k == "closed_session_retention_ms") {
      if (!is_u64(v)) r.errors.push_back(k + " must be a non-negative integer");
    } else if (k == "max_output_bytes" || k == "max_concurrent_environments") {
      if (!is_u64(v) || std::get<std::uint64_t>(v.v) == 0) r.errors.push_back(k + " must be a positive integer");
    } else if (k == "allow_degraded_mode" || k == "strict_isolation") {
      if (!is_bool(v)) r.errors.push_back(k + " must be a boolean");
    } else if (k == "stdin_mode") {
      const auto m = jsonlite::get_string(obj, k, "");
      if (m != "stream" && m != "file") r.errors.push_back("stdin_mode must be \"stream\" or \"file\"");
    } else if (k == "images") {
      if (!is_object(v)) {
        r.errors.push_back("images must be an object");
      } else {
        for (const auto& [lang, image] : std::get<jsonlite::Object>(v.v)) {
          if (!parse_language(lang)) r.errors.push_back("images: unknown language " + lang);
          else if (!is_string(image) || std::get<std::string>(image.v).empty())
            r.errors.push_back("images." + lang + " must be a non-empty string");
        }
      }
    }
  }

  const uint64_t def = jsonlite::get_u64(obj, "default_timeout_ms", 0);
  const uint64_t max = jsonlite::get_u64(obj, "max_timeout_ms", 0);
  if (def > 0 && max > 0 && def > max) r.errors.push_back("default_timeout_ms exceeds max_timeout_ms");

  r.ok = r.errors.empty();
  return r;
}

std::optional<EngineConfig> load_config_json(const std::string& config_json,
                                             const EngineConfig& base,
                                             ConfigValidationResult* validation) {
  auto r = validate_config(config_json);
  if (validation) *validation = r;
  if (!r.ok) return std::nullopt;

  const auto obj = jsonlite::parse(config_json, nullptr);
  EngineConfig c = base;
  c.backend = jsonlite::get_string(obj, "backend", c.backend);
  c.docker_binary = jsonlite::get_string(obj, "docker_binary", c.docker_binary);
  c.workspace_root = jsonlite::get_string(obj, "workspace_root", c.workspace_root);
  c.container_mount_path = jsonlite::get_string(obj, "container_mount_path", c.container_mount_path);
  if (auto l = jsonlite::get_object(obj, "batch_limits")) apply_limits(*l, c.batch_limits);
  if (auto l = jsonlite::get_object(obj, "interactive_limits")) apply_limits(*l, c.interactive_limits);
  c.default_timeout_ms = jsonlite::get_u64(obj, "default_timeout_ms", c.default_timeout_ms);
  c.max_timeout_ms = jsonlite::get_u64(obj, "max_timeout_ms", c.max_timeout_ms);
  c.pull_timeout_ms = jsonlite::get_u64(obj, "pull_timeout_ms", c.pull_timeout_ms);
  c.backend_call_timeout_ms = jsonlite::get_u64(obj, "backend_call_timeout_ms", c.backend_call_timeout_ms);
  c.max_output_bytes = static_cast<size_t>(jsonlite::get_u64(obj, "max_output_bytes", c.max_output_bytes));
  c.max_concurrent_environments = static_cast<uint32_t>(
      jsonlite::get_u64(obj, "max_concurrent_environments", c.max_concurrent_environments));
  c.admission_wait_ms = jsonlite::get_u64(obj, "admission_wait_ms", c.admission_wait_ms);
  c.session_idle_timeout_ms = jsonlite::get_u64(obj, "session_idle_timeout_ms", c.session_idle_timeout_ms);
  c.closed_session_retention_ms =
      jsonlite::get_u64(obj, "closed_session_retention_ms", c.closed_session_retention_ms);
  c.reaper_interval_ms = jsonlite::get_u64(obj, "reaper_interval_ms", c.reaper_interval_ms);
  c.allow_degraded_mode = jsonlite::get_bool(obj, "allow_degraded_mode", c.allow_degraded_mode);
  c.strict_isolation = jsonlite::get_bool(obj, "strict_isolation", c.strict_isolation);
  if (jsonlite::has(obj, "stdin_mode")) {
    c.stdin_mode = jsonlite::get_string(obj, "stdin_mode", "stream") == "file" ? StdinMode::file : StdinMode::stream;
  }
  for (const auto& [lang, image] : jsonlite::get_string_map(obj, "images")) {
    if (auto id = parse_language(lang)) c.image_overrides[to_string(*id)] = image;
  }
  return c;
}

}  // namespace sandcell
