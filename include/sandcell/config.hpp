#pragma once

// sandcell/config.hpp - Engine configuration.
//
// SOURCES (later overrides earlier):
//   1. Compiled defaults (below).
//   2. JSON config file (`sandcell --config FILE`), see validate_config().
//   3. Environment variables, see EngineConfig::apply_env().
//
// Limits handed to every environment come from here and only from here.
// Call sites never hard-code memory, CPU or process caps.
//
// CONFIG FILE SCHEMA (config_version "1"):
//   {
//     "config_version": "1",
//     "backend": "docker" | "host",
//     "docker_binary": "docker",
//     "workspace_root": "/var/lib/sandcell/workspaces",
//     "container_mount_path": "/code",
//     "batch_limits":       {"memory_bytes": N, "cpu_quota_fraction": F, "pids_limit": N},
//     "interactive_limits": {"memory_bytes": N, "cpu_quota_fraction": F, "pids_limit": N},
//     "default_timeout_ms": N, "max_timeout_ms": N,
//     "pull_timeout_ms": N, "backend_call_timeout_ms": N,
//     "max_output_bytes": N,
//     "max_concurrent_environments": N, "admission_wait_ms": N,
//     "session_idle_timeout_ms": N, "closed_session_retention_ms": N,
//     "reaper_interval_ms": N,
//     "allow_degraded_mode": bool,
//     "strict_isolation": bool,
//     "stdin_mode": "stream" | "file",
//     "images": {"python": "python:3.12-alpine", ...}
//   }

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sandcell/types.hpp"

namespace sandcell {

enum class StdinMode { stream, file };

struct EngineConfig {
  std::string backend{"docker"};
  std::string docker_binary{"docker"};
  std::string workspace_root;  // Empty = <temp_dir>/sandcell
  std::string container_mount_path{"/code"};

  ResourceLimits batch_limits{512ull * 1024 * 1024, 0.5, 50};
  ResourceLimits interactive_limits{512ull * 1024 * 1024, 0.5, 100};

  uint64_t default_timeout_ms{10000};
  uint64_t max_timeout_ms{60000};
  uint64_t pull_timeout_ms{300000};
  uint64_t backend_call_timeout_ms{30000};
  size_t max_output_bytes{64 * 1024};

  uint32_t max_concurrent_environments{8};
  uint64_t admission_wait_ms{0};  // 0 = reject immediately when full

  uint64_t session_idle_timeout_ms{30 * 60 * 1000};
  uint64_t closed_session_retention_ms{60 * 1000};
  uint64_t reaper_interval_ms{5000};

  bool allow_degraded_mode{true};
  // Refuse batch runs (EnvironmentStartError) when the backend cannot apply
  // every isolation policy and limit of the environment. Off: the run goes
  // ahead and ExecutionResult::unenforced lists what was missing.
  bool strict_isolation{false};
  StdinMode stdin_mode{StdinMode::stream};

  // language id -> image reference overriding the registry default.
  std::map<std::string, std::string> image_overrides;

  // Resolved workspace root (workspace_root or the temp-dir default).
  std::string resolved_workspace_root() const;

  // Clamp a requested timeout: 0 -> default, above max -> max.
  uint64_t effective_timeout_ms(uint64_t requested_ms) const;

  // Applies SANDCELL_* environment variables on top of this config:
  //   SANDCELL_BACKEND, SANDCELL_DOCKER_BIN, SANDCELL_WORKSPACE_ROOT,
  //   SANDCELL_MAX_CONCURRENT, SANDCELL_ADMISSION_WAIT_MS,
  //   SANDCELL_DEFAULT_TIMEOUT_MS, SANDCELL_MAX_TIMEOUT_MS,
  //   SANDCELL_MAX_OUTPUT_BYTES, SANDCELL_SESSION_IDLE_TIMEOUT_MS,
  //   SANDCELL_STDIN_MODE, SANDCELL_DEGRADED_DISABLED=1,
  //   SANDCELL_STRICT_ISOLATION=1
  void apply_env();

  // Defaults + environment. Call once at startup.
  static EngineConfig from_env();
};

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Checks a config document without applying it. Unknown keys are warnings;
// wrong types and out-of-range values are errors.
ConfigValidationResult validate_config(const std::string& config_json);

// Parses and applies a config document on top of base. Returns nullopt (and
// fills *validation) when the document has errors.
std::optional<EngineConfig> load_config_json(const std::string& config_json,
                                             const EngineConfig& base,
                                             ConfigValidationResult* validation);

std::string to_string(StdinMode mode);

}  // namespace sandcell
