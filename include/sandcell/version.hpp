#pragma once

// sandcell/version.hpp - Version manifest for every wire surface.
//
// PURPOSE:
//   A caller or operator can tell which document schemas a build speaks
//   without reading its source. Every format a client parses has a constant
//   here.
//
// INVARIANT:
//   All version constants are compile-time. Adding or removing a required
//   field in any document or frame requires a bump.

#include <cstdint>
#include <string>

namespace sandcell {
namespace version {

// Batch request/result JSON documents.
constexpr uint32_t BATCH_DOCUMENT_VERSION = 2;

// NDJSON terminal frames ({type, sessionId, ...}).
constexpr uint32_t TERMINAL_FRAMING_VERSION = 1;

// Config file schema, reported as "config_version" by validate_config().
constexpr uint32_t CONFIG_SCHEMA_VERSION = 1;

// Output digest: BLAKE3, "out:" domain, 64 hex chars.
constexpr uint32_t DIGEST_VERSION = 1;

struct VersionManifest {
  uint32_t batch_document{BATCH_DOCUMENT_VERSION};
  uint32_t terminal_framing{TERMINAL_FRAMING_VERSION};
  uint32_t config_schema{CONFIG_SCHEMA_VERSION};
  uint32_t digest{DIGEST_VERSION};
  std::string engine_semver;   // From the CMake project version
  std::string hash_primitive;  // "blake3"
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace sandcell
