#include "sandcell/version.hpp"

#include <sstream>

#ifndef SANDCELL_VERSION
#define SANDCELL_VERSION "0.0.0"
#endif

namespace sandcell {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = SANDCELL_VERSION;
  m.hash_primitive = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"batch_document\":" << m.batch_document
    << ",\"terminal_framing\":" << m.terminal_framing
    << ",\"config_schema\":" << m.config_schema
    << ",\"digest\":" << m.digest
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace sandcell
