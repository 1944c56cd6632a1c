#pragma once

// sandcell/hash.hpp - BLAKE3 digests and opaque identifiers.
//
// DOMAINS:
//   "out:" output digest of a batch execution (determinism checks compare
//          these instead of full output text)
//   "id:"  identifier derivation from random seed material
//   Domain prefixes are part of the digest contract. Never change silently.

#include <string>
#include <string_view>

namespace sandcell {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// 64-char hex digest of captured output.
std::string output_digest(std::string_view output);

// Opaque unique identifier: "<prefix>-" followed by 32 hex chars.
// Only [A-Za-z0-9_-] characters, so ids are safe as path components and
// container names.
std::string new_opaque_id(std::string_view prefix);

}  // namespace sandcell
