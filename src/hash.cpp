#include "sandcell/hash.hpp"

// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive. No fallbacks.
//   2. Domain separation by prefix: "out:" and "id:" digests never collide
//      with each other for the same payload.
//
// to_hex() uses a lookup table for nibble encoding; snprintf("%02x") is
// roughly 3x slower per byte.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>

#include <unistd.h>

extern "C" {
#include <blake3.h>
}

namespace sandcell {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::atomic<std::uint64_t> g_id_counter{0};

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string output_digest(std::string_view output) {
  return hash_domain("out:", output);
}

std::string new_opaque_id(std::string_view prefix) {
  // Seed material: 128 bits from random_device, a process-wide counter, the
  // pid and a steady clock reading. Any one of them alone keeps ids unique
  // within this process; the random part keeps them unique across hosts.
  std::random_device rd;
  std::array<std::uint32_t, 4> rnd{rd(), rd(), rd(), rd()};
  const std::uint64_t seq = g_id_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = static_cast<std::uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  const auto pid = static_cast<std::uint64_t>(::getpid());

  std::string seed;
  seed.append(reinterpret_cast<const char*>(rnd.data()), rnd.size() * sizeof(std::uint32_t));
  seed.append(reinterpret_cast<const char*>(&seq), sizeof(seq));
  seed.append(reinterpret_cast<const char*>(&now), sizeof(now));
  seed.append(reinterpret_cast<const char*>(&pid), sizeof(pid));

  std::string id(prefix);
  id += '-';
  id += hash_domain("id:", seed).substr(0, 32);
  return id;
}

}  // namespace sandcell
