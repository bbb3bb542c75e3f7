#include "keystone/hash.hpp"

// Hash authority.
//
// EXTENSION_POINT: hash_algorithm_upgrade
//   Bump version::HASH_ALGORITHM_VERSION and keep verifying old WAL chains
//   with the previous algorithm for a migration window. The chain genesis
//   (zero_digest) and domain prefixes must not change within a version.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <unistd.h>  // getpid

extern "C" {
#include <blake3.h>
}

namespace keystone {
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

// Process-wide nonce: pid plus 64 random bits, fixed at first use.
const std::string& process_nonce() {
  static const std::string nonce = [] {
    std::random_device rd;
    const uint64_t r = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    return std::to_string(static_cast<long>(::getpid())) + ":" + std::to_string(r);
  }();
  return nonce;
}

std::atomic<uint64_t> g_id_counter{0};

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

std::string wal_chain_digest(std::string_view prev_digest, std::string_view canonical_event) {
  std::string payload;
  payload.reserve(prev_digest.size() + 1 + canonical_event.size());
  payload.append(prev_digest);
  payload.push_back('\n');
  payload.append(canonical_event);
  return hash_domain("wal:", payload);
}

std::string idempotency_digest(std::string_view tenant_id, std::string_view key) {
  // Length prefix keeps ("ab","c") and ("a","bc") apart.
  std::string payload = std::to_string(tenant_id.size());
  payload.push_back(':');
  payload.append(tenant_id);
  payload.append(key);
  return hash_domain("idem:", payload);
}

const std::string& zero_digest() {
  static const std::string z(64, '0');
  return z;
}

std::string generate_id(std::string_view prefix) {
  const uint64_t n = g_id_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const uint64_t ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
  const std::string seed = process_nonce() + ":" + std::to_string(n) + ":" + std::to_string(ns);
  std::string id(prefix);
  id.push_back('_');
  id.append(hash_domain("id:", seed).substr(0, 24));
  return id;
}

}  // namespace keystone
