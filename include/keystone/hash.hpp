#pragma once

// keystone/hash.hpp — BLAKE3 hashing and identifier generation.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Domain separation: "wal:", "idem:", "id:" prefixes keep digests from
//      different contexts from ever colliding. The prefixes are part of the
//      on-disk format (see version::HASH_ALGORITHM_VERSION).

#include <string>
#include <string_view>

namespace keystone {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex digest.
std::string blake3_hex(std::string_view payload);

// Digest of domain || payload.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Chain digest of a WAL event: BLAKE3("wal:" || prev_digest || canonical_event).
std::string wal_chain_digest(std::string_view prev_digest, std::string_view canonical_event);

// Storage-safe digest of a caller-supplied idempotency key. The tenant is
// mixed in so identical keys from different tenants never share a slot.
std::string idempotency_digest(std::string_view tenant_id, std::string_view key);

// Genesis value for WAL chains.
const std::string& zero_digest();

// Unique identifier "<prefix>_<24 hex>". Thread-safe; never repeats within a
// process and is collision-resistant across processes (pid, nonce, clock).
std::string generate_id(std::string_view prefix);

}  // namespace keystone
