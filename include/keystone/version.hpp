#pragma once

// keystone/version.hpp — Version manifest for every persisted and wire format.
//
// INVARIANT:
//   Never silently accept data written by a newer format than this build was
//   compiled against. Readers call the check_* helpers before interpreting
//   persisted records.

#include <cstdint>
#include <string>

namespace keystone {
namespace version {

// ---------------------------------------------------------------------------
// WAL_FORMAT_VERSION
// Version 1 = NDJSON events {event_id, execution_id, tenant_id, session_id,
// sequence_no, type, payload, recorded_at, prev_digest, digest}. Stamped into
// the EXECUTION_STARTED payload as "wal_format".
// ---------------------------------------------------------------------------
constexpr uint32_t WAL_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// STATE_LAYOUT_VERSION
// Version 1 = tenant/{t}/{namespace}/{scope}[/{name}] keys, one file per key
// under state/AB/CD/<blake3(key)> with a JSON header line.
// ---------------------------------------------------------------------------
constexpr uint32_t STATE_LAYOUT_VERSION = 1;

// ---------------------------------------------------------------------------
// API_VERSION
// Request/response bodies of ApiRouter and the stdio stream frames.
// ---------------------------------------------------------------------------
constexpr uint32_t API_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, 64-char hex, "wal:"/"idem:"/"id:" domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t wal_format{WAL_FORMAT_VERSION};
  uint32_t state_layout{STATE_LAYOUT_VERSION};
  uint32_t api{API_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // empty if ok
  std::string description;
};

// Rejects WAL streams written by a newer format. Never throws.
CompatibilityResult check_wal_format(uint32_t found);

}  // namespace version
}  // namespace keystone
