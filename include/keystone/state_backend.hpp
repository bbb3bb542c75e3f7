#pragma once

// keystone/state_backend.hpp — Storage backends behind the State Surface.
//
// DESIGN INVARIANTS (every implementation):
//   1. Versions are assigned by the backend: 1 on first write, previous+1 on
//      every later write of the same key.
//   2. The expected_version check and the write happen atomically per key.
//      Writes to different keys never contend on the same lock stripe more
//      than hashing makes unavoidable.
//   3. Fail-closed: a record whose stored bytes fail integrity verification is
//      reported as corrupt, never returned.
//   4. scan() returns records in key order.
//
// EXTENSION_POINT: remote_backends
//   A Redis-style hot store or a document-store durable backend implements
//   IStateBackend and maps transport failures to BackendStatus::unavailable so
//   the Surface's bounded retry applies unchanged.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "keystone/types.hpp"

namespace keystone {

enum class BackendStatus {
  ok,
  not_found,
  version_conflict,
  unavailable,   // transient: retried by the Surface
  corrupt,
};

std::string to_string(BackendStatus s);

// ---------------------------------------------------------------------------
// IStateBackend
// ---------------------------------------------------------------------------
class IStateBackend {
 public:
  virtual ~IStateBackend() = default;

  // Reads one record. Expired records are still returned; TTL is the
  // Surface's decision.
  virtual BackendStatus read(const std::string& key, StateRecord* out) const = 0;

  // Writes record.key with record.value / expires_at_ms / updated_at_ms.
  // expected_version: nullopt = last-writer-wins, 0 = create-only,
  // n = current version must equal n. On success *new_version is set.
  // On version_conflict *new_version holds the current version.
  virtual BackendStatus write(const StateRecord& record,
                              std::optional<uint64_t> expected_version,
                              uint64_t* new_version) = 0;

  // All records whose key starts with prefix, in key order. limit 0 = all.
  virtual BackendStatus scan(const std::string& prefix, size_t limit,
                             std::vector<StateRecord>* out) const = 0;

  // Drops records expired at now_ms. Returns the number dropped.
  virtual size_t purge_expired(uint64_t now_ms) = 0;

  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// MemoryStateBackend — hot, volatile, lock-striped
// ---------------------------------------------------------------------------
class MemoryStateBackend : public IStateBackend {
 public:
  static constexpr size_t kStripes = 16;

  BackendStatus read(const std::string& key, StateRecord* out) const override;
  BackendStatus write(const StateRecord& record, std::optional<uint64_t> expected_version,
                      uint64_t* new_version) override;
  BackendStatus scan(const std::string& prefix, size_t limit,
                     std::vector<StateRecord>* out) const override;
  size_t purge_expired(uint64_t now_ms) override;
  std::string backend_id() const override { return "memory"; }

  // Installs a record exactly as given (version included). Used by
  // TieredStateBackend to mirror the durable store. Never moves a key's
  // version backwards.
  void install(const StateRecord& record);

  size_t size() const;

 private:
  struct Stripe {
    mutable std::mutex mu;
    std::map<std::string, StateRecord> records;
  };
  Stripe& stripe_for(const std::string& key) const;

  mutable std::array<Stripe, kStripes> stripes_;
};

// ---------------------------------------------------------------------------
// FileStateBackend — durable, one file per key
// ---------------------------------------------------------------------------
// Layout:
//   <root>/state/AB/CD/<blake3(key)>
// File = one JSON header line {key, version, expires_at, updated_at,
// encoding, original_size, blob_hash} + '\n' + payload bytes.
// Writes are tmp + rename in the target directory (atomic on POSIX).
// The header index is rebuilt from disk at construction.
class FileStateBackend : public IStateBackend {
 public:
  // compression: "off" or "zstd" (effective only when built with
  // KEYSTONE_WITH_ZSTD).
  explicit FileStateBackend(std::string root, std::string compression = "off");

  BackendStatus read(const std::string& key, StateRecord* out) const override;
  BackendStatus write(const StateRecord& record, std::optional<uint64_t> expected_version,
                      uint64_t* new_version) override;
  BackendStatus scan(const std::string& prefix, size_t limit,
                     std::vector<StateRecord>* out) const override;
  size_t purge_expired(uint64_t now_ms) override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }
  size_t size() const;

 private:
  struct IndexEntry {
    uint64_t version{0};
    uint64_t expires_at_ms{0};
    uint64_t updated_at_ms{0};
  };

  std::string object_path(const std::string& key) const;
  BackendStatus load_file(const std::string& path, StateRecord* out) const;
  void load_index();
  std::mutex& key_lock(const std::string& key);

  std::string root_;
  std::string compression_;
  std::array<std::mutex, 16> key_locks_;
  mutable std::mutex index_mu_;
  std::map<std::string, IndexEntry> index_;
};

// ---------------------------------------------------------------------------
// TieredStateBackend — hot cache in front of a durable authority
// ---------------------------------------------------------------------------
// Writes go to the durable backend first (it owns versions and the CAS
// check), then are mirrored into the hot store. Reads try hot first and
// populate it on a durable hit. Scans always use the durable store.
class TieredStateBackend : public IStateBackend {
 public:
  TieredStateBackend(std::shared_ptr<MemoryStateBackend> hot,
                     std::shared_ptr<IStateBackend> durable);

  BackendStatus read(const std::string& key, StateRecord* out) const override;
  BackendStatus write(const StateRecord& record, std::optional<uint64_t> expected_version,
                      uint64_t* new_version) override;
  BackendStatus scan(const std::string& prefix, size_t limit,
                     std::vector<StateRecord>* out) const override;
  size_t purge_expired(uint64_t now_ms) override;
  std::string backend_id() const override;

 private:
  std::shared_ptr<MemoryStateBackend> hot_;
  std::shared_ptr<IStateBackend> durable_;
};

// Shared by the file-backed stores.
namespace storage {

// tmp + rename into place. Creates parent directories.
bool atomic_write(const std::string& target, const std::string& data);

std::string compress(const std::string& data, const std::string& compression,
                     std::string* encoding);
std::optional<std::string> decompress(const std::string& data, const std::string& encoding,
                                      std::size_t original_size);

}  // namespace storage

}  // namespace keystone
