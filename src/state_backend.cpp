#include "keystone/state_backend.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#if defined(KEYSTONE_WITH_ZSTD)
#include <zstd.h>
#endif

#include "keystone/hash.hpp"
#include "keystone/observability.hpp"

namespace fs = std::filesystem;

namespace keystone {

namespace {

// FNV-1a; stripe selection only, not a content hash.
uint32_t stripe_hash(const std::string& key) {
  uint32_t h = 2166136261u;
  for (unsigned char c : key) {
    h ^= c;
    h *= 16777619u;
  }
  return h;
}

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool version_matches(std::optional<uint64_t> expected, uint64_t current) {
  return !expected.has_value() || *expected == current;
}

}  // namespace

std::string to_string(BackendStatus s) {
  switch (s) {
    case BackendStatus::ok:               return "ok";
    case BackendStatus::not_found:        return "not_found";
    case BackendStatus::version_conflict: return "version_conflict";
    case BackendStatus::unavailable:      return "unavailable";
    case BackendStatus::corrupt:          return "corrupt";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// storage helpers
// ---------------------------------------------------------------------------

namespace storage {

bool atomic_write(const std::string& target, const std::string& data) {
  const fs::path path(target);
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(path.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::string compress(const std::string& data, const std::string& compression,
                     std::string* encoding) {
  *encoding = "identity";
#if defined(KEYSTONE_WITH_ZSTD)
  if (compression == "zstd") {
    std::string out;
    out.resize(ZSTD_compressBound(data.size()));
    const size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
    if (!ZSTD_isError(n)) {
      out.resize(n);
      *encoding = "zstd";
      return out;
    }
    log_event(LogLevel::warn, "state", "zstd compression failed; storing identity");
  }
#else
  (void)compression;
#endif
  return data;
}

std::optional<std::string> decompress(const std::string& data, const std::string& encoding,
                                      std::size_t original_size) {
  if (encoding == "identity") return data;
#if defined(KEYSTONE_WITH_ZSTD)
  if (encoding == "zstd") {
    std::string out;
    out.resize(original_size);
    const size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
    if (ZSTD_isError(n) || n != original_size) return std::nullopt;
    return out;
  }
#else
  (void)original_size;
#endif
  return std::nullopt;
}

}  // namespace storage

// ---------------------------------------------------------------------------
// MemoryStateBackend
// ---------------------------------------------------------------------------

MemoryStateBackend::Stripe& MemoryStateBackend::stripe_for(const std::string& key) const {
  return stripes_[stripe_hash(key) % kStripes];
}

BackendStatus MemoryStateBackend::read(const std::string& key, StateRecord* out) const {
  auto& s = stripe_for(key);
  std::lock_guard<std::mutex> lk(s.mu);
  auto it = s.records.find(key);
  if (it == s.records.end()) return BackendStatus::not_found;
  if (out) *out = it->second;
  return BackendStatus::ok;
}

BackendStatus MemoryStateBackend::write(const StateRecord& record,
                                        std::optional<uint64_t> expected_version,
                                        uint64_t* new_version) {
  auto& s = stripe_for(record.key);
  std::lock_guard<std::mutex> lk(s.mu);
  auto it = s.records.find(record.key);
  const uint64_t current = (it == s.records.end()) ? 0 : it->second.version;
  if (!version_matches(expected_version, current)) {
    if (new_version) *new_version = current;
    return BackendStatus::version_conflict;
  }
  StateRecord stored = record;
  stored.version = current + 1;
  s.records[record.key] = std::move(stored);
  if (new_version) *new_version = current + 1;
  return BackendStatus::ok;
}

BackendStatus MemoryStateBackend::scan(const std::string& prefix, size_t limit,
                                       std::vector<StateRecord>* out) const {
  std::vector<StateRecord> found;
  for (auto& s : stripes_) {
    std::lock_guard<std::mutex> lk(s.mu);
    for (auto it = s.records.lower_bound(prefix); it != s.records.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) break;
      found.push_back(it->second);
    }
  }
  std::sort(found.begin(), found.end(),
            [](const StateRecord& a, const StateRecord& b) { return a.key < b.key; });
  if (limit > 0 && found.size() > limit) found.resize(limit);
  if (out) *out = std::move(found);
  return BackendStatus::ok;
}

size_t MemoryStateBackend::purge_expired(uint64_t now_ms) {
  size_t dropped = 0;
  for (auto& s : stripes_) {
    std::lock_guard<std::mutex> lk(s.mu);
    for (auto it = s.records.begin(); it != s.records.end();) {
      if (it->second.expired(now_ms)) {
        it = s.records.erase(it);
        ++dropped;
      } else {
        ++it;
      }
    }
  }
  return dropped;
}

void MemoryStateBackend::install(const StateRecord& record) {
  auto& s = stripe_for(record.key);
  std::lock_guard<std::mutex> lk(s.mu);
  auto it = s.records.find(record.key);
  if (it != s.records.end() && it->second.version > record.version) return;
  s.records[record.key] = record;
}

size_t MemoryStateBackend::size() const {
  size_t n = 0;
  for (auto& s : stripes_) {
    std::lock_guard<std::mutex> lk(s.mu);
    n += s.records.size();
  }
  return n;
}

// ---------------------------------------------------------------------------
// FileStateBackend
// ---------------------------------------------------------------------------

FileStateBackend::FileStateBackend(std::string root, std::string compression)
    : root_(std::move(root)), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "state", ec);
  if (ec) {
    log_event(LogLevel::error, "state", "cannot create " + root_ + "/state: " + ec.message());
    return;
  }
  load_index();
}

std::string FileStateBackend::object_path(const std::string& key) const {
  const std::string digest = blake3_hex(key);
  return (fs::path(root_) / "state" / digest.substr(0, 2) / digest.substr(2, 2) / digest)
      .string();
}

std::mutex& FileStateBackend::key_lock(const std::string& key) {
  return key_locks_[stripe_hash(key) % key_locks_.size()];
}

BackendStatus FileStateBackend::load_file(const std::string& path, StateRecord* out) const {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return BackendStatus::not_found;
  std::string header_line;
  if (!std::getline(ifs, header_line)) return BackendStatus::corrupt;
  std::ostringstream rest;
  rest << ifs.rdbuf();
  const std::string stored = rest.str();

  std::optional<jsonlite::JsonError> perr;
  const auto header = jsonlite::parse(header_line, &perr);
  if (perr) return BackendStatus::corrupt;

  // Integrity: the payload digest must match what was recorded at write time.
  if (blake3_hex(stored) != jsonlite::get_string(header, "blob_hash")) {
    return BackendStatus::corrupt;
  }
  auto value = storage::decompress(stored, jsonlite::get_string(header, "encoding", "identity"),
                                   jsonlite::get_u64(header, "original_size"));
  if (!value) return BackendStatus::corrupt;

  if (out) {
    out->key = jsonlite::get_string(header, "key");
    out->value = std::move(*value);
    out->version = jsonlite::get_u64(header, "version");
    out->expires_at_ms = jsonlite::get_u64(header, "expires_at");
    out->updated_at_ms = jsonlite::get_u64(header, "updated_at");
  }
  return BackendStatus::ok;
}

void FileStateBackend::load_index() {
  const fs::path base = fs::path(root_) / "state";
  std::error_code ec;
  size_t loaded = 0;
  size_t skipped = 0;
  for (auto it = fs::recursive_directory_iterator(base, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    const std::string name = it->path().filename().string();
    if (name.rfind(".tmp_", 0) == 0) continue;
    StateRecord rec;
    if (load_file(it->path().string(), &rec) != BackendStatus::ok || rec.key.empty()) {
      ++skipped;
      continue;
    }
    std::lock_guard<std::mutex> lk(index_mu_);
    index_[rec.key] = IndexEntry{rec.version, rec.expires_at_ms, rec.updated_at_ms};
    ++loaded;
  }
  if (skipped > 0) {
    log_event(LogLevel::warn, "state",
              "index rebuild skipped " + std::to_string(skipped) + " unreadable record(s)");
  }
  log_event(LogLevel::debug, "state", "index rebuilt: " + std::to_string(loaded) + " record(s)");
}

BackendStatus FileStateBackend::read(const std::string& key, StateRecord* out) const {
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    if (index_.find(key) == index_.end()) return BackendStatus::not_found;
  }
  StateRecord rec;
  const auto st = load_file(object_path(key), &rec);
  if (st != BackendStatus::ok) return st;
  if (rec.key != key) return BackendStatus::corrupt;
  if (out) *out = std::move(rec);
  return BackendStatus::ok;
}

BackendStatus FileStateBackend::write(const StateRecord& record,
                                      std::optional<uint64_t> expected_version,
                                      uint64_t* new_version) {
  std::lock_guard<std::mutex> key_lk(key_lock(record.key));

  uint64_t current = 0;
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    auto it = index_.find(record.key);
    if (it != index_.end()) current = it->second.version;
  }
  if (!version_matches(expected_version, current)) {
    if (new_version) *new_version = current;
    return BackendStatus::version_conflict;
  }

  std::string encoding;
  const std::string stored = storage::compress(record.value, compression_, &encoding);

  jsonlite::Object header;
  header["key"] = jsonlite::make_string(record.key);
  header["version"] = jsonlite::make_u64(current + 1);
  header["expires_at"] = jsonlite::make_u64(record.expires_at_ms);
  header["updated_at"] = jsonlite::make_u64(record.updated_at_ms);
  header["encoding"] = jsonlite::make_string(encoding);
  header["original_size"] = jsonlite::make_u64(record.value.size());
  header["blob_hash"] = jsonlite::make_string(blake3_hex(stored));

  if (!storage::atomic_write(object_path(record.key), jsonlite::to_json(header) + "\n" + stored)) {
    log_event(LogLevel::warn, "state", "write failed for " + record.key);
    return BackendStatus::unavailable;
  }

  {
    std::lock_guard<std::mutex> lk(index_mu_);
    index_[record.key] = IndexEntry{current + 1, record.expires_at_ms, record.updated_at_ms};
  }
  if (new_version) *new_version = current + 1;
  return BackendStatus::ok;
}

BackendStatus FileStateBackend::scan(const std::string& prefix, size_t limit,
                                     std::vector<StateRecord>* out) const {
  std::vector<std::string> keys;
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    for (auto it = index_.lower_bound(prefix); it != index_.end(); ++it) {
      if (it->first.compare(0, prefix.size(), prefix) != 0) break;
      keys.push_back(it->first);
      if (limit > 0 && keys.size() >= limit) break;
    }
  }
  std::vector<StateRecord> found;
  found.reserve(keys.size());
  for (const auto& k : keys) {
    StateRecord rec;
    const auto st = read(k, &rec);
    if (st == BackendStatus::not_found) continue;  // purged concurrently
    if (st != BackendStatus::ok) return st;
    found.push_back(std::move(rec));
  }
  if (out) *out = std::move(found);
  return BackendStatus::ok;
}

size_t FileStateBackend::purge_expired(uint64_t now_ms) {
  std::vector<std::string> expired;
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    for (const auto& [key, entry] : index_) {
      if (entry.expires_at_ms != 0 && now_ms >= entry.expires_at_ms) expired.push_back(key);
    }
  }
  size_t dropped = 0;
  for (const auto& key : expired) {
    std::lock_guard<std::mutex> key_lk(key_lock(key));
    {
      std::lock_guard<std::mutex> lk(index_mu_);
      auto it = index_.find(key);
      // Rewritten since the snapshot above.
      if (it == index_.end() || it->second.expires_at_ms == 0 || now_ms < it->second.expires_at_ms) {
        continue;
      }
      index_.erase(it);
    }
    std::error_code ec;
    fs::remove(object_path(key), ec);
    ++dropped;
  }
  return dropped;
}

size_t FileStateBackend::size() const {
  std::lock_guard<std::mutex> lk(index_mu_);
  return index_.size();
}

// ---------------------------------------------------------------------------
// TieredStateBackend
// ---------------------------------------------------------------------------

TieredStateBackend::TieredStateBackend(std::shared_ptr<MemoryStateBackend> hot,
                                       std::shared_ptr<IStateBackend> durable)
    : hot_(std::move(hot)), durable_(std::move(durable)) {}

BackendStatus TieredStateBackend::read(const std::string& key, StateRecord* out) const {
  StateRecord rec;
  if (hot_->read(key, &rec) == BackendStatus::ok) {
    if (out) *out = std::move(rec);
    return BackendStatus::ok;
  }
  const auto st = durable_->read(key, &rec);
  if (st != BackendStatus::ok) return st;
  hot_->install(rec);
  if (out) *out = std::move(rec);
  return BackendStatus::ok;
}

BackendStatus TieredStateBackend::write(const StateRecord& record,
                                        std::optional<uint64_t> expected_version,
                                        uint64_t* new_version) {
  uint64_t v = 0;
  const auto st = durable_->write(record, expected_version, &v);
  if (new_version) *new_version = v;
  if (st != BackendStatus::ok) return st;
  StateRecord mirrored = record;
  mirrored.version = v;
  hot_->install(mirrored);
  return BackendStatus::ok;
}

BackendStatus TieredStateBackend::scan(const std::string& prefix, size_t limit,
                                       std::vector<StateRecord>* out) const {
  return durable_->scan(prefix, limit, out);
}

size_t TieredStateBackend::purge_expired(uint64_t now_ms) {
  hot_->purge_expired(now_ms);
  return durable_->purge_expired(now_ms);
}

std::string TieredStateBackend::backend_id() const {
  return "tiered(" + hot_->backend_id() + "," + durable_->backend_id() + ")";
}

}  // namespace keystone
