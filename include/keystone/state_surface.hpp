#pragma once

// keystone/state_surface.hpp — Tenant-scoped key/value access with query.
//
// KEY LAYOUT (STATE_LAYOUT_VERSION 1):
//   tenant/{tenant_id}/session/{session_id}/{name}
//   tenant/{tenant_id}/execution/{execution_id}
//   tenant/{tenant_id}/contract/{contract_id}
//   tenant/{tenant_id}/idempotency/{digest}
//   tenant/{tenant_id}/materialization/{record_id}
//
// INVARIANTS:
//   1. Every key is built from validated components (non-empty, no '/', no
//      control characters), so tenant A's prefix can never address tenant B.
//   2. Expired records read as not_found even before purge_expired() runs.
//   3. expected_version 0 means create-only; any other value is a CAS.
//   4. BackendStatus::unavailable is retried with RetryPolicy backoff; after
//      the bound, transient_infra is surfaced to the caller.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "keystone/clock.hpp"
#include "keystone/config.hpp"
#include "keystone/state_backend.hpp"
#include "keystone/types.hpp"

namespace keystone {

namespace ns {
inline constexpr const char* kSession = "session";
inline constexpr const char* kExecution = "execution";
inline constexpr const char* kContract = "contract";
inline constexpr const char* kIdempotency = "idempotency";
inline constexpr const char* kMaterialization = "materialization";
}  // namespace ns

// Non-empty, at most 256 bytes, no '/', no control characters.
bool valid_key_component(const std::string& s);

struct StateKey {
  std::string tenant_id;
  std::string ns;
  std::string scope_id;
  std::string name;   // optional trailing component

  bool valid() const;
  std::string path() const;
};

struct StateQuery {
  std::string ns;            // empty = every namespace
  std::string scope_id;      // empty = every scope in ns
  std::string name_prefix;   // applies to the trailing name component
  size_t      limit{0};      // 0 = unbounded
};

class StateSurface {
 public:
  StateSurface(std::shared_ptr<IStateBackend> backend, RetryPolicy retry,
               std::shared_ptr<Clock> clock = system_clock());

  // Session-scoped operations.
  std::optional<StateRecord> get(const std::string& tenant_id, const std::string& session_id,
                                 const std::string& name, Error* err) const;
  std::optional<uint64_t> set(const std::string& tenant_id, const std::string& session_id,
                              const std::string& name, const std::string& value_json,
                              std::optional<uint64_t> ttl_ms,
                              std::optional<uint64_t> expected_version, Error* err);

  // Bulk lookup within one tenant. Expired records are omitted.
  std::vector<StateRecord> query(const std::string& tenant_id, const StateQuery& q,
                                 Error* err) const;

  // Generic namespaced access used by the core's own records.
  std::optional<StateRecord> get_key(const StateKey& key, Error* err) const;
  std::optional<uint64_t> set_key(const StateKey& key, const std::string& value_json,
                                  std::optional<uint64_t> ttl_ms,
                                  std::optional<uint64_t> expected_version, Error* err);

  // Operator-level scan of one namespace across every tenant (contract sweep).
  std::vector<StateRecord> scan_namespace(const std::string& ns_name, Error* err) const;

  size_t purge_expired();

  const Clock& clock() const { return *clock_; }
  std::string backend_id() const { return backend_->backend_id(); }

 private:
  template <typename Fn>
  BackendStatus with_retry(const std::string& what, Fn&& fn) const;

  std::shared_ptr<IStateBackend> backend_;
  RetryPolicy retry_;
  std::shared_ptr<Clock> clock_;
};

}  // namespace keystone
