#pragma once

// keystone/contracts.hpp — Boundary contracts and two-phase materialization.
//
// LIFECYCLE:
//   create_pending → pending ──authorize──→ active ──revoke──→ revoked
//                       │                     │
//                       └──── TTL sweep ──────┴──→ expired
//
//   Pending contracts expire ttl after created_at; active contracts expire
//   ttl after authorized_at. Every transition is a version-checked write, so
//   a racing authorize/revoke/sweep pair has exactly one winner.
//
// ACCESS (fail closed):
//   check_access() is true only when the contract is active, within its TTL,
//   and every scope dimension present on the contract equals the requester's.
//   A dimension absent from the contract is a wildcard. Any read error is a
//   denial.
//
// MATERIALIZATION:
//   Phase one is the contract (pending → active). Phase two is materialize(),
//   which requires check_access() and a policy decision of persist or cache.
//   read() and list() re-run check_access() on every call, so revoking or
//   expiring the contract cuts off access to records already materialized.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "keystone/config.hpp"
#include "keystone/state_surface.hpp"
#include "keystone/types.hpp"

namespace keystone {

struct SweepReport {
  uint64_t scanned{0};
  uint64_t expired{0};
  uint64_t errors{0};

  std::string to_json() const;
};

// Contract dimensions present must match; absent ones are wildcards.
bool scope_matches(const ContractScope& contract_scope, const ContractScope& requester);

class BoundaryContractStore {
 public:
  BoundaryContractStore(std::shared_ptr<StateSurface> state, uint64_t ttl_ms);

  std::optional<BoundaryContract> create_pending(const std::string& tenant_id,
                                                 const std::string& artifact_reference,
                                                 Error* err);

  // authorization_error unless the contract is pending and within its TTL.
  std::optional<BoundaryContract> authorize(const std::string& tenant_id,
                                            const std::string& contract_id,
                                            const ContractScope& scope, Error* err);

  // Never throws; false on any failure.
  bool check_access(const std::string& tenant_id, const std::string& contract_id,
                    const ContractScope& requester) const;

  // pending|active → revoked. Revoking a revoked or expired contract returns
  // it unchanged.
  std::optional<BoundaryContract> revoke(const std::string& tenant_id,
                                         const std::string& contract_id, Error* err);

  std::optional<BoundaryContract> get(const std::string& tenant_id,
                                      const std::string& contract_id, Error* err) const;

  // Scans every tenant's contracts, or only tenant_id's when it is non-empty.
  SweepReport sweep_expired(uint64_t now_ms, const std::string& tenant_id = "");

  uint64_t ttl_ms() const { return ttl_ms_; }
  const Clock& clock() const { return state_->clock(); }

 private:
  bool past_ttl(const BoundaryContract& c, uint64_t now_ms) const;
  std::optional<BoundaryContract> store(BoundaryContract c, uint64_t expected_version, Error* err);

  std::shared_ptr<StateSurface> state_;
  uint64_t ttl_ms_;
};

class MaterializationAuthorizer {
 public:
  MaterializationAuthorizer(std::shared_ptr<StateSurface> state,
                            std::shared_ptr<BoundaryContractStore> contracts,
                            MaterializationPolicySet policy);

  // solution_id selects the solution-level policy; empty falls back to
  // requester.solution_id. discard → validation_error
  // "materialization_discarded".
  std::optional<MaterializationRecord> materialize(const std::string& tenant_id,
                                                   const std::string& contract_id,
                                                   const std::string& representation_type,
                                                   const ContractScope& requester,
                                                   const std::string& solution_id, Error* err);

  std::optional<MaterializationRecord> read(const std::string& tenant_id,
                                            const std::string& record_id,
                                            const ContractScope& requester, Error* err) const;

  // Only records whose contract currently grants requester access.
  std::vector<MaterializationRecord> list(const std::string& tenant_id,
                                          const ContractScope& requester, Error* err) const;

  const MaterializationPolicySet& policy() const { return policy_; }

 private:
  std::shared_ptr<StateSurface> state_;
  std::shared_ptr<BoundaryContractStore> contracts_;
  MaterializationPolicySet policy_;
};

// ---------------------------------------------------------------------------
// ContractSweeper — periodic TTL enforcement
// ---------------------------------------------------------------------------
class ContractSweeper {
 public:
  ContractSweeper(std::shared_ptr<BoundaryContractStore> contracts,
                  std::chrono::milliseconds interval);
  ~ContractSweeper();

  void start();
  void stop();

  SweepReport run_once();
  SweepReport last_report() const;
  uint64_t runs() const { return runs_.load(std::memory_order_relaxed); }

 private:
  void worker_loop();

  std::shared_ptr<BoundaryContractStore> contracts_;
  std::chrono::milliseconds interval_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::thread worker_;
  bool stopping_{false};
  SweepReport last_;
  std::atomic<uint64_t> runs_{0};
};

}  // namespace keystone
