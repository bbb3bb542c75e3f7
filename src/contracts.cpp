#include "keystone/contracts.hpp"

#include <sstream>

#include "keystone/hash.hpp"
#include "keystone/observability.hpp"

namespace keystone {

namespace {

StateKey contract_key(const std::string& tenant_id, const std::string& contract_id) {
  return StateKey{tenant_id, ns::kContract, contract_id, ""};
}

StateKey materialization_key(const std::string& tenant_id, const std::string& record_id) {
  return StateKey{tenant_id, ns::kMaterialization, record_id, ""};
}

bool parse_contract(const StateRecord& rec, BoundaryContract* out) {
  std::optional<jsonlite::JsonError> perr;
  auto obj = jsonlite::parse(rec.value, &perr);
  if (perr || !contract_from_json(obj, out)) return false;
  out->version = rec.version;
  return true;
}

bool parse_materialization(const StateRecord& rec, MaterializationRecord* out) {
  std::optional<jsonlite::JsonError> perr;
  auto obj = jsonlite::parse(rec.value, &perr);
  return !perr && materialization_from_json(obj, out);
}

}  // namespace

std::string SweepReport::to_json() const {
  std::ostringstream o;
  o << "{\"scanned\":" << scanned << ",\"expired\":" << expired << ",\"errors\":" << errors << "}";
  return o.str();
}

bool scope_matches(const ContractScope& contract_scope, const ContractScope& requester) {
  if (!contract_scope.user_id.empty() && contract_scope.user_id != requester.user_id) return false;
  if (!contract_scope.session_id.empty() && contract_scope.session_id != requester.session_id) {
    return false;
  }
  if (!contract_scope.solution_id.empty() && contract_scope.solution_id != requester.solution_id) {
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// BoundaryContractStore
// ---------------------------------------------------------------------------

BoundaryContractStore::BoundaryContractStore(std::shared_ptr<StateSurface> state, uint64_t ttl_ms)
    : state_(std::move(state)), ttl_ms_(ttl_ms) {}

bool BoundaryContractStore::past_ttl(const BoundaryContract& c, uint64_t now_ms) const {
  switch (c.status) {
    case ContractStatus::pending: return now_ms >= c.created_at_ms + ttl_ms_;
    case ContractStatus::active:  return now_ms >= c.authorized_at_ms + ttl_ms_;
    default:                      return false;
  }
}

std::optional<BoundaryContract> BoundaryContractStore::store(BoundaryContract c,
                                                             uint64_t expected_version,
                                                             Error* err) {
  auto v = state_->set_key(contract_key(c.tenant_id, c.contract_id),
                           jsonlite::to_json(contract_to_json(c)), std::nullopt, expected_version,
                           err);
  if (!v) return std::nullopt;
  c.version = *v;
  return c;
}

std::optional<BoundaryContract> BoundaryContractStore::create_pending(
    const std::string& tenant_id, const std::string& artifact_reference, Error* err) {
  if (!valid_key_component(tenant_id)) {
    fail(err, ErrorCode::validation_error, "tenant_id required");
    return std::nullopt;
  }
  if (artifact_reference.empty()) {
    fail(err, ErrorCode::validation_error, "artifact_reference required");
    return std::nullopt;
  }
  BoundaryContract c;
  c.contract_id = generate_id("bc");
  c.tenant_id = tenant_id;
  c.artifact_reference = artifact_reference;
  c.status = ContractStatus::pending;
  c.created_at_ms = state_->clock().now_unix_ms();
  return store(std::move(c), 0, err);
}

std::optional<BoundaryContract> BoundaryContractStore::get(const std::string& tenant_id,
                                                           const std::string& contract_id,
                                                           Error* err) const {
  if (!valid_key_component(tenant_id) || !valid_key_component(contract_id)) {
    fail(err, ErrorCode::not_found, "contract not found");
    return std::nullopt;
  }
  auto rec = state_->get_key(contract_key(tenant_id, contract_id), err);
  if (!rec) return std::nullopt;
  BoundaryContract c;
  if (!parse_contract(*rec, &c) || c.tenant_id != tenant_id) {
    fail(err, ErrorCode::state_corruption, "contract record unreadable: " + contract_id);
    return std::nullopt;
  }
  return c;
}

std::optional<BoundaryContract> BoundaryContractStore::authorize(const std::string& tenant_id,
                                                                 const std::string& contract_id,
                                                                 const ContractScope& scope,
                                                                 Error* err) {
  auto c = get(tenant_id, contract_id, err);
  if (!c) return std::nullopt;
  const uint64_t now = state_->clock().now_unix_ms();
  if (c->status != ContractStatus::pending) {
    fail(err, ErrorCode::authorization_error,
         "contract " + contract_id + " is " + to_string(c->status) + ", not pending");
    return std::nullopt;
  }
  if (past_ttl(*c, now)) {
    fail(err, ErrorCode::authorization_error, "contract " + contract_id + " has expired");
    return std::nullopt;
  }
  const uint64_t read_version = c->version;
  c->status = ContractStatus::active;
  c->scope = scope;
  c->authorized_at_ms = now;
  Error e;
  auto out = store(std::move(*c), read_version, &e);
  if (!out && e.code == ErrorCode::version_conflict) {
    // Another transition won; the contract is no longer pending.
    fail(err, ErrorCode::authorization_error, "contract " + contract_id + " changed concurrently");
    return std::nullopt;
  }
  if (!out && err) *err = e;
  return out;
}

bool BoundaryContractStore::check_access(const std::string& tenant_id,
                                         const std::string& contract_id,
                                         const ContractScope& requester) const {
  auto c = get(tenant_id, contract_id, nullptr);
  if (!c || c->status != ContractStatus::active) return false;
  if (past_ttl(*c, state_->clock().now_unix_ms())) return false;
  return scope_matches(c->scope, requester);
}

std::optional<BoundaryContract> BoundaryContractStore::revoke(const std::string& tenant_id,
                                                              const std::string& contract_id,
                                                              Error* err) {
  constexpr int kAttempts = 4;
  for (int attempt = 0;; ++attempt) {
    auto c = get(tenant_id, contract_id, err);
    if (!c) return std::nullopt;
    if (c->status == ContractStatus::revoked || c->status == ContractStatus::expired) return c;
    const uint64_t read_version = c->version;
    c->status = ContractStatus::revoked;
    c->revoked_at_ms = state_->clock().now_unix_ms();
    Error e;
    auto out = store(std::move(*c), read_version, &e);
    if (out) {
      log_event(LogLevel::info, "contracts", contract_id + " revoked");
      return out;
    }
    if (e.code != ErrorCode::version_conflict || attempt + 1 >= kAttempts) {
      if (err) *err = e;
      return std::nullopt;
    }
  }
}

SweepReport BoundaryContractStore::sweep_expired(uint64_t now_ms, const std::string& tenant_id) {
  SweepReport report;
  const std::string tenant_prefix = "tenant/" + tenant_id + "/";
  Error scan_err;
  auto records = state_->scan_namespace(ns::kContract, &scan_err);
  if (!scan_err.ok()) {
    log_event(LogLevel::warn, "contracts", "sweep scan failed: " + scan_err.message);
    ++report.errors;
    return report;
  }
  for (const auto& rec : records) {
    if (!tenant_id.empty() && rec.key.rfind(tenant_prefix, 0) != 0) continue;
    ++report.scanned;
    BoundaryContract c;
    if (!parse_contract(rec, &c)) {
      ++report.errors;
      log_event(LogLevel::warn, "contracts", "unreadable contract record " + rec.key);
      continue;
    }
    if (!past_ttl(c, now_ms)) continue;
    const uint64_t read_version = c.version;
    c.status = ContractStatus::expired;
    c.expired_at_ms = now_ms;
    Error e;
    if (!store(c, read_version, &e)) {
      // A concurrent authorize/revoke moved the record; the next sweep
      // re-evaluates it.
      if (e.code != ErrorCode::version_conflict) ++report.errors;
      continue;
    }
    ++report.expired;
    CoreEvent ev;
    ev.kind = CoreEventKind::contract_expired;
    ev.tenant_id = c.tenant_id;
    emit_core_event(ev);
  }
  if (report.expired > 0 || report.errors > 0) {
    log_event(LogLevel::info, "contracts", "sweep " + report.to_json());
  }
  return report;
}

// ---------------------------------------------------------------------------
// MaterializationAuthorizer
// ---------------------------------------------------------------------------

MaterializationAuthorizer::MaterializationAuthorizer(
    std::shared_ptr<StateSurface> state, std::shared_ptr<BoundaryContractStore> contracts,
    MaterializationPolicySet policy)
    : state_(std::move(state)), contracts_(std::move(contracts)), policy_(std::move(policy)) {}

std::optional<MaterializationRecord> MaterializationAuthorizer::materialize(
    const std::string& tenant_id, const std::string& contract_id,
    const std::string& representation_type, const ContractScope& requester,
    const std::string& solution_id, Error* err) {
  if (representation_type.empty()) {
    fail(err, ErrorCode::validation_error, "representation_type required");
    return std::nullopt;
  }
  if (!contracts_->check_access(tenant_id, contract_id, requester)) {
    fail(err, ErrorCode::authorization_error,
         "contract " + contract_id + " does not grant access to this requester");
    return std::nullopt;
  }
  auto contract = contracts_->get(tenant_id, contract_id, err);
  if (!contract) return std::nullopt;

  const std::string solution = solution_id.empty() ? requester.solution_id : solution_id;
  const auto decision = resolve_materialization(policy_, tenant_id, solution, representation_type);
  if (decision.decision == MaterializationDecision::discard) {
    fail(err, ErrorCode::validation_error, "materialization_discarded");
    return std::nullopt;
  }

  MaterializationRecord r;
  r.record_id = generate_id("mat");
  r.contract_id = contract_id;
  r.tenant_id = tenant_id;
  r.artifact_reference = contract->artifact_reference;
  r.representation_type = representation_type;
  r.decision = decision.decision;
  r.stored_at_ms = state_->clock().now_unix_ms();
  std::optional<uint64_t> ttl;
  if (decision.decision == MaterializationDecision::cache) {
    ttl = decision.cache_ttl_ms;
    r.expires_at_ms = r.stored_at_ms + decision.cache_ttl_ms;
  }
  if (!state_->set_key(materialization_key(tenant_id, r.record_id),
                       jsonlite::to_json(materialization_to_json(r)), ttl, 0, err)) {
    return std::nullopt;
  }
  log_event(LogLevel::debug, "materialize",
            r.record_id + " " + representation_type + " " + to_string(r.decision) + " (policy " +
                decision.source + ")");
  return r;
}

std::optional<MaterializationRecord> MaterializationAuthorizer::read(
    const std::string& tenant_id, const std::string& record_id, const ContractScope& requester,
    Error* err) const {
  if (!valid_key_component(tenant_id) || !valid_key_component(record_id)) {
    fail(err, ErrorCode::not_found, "materialization not found");
    return std::nullopt;
  }
  auto rec = state_->get_key(materialization_key(tenant_id, record_id), err);
  if (!rec) return std::nullopt;
  MaterializationRecord r;
  if (!parse_materialization(*rec, &r) || r.tenant_id != tenant_id) {
    fail(err, ErrorCode::state_corruption, "materialization record unreadable: " + record_id);
    return std::nullopt;
  }
  if (!contracts_->check_access(tenant_id, r.contract_id, requester)) {
    fail(err, ErrorCode::authorization_error,
         "contract " + r.contract_id + " no longer grants access");
    return std::nullopt;
  }
  return r;
}

std::vector<MaterializationRecord> MaterializationAuthorizer::list(const std::string& tenant_id,
                                                                   const ContractScope& requester,
                                                                   Error* err) const {
  StateQuery q;
  q.ns = ns::kMaterialization;
  auto records = state_->query(tenant_id, q, err);
  std::vector<MaterializationRecord> out;
  for (const auto& rec : records) {
    MaterializationRecord r;
    if (!parse_materialization(rec, &r)) {
      log_event(LogLevel::warn, "materialize", "unreadable record " + rec.key);
      continue;
    }
    if (contracts_->check_access(tenant_id, r.contract_id, requester)) out.push_back(std::move(r));
  }
  return out;
}

// ---------------------------------------------------------------------------
// ContractSweeper
// ---------------------------------------------------------------------------

ContractSweeper::ContractSweeper(std::shared_ptr<BoundaryContractStore> contracts,
                                 std::chrono::milliseconds interval)
    : contracts_(std::move(contracts)), interval_(interval) {}

ContractSweeper::~ContractSweeper() { stop(); }

void ContractSweeper::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
}

void ContractSweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

SweepReport ContractSweeper::run_once() {
  SweepReport r = contracts_->sweep_expired(contracts_->clock().now_unix_ms());
  runs_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(mu_);
  last_ = r;
  return r;
}

SweepReport ContractSweeper::last_report() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_;
}

void ContractSweeper::worker_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, interval_, [this] { return stopping_; });
      if (stopping_) return;
    }
    try {
      run_once();
    } catch (const std::exception& e) {
      log_event(LogLevel::error, "contracts", std::string("sweep aborted: ") + e.what());
    }
  }
}

}  // namespace keystone
