#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "keystone/api.hpp"
#include "keystone/clock.hpp"
#include "keystone/config.hpp"
#include "keystone/contracts.hpp"
#include "keystone/hash.hpp"
#include "keystone/intake.hpp"
#include "keystone/jsonlite.hpp"
#include "keystone/observability.hpp"
#include "keystone/rbac.hpp"
#include "keystone/realms.hpp"
#include "keystone/runtime.hpp"
#include "keystone/session.hpp"
#include "keystone/state_backend.hpp"
#include "keystone/state_surface.hpp"
#include "keystone/version.hpp"
#include "keystone/wal.hpp"

using namespace keystone;
using jsonlite::make_string;
using jsonlite::make_u64;

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

std::string scratch_dir(const std::string& tag) {
  const fs::path p = fs::temp_directory_path() / ("keystone_" + tag + "_" + generate_id("t"));
  fs::create_directories(p);
  return p.string();
}

jsonlite::Object parse_or_die(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  auto o = jsonlite::parse(text, &err);
  expect(!err.has_value(), "response is JSON: " + text);
  return o;
}

// Fails the first `failures` calls with BackendStatus::unavailable.
class FlakyBackend : public IStateBackend {
 public:
  FlakyBackend(std::shared_ptr<IStateBackend> inner, int failures)
      : inner_(std::move(inner)), remaining_(failures) {}

  BackendStatus read(const std::string& key, StateRecord* out) const override {
    if (trip()) return BackendStatus::unavailable;
    return inner_->read(key, out);
  }
  BackendStatus write(const StateRecord& record, std::optional<uint64_t> expected_version,
                      uint64_t* new_version) override {
    if (trip()) return BackendStatus::unavailable;
    return inner_->write(record, expected_version, new_version);
  }
  BackendStatus scan(const std::string& prefix, size_t limit,
                     std::vector<StateRecord>* out) const override {
    if (trip()) return BackendStatus::unavailable;
    return inner_->scan(prefix, limit, out);
  }
  size_t purge_expired(uint64_t now_ms) override { return inner_->purge_expired(now_ms); }
  std::string backend_id() const override { return "flaky"; }

  int calls() const { return calls_.load(); }

 private:
  bool trip() const {
    ++calls_;
    return remaining_.fetch_sub(1) > 0;
  }

  std::shared_ptr<IStateBackend> inner_;
  mutable std::atomic<int> remaining_;
  mutable std::atomic<int> calls_{0};
};

constexpr const char* kTenantA = "tenant-a";
constexpr const char* kTenantB = "tenant-b";

CallerIdentity caller(const std::string& tenant, const std::string& role = "member",
                      const std::string& user = "u-1") {
  CallerIdentity c;
  c.tenant_id = tenant;
  c.user_id = user;
  c.role = role;
  return c;
}

CoreConfig memory_config() {
  CoreConfig cfg = default_config();
  cfg.durable = false;
  cfg.worker_threads = 2;
  cfg.step_timeout_ms = 2000;
  cfg.log_level = "error";
  return cfg;
}

std::unique_ptr<Runtime> memory_runtime(RuntimeOverrides o = {}) {
  o.start_sweeper = false;
  Error e;
  auto rt = Runtime::create(memory_config(), &e, std::move(o));
  expect(rt != nullptr, "runtime: " + e.message);
  return rt;
}

// ============================================================================
// Storage backends
// ============================================================================

void test_memory_backend_versions_and_cas() {
  MemoryStateBackend b;
  StateRecord r;
  r.key = "tenant/t/session/s/x";
  r.value = "{\"a\":1}";
  uint64_t v = 0;
  expect(b.write(r, 0, &v) == BackendStatus::ok && v == 1, "create-only write gets version 1");
  expect(b.write(r, 0, &v) == BackendStatus::version_conflict, "second create-only conflicts");
  expect(v == 1, "conflict reports current version");
  expect(b.write(r, 1, &v) == BackendStatus::ok && v == 2, "CAS on current version");
  expect(b.write(r, 1, &v) == BackendStatus::version_conflict, "stale CAS conflicts");
  expect(b.write(r, std::nullopt, &v) == BackendStatus::ok && v == 3, "blind write bumps");

  StateRecord got;
  expect(b.read(r.key, &got) == BackendStatus::ok, "read back");
  expect(got.version == 3 && got.value == r.value, "value and version");
  expect(b.read("tenant/t/none", &got) == BackendStatus::not_found, "missing key");
}

void test_file_backend_survives_reopen() {
  const std::string dir = scratch_dir("state");
  {
    FileStateBackend b(dir);
    StateRecord r;
    r.key = "tenant/t/contract/c1";
    r.value = "{\"status\":\"pending\"}";
    uint64_t v = 0;
    expect(b.write(r, 0, &v) == BackendStatus::ok, "write");
    expect(b.write(r, 1, &v) == BackendStatus::ok && v == 2, "rewrite");
  }
  FileStateBackend reopened(dir);
  StateRecord got;
  expect(reopened.read("tenant/t/contract/c1", &got) == BackendStatus::ok, "read after reopen");
  expect(got.version == 2, "version rebuilt from disk");
  std::vector<StateRecord> all;
  expect(reopened.scan("tenant/t/", 0, &all) == BackendStatus::ok && all.size() == 1, "scan");
  fs::remove_all(dir);
}

void test_file_backend_fails_closed_on_damage() {
  const std::string dir = scratch_dir("corrupt");
  FileStateBackend b(dir);
  StateRecord r;
  r.key = "tenant/t/session/s/session";
  r.value = "{\"context\":{}}";
  uint64_t v = 0;
  expect(b.write(r, std::nullopt, &v) == BackendStatus::ok, "write");

  size_t damaged = 0;
  for (const auto& entry : fs::recursive_directory_iterator(fs::path(dir) / "state")) {
    if (!entry.is_regular_file()) continue;
    std::ofstream(entry.path(), std::ios::app | std::ios::binary) << "X";
    ++damaged;
  }
  expect(damaged == 1, "one record file on disk");
  StateRecord got;
  expect(b.read(r.key, &got) == BackendStatus::corrupt, "damaged payload reported corrupt");

  StateSurface surface(std::make_shared<FileStateBackend>(dir), RetryPolicy{0, 1, 1});
  Error e;
  expect(!surface.get("t", "s", "session", &e).has_value(), "surface refuses corrupt record");
  fs::remove_all(dir);
}

void test_tiered_backend_reads_through() {
  const std::string dir = scratch_dir("tiered");
  {
    TieredStateBackend t(std::make_shared<MemoryStateBackend>(),
                         std::make_shared<FileStateBackend>(dir));
    StateRecord r;
    r.key = "tenant/t/execution/e1";
    r.value = "{}";
    uint64_t v = 0;
    expect(t.write(r, 0, &v) == BackendStatus::ok, "tiered write");
  }
  auto hot = std::make_shared<MemoryStateBackend>();
  TieredStateBackend t(hot, std::make_shared<FileStateBackend>(dir));
  expect(hot->size() == 0, "cold hot tier");
  StateRecord got;
  expect(t.read("tenant/t/execution/e1", &got) == BackendStatus::ok, "durable hit");
  expect(hot->size() == 1, "durable hit populated hot tier");
  uint64_t v = 0;
  expect(t.write(got, 0, &v) == BackendStatus::version_conflict,
         "durable tier owns the create-only check");
  fs::remove_all(dir);
}

// ============================================================================
// State surface
// ============================================================================

void test_surface_retries_transient_backend() {
  auto flaky = std::make_shared<FlakyBackend>(std::make_shared<MemoryStateBackend>(), 2);
  StateSurface s(flaky, RetryPolicy{3, 1, 2});
  Error e;
  auto v = s.set(kTenantA, "s1", "k", "{\"n\":1}", std::nullopt, std::nullopt, &e);
  expect(v.has_value() && *v == 1, "write succeeds after two transient failures: " + e.message);
  expect(flaky->calls() == 3, "two retries then success");

  auto down = std::make_shared<FlakyBackend>(std::make_shared<MemoryStateBackend>(), 1000);
  StateSurface s2(down, RetryPolicy{2, 1, 2});
  e = Error{};
  expect(!s2.set(kTenantA, "s1", "k", "{}", std::nullopt, std::nullopt, &e).has_value(),
         "persistent outage fails");
  expect(e.code == ErrorCode::transient_infra, "surfaced as transient_infra");
}

void test_surface_keys_are_tenant_scoped() {
  StateSurface s(std::make_shared<MemoryStateBackend>(), RetryPolicy{});
  Error e;
  expect(s.set(kTenantA, "s1", "secret", "{\"v\":1}", std::nullopt, std::nullopt, &e).has_value(),
         "write under tenant A");
  expect(!s.get(kTenantB, "s1", "secret", &e).has_value(), "tenant B cannot read it");
  expect(e.code == ErrorCode::not_found, "not_found");
  e = Error{};
  expect(!s.set("tenant-a/../b", "s1", "x", "{}", std::nullopt, std::nullopt, &e).has_value(),
         "path separators in components rejected");
  expect(e.code == ErrorCode::validation_error, "validation_error");
  expect(!valid_key_component(""), "empty component invalid");
  expect(!valid_key_component(std::string("a\nb")), "control characters invalid");
}

void test_surface_ttl_and_create_only() {
  auto clock = std::make_shared<ManualClock>();
  StateSurface s(std::make_shared<MemoryStateBackend>(), RetryPolicy{}, clock);
  Error e;
  expect(s.set(kTenantA, "s1", "lease", "{}", 1000, 0, &e).has_value(), "create with TTL");
  e = Error{};
  expect(!s.set(kTenantA, "s1", "lease", "{}", 1000, 0, &e).has_value(), "create-only again");
  expect(e.code == ErrorCode::version_conflict, "version_conflict");

  clock->advance(999);
  expect(s.get(kTenantA, "s1", "lease", nullptr).has_value(), "alive before expiry");
  clock->advance(1);
  e = Error{};
  expect(!s.get(kTenantA, "s1", "lease", &e).has_value(), "expired reads as absent");
  expect(e.code == ErrorCode::not_found, "expired is not_found");
  expect(s.purge_expired() == 1, "purge drops it");
}

void test_surface_query_by_prefix() {
  StateSurface s(std::make_shared<MemoryStateBackend>(), RetryPolicy{});
  for (const char* name : {"draft-1", "draft-2", "final"}) {
    expect(s.set(kTenantA, "s1", name, "{}", std::nullopt, std::nullopt, nullptr).has_value(),
           std::string("write ") + name);
  }
  expect(s.set(kTenantB, "s1", "draft-3", "{}", std::nullopt, std::nullopt, nullptr).has_value(),
         "other tenant write");
  StateQuery q;
  q.ns = ns::kSession;
  q.scope_id = "s1";
  q.name_prefix = "draft";
  Error e;
  const auto rows = s.query(kTenantA, q, &e);
  expect(e.ok(), "query ok");
  expect(rows.size() == 2, "two drafts for tenant A only");
  q.limit = 1;
  expect(s.query(kTenantA, q, nullptr).size() == 1, "limit honoured");
}

// ============================================================================
// WAL
// ============================================================================

void append_n(WriteAheadLog& wal, const ExecutionRef& ref, int n) {
  for (int i = 0; i < n; ++i) {
    jsonlite::Object p;
    p["i"] = make_u64(static_cast<uint64_t>(i));
    Error e;
    expect(wal.append(ref, i == 0 ? WalEventType::execution_started : WalEventType::step_started,
                      p, &e)
               .has_value(),
           "append: " + e.message);
  }
}

void test_wal_sequence_and_chain() {
  WriteAheadLog wal(std::make_shared<MemoryWalStore>(), RetryPolicy{});
  const ExecutionRef ref{"exe-1", kTenantA, "s1"};
  append_n(wal, ref, 4);
  Error e;
  auto events = wal.replay("exe-1", &e);
  expect(events.has_value() && events->size() == 4, "four events");
  expect((*events)[0].prev_digest == zero_digest(), "chain starts at zero digest");
  for (size_t i = 0; i < events->size(); ++i) {
    expect((*events)[i].sequence_no == i + 1, "dense sequence");
    if (i > 0) expect((*events)[i].prev_digest == (*events)[i - 1].digest, "linked digests");
    expect((*events)[i].digest.size() == 64, "hex digest");
  }

  e = Error{};
  expect(!wal.append(ExecutionRef{"exe-1", kTenantB, "s1"}, WalEventType::step_started, {}, &e)
              .has_value(),
         "append under another tenant rejected");
  expect(e.code == ErrorCode::validation_error, "tenant pin is validation_error");

  e = Error{};
  expect(!wal.replay("exe-none", &e).has_value() && e.code == ErrorCode::not_found,
         "unknown stream is not_found");
}

void test_wal_detects_tampering() {
  auto store = std::make_shared<MemoryWalStore>();
  WriteAheadLog wal(store, RetryPolicy{});
  append_n(wal, ExecutionRef{"exe-t", kTenantA, "s1"}, 3);
  std::vector<std::string> lines;
  expect(store->read("exe-t", &lines) == BackendStatus::ok, "raw read");
  std::string forged = lines[2];
  const auto pos = forged.find("\"i\":2");
  expect(pos != std::string::npos, "payload present");
  forged.replace(pos, 5, "\"i\":9");
  expect(store->tamper("exe-t", 2, forged), "tamper");

  Error e;
  expect(!wal.replay("exe-t", &e).has_value(), "replay rejects the stream");
  expect(e.code == ErrorCode::state_corruption, "state_corruption");
  auto ref = wal.stream_ref("exe-t");
  expect(ref.has_value() && ref->tenant_id == kTenantA, "stream still attributable");
}

void test_wal_file_store_drops_torn_tail() {
  const std::string dir = scratch_dir("wal");
  auto store = std::make_shared<FileWalStore>(dir, true);
  {
    WriteAheadLog wal(store, RetryPolicy{});
    append_n(wal, ExecutionRef{"exe-f", kTenantA, "s1"}, 2);
  }
  std::ofstream(store->stream_path("exe-f"), std::ios::app | std::ios::binary)
      << "{\"event_id\":\"evt_torn\",\"seq";

  WriteAheadLog reopened(std::make_shared<FileWalStore>(dir, false), RetryPolicy{});
  Error e;
  auto events = reopened.replay("exe-f", &e);
  expect(events.has_value(), "replay after torn write: " + e.message);
  expect(events->size() == 2, "unacknowledged tail discarded");
  append_n(reopened, ExecutionRef{"exe-f", kTenantA, "s1"}, 1);
  events = reopened.replay("exe-f", &e);
  expect(events.has_value() && events->back().sequence_no == 3, "appends continue the chain");
  fs::remove_all(dir);
}

void test_wal_audit_queries_are_tenant_partitioned() {
  WriteAheadLog wal(std::make_shared<MemoryWalStore>(), RetryPolicy{});
  append_n(wal, ExecutionRef{"exe-a1", kTenantA, "s1"}, 3);
  append_n(wal, ExecutionRef{"exe-a2", kTenantA, "s2"}, 2);
  append_n(wal, ExecutionRef{"exe-b1", kTenantB, "s1"}, 4);

  expect(wal.get_events(kTenantA, std::nullopt, 0).size() == 5, "tenant A sees its five");
  expect(wal.get_events(kTenantB, std::nullopt, 0).size() == 4, "tenant B sees its four");
  expect(wal.get_events(kTenantA, WalEventType::execution_started, 0).size() == 2, "type filter");
  expect(wal.get_events(kTenantA, std::nullopt, 2).size() == 2, "limit");
  expect(wal.replay_session(kTenantA, "s1").size() == 3, "session replay stays in tenant");

  auto exported = wal.export_ndjson("exe-a1", nullptr);
  expect(exported.has_value(), "export");
  expect(std::count(exported->begin(), exported->end(), '\n') == 3, "one line per event");
}

void test_version_gates() {
  expect(version::check_wal_format(version::WAL_FORMAT_VERSION).ok, "current format accepted");
  expect(!version::check_wal_format(version::WAL_FORMAT_VERSION + 1).ok, "newer format refused");
  const auto m = version::current_manifest("1.2.3");
  const auto text = version::manifest_to_json(m);
  expect(text.find("\"1.2.3\"") != std::string::npos, "semver in manifest");
  for (IntentType t : all_intent_types()) {
    auto back = intent_type_from_string(to_string(t));
    expect(back && *back == t, "intent catalog name " + to_string(t));
  }
  expect(!intent_type_from_string("ECHO").has_value(), "catalog names are exact");
}

void test_hashing() {
  expect(blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty-input vector");
  expect(idempotency_digest(kTenantA, "k") != idempotency_digest(kTenantB, "k"),
         "tenant mixed into idempotency digest");
  expect(hash_domain("wal:", "x") != hash_domain("idem:", "x"), "domain separation");
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) ids.insert(generate_id("exe"));
  expect(ids.size() == 1000, "ids never repeat");
  expect(ids.begin()->rfind("exe_", 0) == 0, "prefix kept");
}

// ============================================================================
// Sessions
// ============================================================================

void test_session_lifecycle() {
  auto state = std::make_shared<StateSurface>(std::make_shared<MemoryStateBackend>(), RetryPolicy{});
  SessionManager sessions(state);
  jsonlite::Object ctx;
  ctx["locale"] = make_string("de");
  Error e;
  auto s = sessions.create_session(kTenantA, "u-1", ctx, &e);
  expect(s.has_value(), "create: " + e.message);
  expect(s->status == SessionStatus::active, "active");

  auto other = sessions.create_session(kTenantA, "u-1", ctx, &e);
  expect(other && other->session_id != s->session_id, "fresh id every time");

  e = Error{};
  expect(!sessions.get_session(s->session_id, kTenantB, &e).has_value(), "wrong tenant");
  expect(e.code == ErrorCode::not_found, "wrong tenant is not_found");

  jsonlite::Object patch;
  patch["solution_id"] = make_string("sol-1");
  auto updated = sessions.update_context(s->session_id, kTenantA, patch, s->version, &e);
  expect(updated.has_value(), "update with current version");
  expect(jsonlite::get_string(updated->context, "locale") == "de", "shallow merge keeps keys");
  expect(jsonlite::get_string(updated->context, "solution_id") == "sol-1", "patch applied");

  e = Error{};
  expect(!sessions.update_context(s->session_id, kTenantA, patch, s->version, &e).has_value(),
         "stale expected_version rejected");
  expect(e.code == ErrorCode::version_conflict, "version_conflict");

  auto inv = sessions.invalidate(s->session_id, kTenantA, "logout", &e);
  expect(inv && inv->status == SessionStatus::invalid, "invalidated");
  auto again = sessions.invalidate(s->session_id, kTenantA, "expired", &e);
  expect(again && again->invalidated_reason == "logout", "first reason kept");
  auto read = sessions.get_session(s->session_id, kTenantA, &e);
  expect(read && read->status == SessionStatus::invalid, "invalid session still readable");
}

// ============================================================================
// Contracts and materialization
// ============================================================================

struct ContractFixture {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
  std::shared_ptr<StateSurface> state =
      std::make_shared<StateSurface>(std::make_shared<MemoryStateBackend>(), RetryPolicy{}, clock);
  std::shared_ptr<BoundaryContractStore> contracts =
      std::make_shared<BoundaryContractStore>(state, 10000);
};

ContractScope scope_of(const std::string& user, const std::string& session = "",
                       const std::string& solution = "") {
  ContractScope s;
  s.user_id = user;
  s.session_id = session;
  s.solution_id = solution;
  return s;
}

void test_contract_two_phase_and_scope() {
  ContractFixture f;
  Error e;
  auto c = f.contracts->create_pending(kTenantA, "artifact://report/1", &e);
  expect(c && c->status == ContractStatus::pending, "pending contract");
  expect(!f.contracts->check_access(kTenantA, c->contract_id, scope_of("u-1")),
         "pending grants nothing");

  auto active = f.contracts->authorize(kTenantA, c->contract_id, scope_of("u-1"), &e);
  expect(active && active->status == ContractStatus::active, "authorized");
  expect(f.contracts->check_access(kTenantA, c->contract_id, scope_of("u-1", "any-session")),
         "absent contract dimension is a wildcard");
  expect(!f.contracts->check_access(kTenantA, c->contract_id, scope_of("u-2")), "other user");
  expect(!f.contracts->check_access(kTenantA, c->contract_id, scope_of("")),
         "requester without the dimension denied");
  expect(!f.contracts->check_access(kTenantB, c->contract_id, scope_of("u-1")),
         "other tenant denied");

  e = Error{};
  expect(!f.contracts->authorize(kTenantA, c->contract_id, scope_of("u-1"), &e).has_value(),
         "authorize twice rejected");
  expect(e.code == ErrorCode::authorization_error, "authorization_error");

  auto revoked = f.contracts->revoke(kTenantA, c->contract_id, &e);
  expect(revoked && revoked->status == ContractStatus::revoked, "revoked");
  expect(!f.contracts->check_access(kTenantA, c->contract_id, scope_of("u-1")),
         "revoked grants nothing");
  auto twice = f.contracts->revoke(kTenantA, c->contract_id, &e);
  expect(twice && twice->status == ContractStatus::revoked, "revoke is idempotent");
}

void test_contract_ttl_and_sweep() {
  ContractFixture f;
  Error e;
  auto stale = f.contracts->create_pending(kTenantA, "artifact://a", &e);
  auto live = f.contracts->create_pending(kTenantB, "artifact://b", &e);
  expect(stale && live, "two pending contracts");
  f.clock->advance(6000);
  expect(f.contracts->authorize(kTenantB, live->contract_id, scope_of("u-9"), &e).has_value(),
         "authorize within TTL");

  f.clock->advance(4000);
  e = Error{};
  expect(!f.contracts->authorize(kTenantA, stale->contract_id, scope_of("u-1"), &e).has_value(),
         "pending past TTL cannot be authorized");
  expect(e.code == ErrorCode::authorization_error, "authorization_error");
  expect(f.contracts->check_access(kTenantB, live->contract_id, scope_of("u-9")),
         "active TTL runs from authorization");

  auto report = f.contracts->sweep_expired(f.clock->now_unix_ms());
  expect(report.expired == 1 && report.errors == 0, "sweep expires only the stale contract");
  auto got = f.contracts->get(kTenantA, stale->contract_id, &e);
  expect(got && got->status == ContractStatus::expired, "marked expired");

  f.clock->advance(6000);
  expect(!f.contracts->check_access(kTenantB, live->contract_id, scope_of("u-9")),
         "active contract past TTL denies before the sweep");
  ContractSweeper sweeper(f.contracts, std::chrono::milliseconds(50));
  report = sweeper.run_once();
  expect(report.expired == 1, "sweeper run expires the second");
  expect(sweeper.runs() == 1, "run counted");
}

void test_materialization_policy_and_access() {
  ContractFixture f;
  MaterializationPolicySet policy;
  policy.platform = platform_default_policy();
  MaterializationPolicy tenant;
  tenant.decisions["preview"] = MaterializationDecision::cache;
  tenant.cache_ttl_ms = 5000;
  policy.tenants[kTenantA] = tenant;
  MaterializationPolicy solution;
  solution.decisions["preview"] = MaterializationDecision::discard;
  policy.solutions[std::string(kTenantA) + "/sol-x"] = solution;

  expect(resolve_materialization(policy, kTenantA, "", "preview").source == "tenant",
         "tenant level decides");
  expect(resolve_materialization(policy, kTenantA, "sol-x", "preview").decision ==
             MaterializationDecision::discard,
         "solution level overrides tenant");
  expect(resolve_materialization(policy, kTenantA, "sol-y", "intent").source == "platform",
         "unknown solution falls through to platform");

  MaterializationAuthorizer auth(f.state, f.contracts, policy);
  Error e;
  auto c = f.contracts->create_pending(kTenantA, "artifact://journey/7", &e);
  expect(!auth.materialize(kTenantA, c->contract_id, "intent", scope_of("u-1"), "", &e),
         "pending contract cannot materialize");
  expect(e.code == ErrorCode::authorization_error, "authorization_error");
  expect(f.contracts->authorize(kTenantA, c->contract_id, scope_of("u-1"), &e).has_value(),
         "authorize");

  auto persisted = auth.materialize(kTenantA, c->contract_id, "intent", scope_of("u-1"), "", &e);
  expect(persisted && persisted->decision == MaterializationDecision::persist, "persist");
  auto cached = auth.materialize(kTenantA, c->contract_id, "preview", scope_of("u-1"), "", &e);
  expect(cached && cached->decision == MaterializationDecision::cache, "cache");
  expect(cached->expires_at_ms == cached->stored_at_ms + 5000, "cache TTL from tenant policy");
  e = Error{};
  expect(!auth.materialize(kTenantA, c->contract_id, "scratch", scope_of("u-1"), "", &e),
         "platform default discards");
  expect(e.code == ErrorCode::validation_error && e.message == "materialization_discarded",
         "discard reported");

  expect(auth.list(kTenantA, scope_of("u-1"), &e).size() == 2, "two records listed");
  expect(auth.read(kTenantA, persisted->record_id, scope_of("u-1"), &e).has_value(), "readable");
  expect(auth.list(kTenantA, scope_of("u-2"), &e).empty(), "other requester sees none");

  expect(f.contracts->revoke(kTenantA, c->contract_id, &e).has_value(), "revoke");
  e = Error{};
  expect(!auth.read(kTenantA, persisted->record_id, scope_of("u-1"), &e).has_value(),
         "revocation cuts off materialized records");
  expect(auth.list(kTenantA, scope_of("u-1"), &e).empty(), "list empty after revoke");
}

// ============================================================================
// Config and RBAC
// ============================================================================

void test_config_layers_and_validation() {
  CoreConfig cfg = default_config();
  expect(validate_config(cfg).ok, "defaults are valid");

  Error e;
  const std::string text =
      "{\"worker_threads\":8,\"infra\":{\"max_retries\":2},"
      "\"materialization\":{\"tenants\":{\"tenant-a\":{\"decisions\":{\"preview\":\"cache\"},"
      "\"cache_ttl_days\":2}},\"solutions\":{\"tenant-a/sol\":{\"default\":\"persist\"}}}}";
  expect(load_config_json(text, &cfg, &e), "load: " + e.message);
  expect(cfg.worker_threads == 8 && cfg.infra_retry.max_retries == 2, "scalars overlaid");
  expect(cfg.materialization.tenants.at("tenant-a").cache_ttl_ms == 2ULL * 24 * 3600 * 1000,
         "days converted to ms");
  expect(cfg.materialization.solutions.count("tenant-a/sol") == 1, "solution policy loaded");

  CoreConfig untouched = default_config();
  e = Error{};
  expect(!load_config_json("{\"wokrer_threads\":2}", &untouched, &e), "unknown key rejected");
  expect(e.code == ErrorCode::config_invalid, "config_invalid");
  expect(untouched.worker_threads == default_config().worker_threads, "no partial apply");
  e = Error{};
  expect(!load_config_json("{not json", &untouched, &e), "parse error");
  expect(e.code == ErrorCode::json_parse_error, "json_parse_error");

  ::setenv("KEYSTONE_WORKER_THREADS", "3", 1);
  ::setenv("KEYSTONE_LOG_LEVEL", "debug", 1);
  apply_env_overrides(&cfg);
  ::unsetenv("KEYSTONE_WORKER_THREADS");
  ::unsetenv("KEYSTONE_LOG_LEVEL");
  expect(cfg.worker_threads == 3 && cfg.log_level == "debug", "environment overrides file");

  cfg.worker_threads = 0;
  cfg.step_timeout_ms = 0;
  cfg.log_level = "loud";
  const auto result = validate_config(cfg);
  expect(!result.ok && result.errors.size() == 3, "every problem reported");

  e = Error{};
  expect(Runtime::create(cfg, &e) == nullptr, "runtime refuses invalid config");
  expect(e.code == ErrorCode::config_invalid, "config_invalid from create");
}

void test_rbac_roles() {
  using rbac::Permission;
  using rbac::Role;
  expect(rbac::has_permission(Role::viewer, Permission::execution_read), "viewer reads");
  expect(!rbac::has_permission(Role::viewer, Permission::intent_submit), "viewer cannot submit");
  expect(rbac::has_permission(Role::member, Permission::intent_submit), "member submits");
  expect(!rbac::has_permission(Role::member, Permission::wal_export), "member cannot export");
  expect(rbac::has_permission(Role::operator_, Permission::wal_export), "operator exports");
  expect(!rbac::has_permission(Role::operator_, Permission::sweep), "operator cannot sweep");
  expect(rbac::has_permission(Role::admin, Permission::recovery), "admin recovers");
  expect(rbac::role_or_viewer("root") == Role::viewer, "unknown role is viewer");
  const auto d = rbac::check(kTenantA, Role::viewer, Permission::session_write);
  expect(!d.ok && !d.denial_reason.empty(), "denial explained");
}

// ============================================================================
// Intake
// ============================================================================

void test_context_precedence() {
  Session s;
  s.session_id = "s1";
  s.user_id = "session-user";
  s.context["locale"] = make_string("fr");
  s.context["solution_id"] = make_string("from-session");
  s.context["theme"] = make_string("dark");
  CallerIdentity c = caller(kTenantA, "member", "caller-user");
  c.metadata["solution_id"] = make_string("from-identity");
  jsonlite::Object params;
  jsonlite::Object pctx;
  pctx["locale"] = make_string("es");
  pctx["tenant_id"] = make_string(kTenantB);
  params["context"] = jsonlite::make_object(pctx);

  const ExecutionContext ctx = resolve_context(c, s, params);
  expect(ctx.tenant_id == kTenantA, "tenant only from identity");
  expect(ctx.session_id == "s1", "session id forced");
  expect(ctx.user_id == "caller-user", "caller user over session user");
  expect(ctx.locale == "es", "parameters beat everything");
  expect(ctx.solution_id == "from-identity", "identity beats session");
  expect(jsonlite::get_string(ctx.attributes, "theme") == "dark", "session attributes kept");
}

void test_intake_validation_never_reaches_wal() {
  auto rt = memory_runtime();
  Error e;
  IntentSubmission sub;
  sub.type = "no_such_intent";
  expect(!rt->intake()->submit(sub, caller(kTenantA), &e), "unknown type rejected");
  expect(e.code == ErrorCode::validation_error, "validation_error");

  sub.type = "echo";
  sub.tenant_id = kTenantB;
  e = Error{};
  expect(!rt->intake()->submit(sub, caller(kTenantA), &e), "tenant mismatch rejected");

  sub.tenant_id.clear();
  sub.session_id = "sess-missing";
  e = Error{};
  expect(!rt->intake()->submit(sub, caller(kTenantA), &e), "unknown session rejected");
  expect(e.code == ErrorCode::not_found, "unknown session is not_found");

  auto session = rt->sessions()->create_session(kTenantA, "u-1", {}, &e);
  expect(rt->sessions()->invalidate(session->session_id, kTenantA, "gone", &e).has_value(),
         "invalidate");
  sub.session_id = session->session_id;
  e = Error{};
  expect(!rt->intake()->submit(sub, caller(kTenantA), &e), "invalid session rejected");
  expect(e.code == ErrorCode::validation_error, "invalid session is validation_error");

  sub.session_id.clear();
  sub.idempotency_key = std::string(513, 'k');
  e = Error{};
  expect(!rt->intake()->submit(sub, caller(kTenantA), &e), "oversized key rejected");

  expect(rt->wal()->execution_ids().empty(), "nothing written to the WAL");
}

void test_idempotent_submission_converges() {
  auto rt = memory_runtime();
  IntentSubmission sub;
  sub.type = "echo";
  sub.idempotency_key = "order-42";
  sub.parameters["n"] = make_u64(1);

  constexpr int kThreads = 8;
  std::vector<std::string> ids(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      Error e;
      auto a = rt->intake()->submit(sub, caller(kTenantA), &e);
      if (a) ids[i] = a->execution_id;
    });
  }
  for (auto& t : threads) t.join();
  for (const auto& id : ids) {
    expect(!id.empty() && id == ids[0], "every submitter got the same execution");
  }
  expect(rt->wal()->execution_ids().size() == 1, "exactly one execution started");

  Error e;
  auto done = rt->saga()->wait(ids[0], kTenantA, std::chrono::milliseconds(5000), &e);
  expect(done && done->status == ExecutionStatus::completed, "echo completed");
  auto replay = rt->intake()->submit(sub, caller(kTenantA), &e);
  expect(replay && replay->replayed, "later submission is a replay");
  expect(replay->status == "completed", "replay reports the execution status");

  auto other = rt->intake()->submit(sub, caller(kTenantB), &e);
  expect(other && !other->replayed && other->execution_id != ids[0],
         "same key in another tenant is a different execution");
}

// ============================================================================
// API boundary and stream
// ============================================================================

ApiRequest request(const std::string& method, const std::string& path, const std::string& body,
                   const CallerIdentity& id) {
  ApiRequest r;
  r.method = method;
  r.path = path;
  r.body = body;
  r.identity = id;
  return r;
}

void test_api_routes_and_status_codes() {
  auto rt = memory_runtime();
  ApiRouter api(*rt);
  const CallerIdentity member = caller(kTenantA);

  auto health = api.handle(request("GET", "/health", "", CallerIdentity{}));
  expect(health.status == 200, "health needs no identity");
  expect(jsonlite::get_bool(parse_or_die(health.body), "ok"), "health ok");
  expect(jsonlite::get_array(parse_or_die(health.body), "intents").size() == 3,
         "content realm intents listed");

  auto created = api.handle(request("POST", "/session/create", "{}", member));
  expect(created.status == 201, "session created");
  const std::string sid = jsonlite::get_string(parse_or_die(created.body), "session_id");

  const std::string submit_body = "{\"type\":\"echo\",\"session_id\":\"" + sid +
                                  "\",\"idempotency_key\":\"k-1\",\"parameters\":{\"x\":1}}";
  auto admitted = api.handle(request("POST", "/intent/submit", submit_body, member));
  expect(admitted.status == 202, "intent admitted");
  const auto adm = parse_or_die(admitted.body);
  const std::string exe = jsonlite::get_string(adm, "execution_id");
  expect(!exe.empty() && jsonlite::get_string(adm, "session_id") == sid, "admission body");

  auto status = api.handle(
      request("GET", "/execution/" + exe + "/status?wait_ms=5000", "", member));
  expect(status.status == 200, "status readable");
  expect(jsonlite::get_string(parse_or_die(status.body), "status") == "completed",
         "echo completed");

  auto stats = api.handle(request("GET", "/stats", "", caller(kTenantA, "viewer")));
  expect(stats.status == 200, "viewer reads stats");
  const auto recent = jsonlite::get_array(parse_or_die(stats.body), "recent_events");
  expect(!recent.empty(), "recent events present");
  for (const auto& ev : recent) {
    expect(jsonlite::get_string(std::get<jsonlite::Object>(ev.v), "tenant_id") == kTenantA,
           "recent events limited to the caller tenant");
  }

  auto replayed = api.handle(request("POST", "/intent/submit", submit_body, member));
  expect(replayed.status == 202, "replay admitted");
  expect(jsonlite::get_string(parse_or_die(replayed.body), "execution_id") == exe,
         "replay returns the same execution");

  expect(api.handle(request("POST", "/intent/submit", submit_body, caller(kTenantA, "viewer")))
                 .status == 403,
         "viewer forbidden");
  expect(api.handle(request("GET", "/execution/" + exe + "/status", "", caller(kTenantB)))
                 .status == 404,
         "other tenant gets not_found");
  expect(api.handle(request("POST", "/intent/submit", "{\"type\":", member)).status == 400,
         "malformed JSON");
  expect(api.handle(request("POST", "/intent/submit", "{\"type\":\"nope\"}", member)).status ==
             400,
         "unknown intent type");
  expect(api.handle(request("GET", "/stats", "", CallerIdentity{})).status == 400,
         "identity required outside /health");
  expect(api.handle(request("GET", "/nowhere", "", member)).status == 404, "unknown route");

  auto error = parse_or_die(
      api.handle(request("GET", "/session/sess-unknown", "", member)).body);
  expect(jsonlite::get_string(jsonlite::get_object(error, "error"), "code") == "not_found",
         "error envelope carries the code");

  expect(api.handle(request("GET", "/execution/" + exe + "/wal", "", member)).status == 403,
         "member cannot export the WAL");
  auto wal = api.handle(request("GET", "/execution/" + exe + "/wal", "", caller(kTenantA, "operator")));
  expect(wal.status == 200 && wal.content_type == "application/x-ndjson", "operator export");
  auto events = rt->wal()->replay(exe, nullptr);
  expect(events.has_value(), "replay");
  expect(static_cast<size_t>(std::count(wal.body.begin(), wal.body.end(), '\n')) == events->size(),
         "one line per event");
  expect(api.handle(request("GET", "/execution/" + exe + "/wal", "", caller(kTenantB, "operator")))
                 .status == 404,
         "export is tenant gated");

  expect(api.handle(request("POST", "/admin/sweep", "", member)).status == 403,
         "sweep is admin only");
  expect(api.handle(request("POST", "/admin/sweep", "", caller(kTenantA, "admin"))).status == 200,
         "admin sweep");
}

void test_api_contract_flow() {
  auto rt = memory_runtime();
  ApiRouter api(*rt);
  const CallerIdentity member = caller(kTenantA);

  auto created = api.handle(
      request("POST", "/contracts", "{\"artifact_reference\":\"artifact://sop/3\"}", member));
  expect(created.status == 201, "contract created");
  const std::string cid = jsonlite::get_string(parse_or_die(created.body), "contract_id");

  auto early = api.handle(request("POST", "/contracts/" + cid + "/materialize",
                                  "{\"representation_type\":\"intent\"}", member));
  expect(early.status == 403, "materialize before authorize");

  auto auth = api.handle(request("POST", "/contracts/" + cid + "/authorize",
                                 "{\"scope\":{\"user_id\":\"u-1\"}}", member));
  expect(auth.status == 200, "authorized");
  expect(jsonlite::get_string(parse_or_die(auth.body), "status") == "active", "active");

  auto mat = api.handle(request("POST", "/contracts/" + cid + "/materialize",
                                "{\"representation_type\":\"intent\"}", member));
  expect(mat.status == 201, "materialized");
  const std::string rid = jsonlite::get_string(parse_or_die(mat.body), "record_id");

  auto listed = api.handle(request("GET", "/materializations", "", member));
  expect(listed.status == 200, "list");
  expect(jsonlite::get_array(parse_or_die(listed.body), "materializations").size() == 1,
         "one record listed");
  expect(api.handle(request("GET", "/materializations/" + rid, "", caller(kTenantA, "member", "u-2")))
                 .status == 403,
         "other user denied");

  expect(api.handle(request("POST", "/contracts/" + cid + "/revoke", "", member)).status == 200,
         "revoked");
  expect(api.handle(request("GET", "/materializations/" + rid, "", member)).status == 403,
         "revoked contract gates reads");
}

void test_api_claimed_session_must_belong_to_caller() {
  auto rt = memory_runtime();
  ApiRouter api(*rt);
  const CallerIdentity owner = caller(kTenantA);
  const CallerIdentity other = caller(kTenantA, "member", "u-2");
  const CallerIdentity stranger = caller(kTenantA, "member", "u-9");

  expect(api.handle(request("POST", "/session/create", "{\"user_id\":\"u-1\"}", other)).status ==
             403,
         "cannot open a session for another user");
  const std::string sid = jsonlite::get_string(
      parse_or_die(api.handle(request("POST", "/session/create", "{}", owner)).body), "session_id");

  const std::string cid = jsonlite::get_string(
      parse_or_die(api.handle(request("POST", "/contracts",
                                      "{\"artifact_reference\":\"artifact://sop/9\"}", owner))
                       .body),
      "contract_id");
  expect(api.handle(request("POST", "/contracts/" + cid + "/authorize",
                            "{\"scope\":{\"session_id\":\"" + sid + "\"}}", owner))
                 .status == 200,
         "authorized for the session");

  const std::string mat_body =
      "{\"representation_type\":\"intent\",\"session_id\":\"" + sid + "\"}";
  expect(api.handle(request("POST", "/contracts/" + cid + "/materialize", mat_body, other)).status ==
             403,
         "another user cannot materialize through the owner's session");
  auto mat = api.handle(request("POST", "/contracts/" + cid + "/materialize", mat_body, owner));
  expect(mat.status == 201, "owner materializes");
  const std::string rid = jsonlite::get_string(parse_or_die(mat.body), "record_id");
  const std::string path = "/materializations/" + rid + "?session_id=" + sid;

  expect(api.handle(request("GET", path, "", owner)).status == 200, "owner reads");
  expect(api.handle(request("GET", path, "", other)).status == 403, "other user denied");
  expect(api.handle(request("GET", path, "", stranger)).status == 403, "unknown user denied");
  expect(api.handle(request("GET", "/materializations?session_id=" + sid, "", other)).status ==
             403,
         "list denied for a borrowed session");
  expect(api.handle(request("GET", "/materializations/" + rid + "?session_id=sess-nope", "", owner))
                 .status == 403,
         "unknown session denied");

  expect(api.handle(request("POST", "/session/" + sid + "/invalidate", "{}", owner)).status == 200,
         "session invalidated");
  expect(api.handle(request("GET", path, "", owner)).status == 403,
         "invalidated session no longer grants access");
}

void test_api_status_wait_is_capped() {
  CoreConfig cfg = memory_config();
  cfg.step_timeout_ms = 100;
  RuntimeOverrides o;
  o.start_sweeper = false;
  o.register_realms = [](CapabilityRouter& router, std::shared_ptr<MaterializationAuthorizer>) {
    StepSpec slow;
    slow.name = "slow";
    slow.idempotent = true;
    slow.timeout_ms = 5000;
    slow.handler = [](const StepContext&) {
      std::this_thread::sleep_for(std::chrono::milliseconds(800));
      return StepResult::success({});
    };
    Capability cap;
    cap.realm_name = "slow";
    cap.stages.push_back({slow});
    return router.register_capability(IntentType::echo, std::move(cap));
  };
  Error e;
  auto rt = Runtime::create(cfg, &e, std::move(o));
  expect(rt != nullptr, "runtime: " + e.message);
  ApiRouter api(*rt);
  const CallerIdentity member = caller(kTenantA);

  auto admitted = api.handle(request("POST", "/intent/submit", "{\"type\":\"echo\"}", member));
  expect(admitted.status == 202, "admitted");
  const std::string exe = jsonlite::get_string(parse_or_die(admitted.body), "execution_id");

  const auto t0 = std::chrono::steady_clock::now();
  auto status = api.handle(
      request("GET", "/execution/" + exe + "/status?wait_ms=600000", "", member));
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(status.status == 200, "status readable");
  expect(jsonlite::get_string(parse_or_die(status.body), "status") != "completed",
         "returned before the execution finished");
  expect(elapsed < std::chrono::milliseconds(600), "wait capped at the step timeout");
}

void test_api_admin_sweep_is_tenant_scoped() {
  auto clock = std::make_shared<ManualClock>();
  RuntimeOverrides o;
  o.clock = clock;
  auto rt = memory_runtime(std::move(o));
  ApiRouter api(*rt);
  Error e;
  auto mine = rt->contracts()->create_pending(kTenantA, "artifact://a", &e);
  auto theirs = rt->contracts()->create_pending(kTenantB, "artifact://b", &e);
  expect(mine && theirs, "contracts created");
  clock->advance(rt->contracts()->ttl_ms() + 1);

  auto swept = api.handle(request("POST", "/admin/sweep", "", caller(kTenantA, "admin")));
  expect(swept.status == 200, "admin sweep");
  const auto report = parse_or_die(swept.body);
  expect(jsonlite::get_u64(report, "scanned") == 1, "only the caller's contracts scanned");
  expect(jsonlite::get_u64(report, "expired") == 1, "caller's contract expired");
  expect(rt->contracts()->get(kTenantA, mine->contract_id, &e)->status == ContractStatus::expired,
         "own contract expired");
  expect(rt->contracts()->get(kTenantB, theirs->contract_id, &e)->status ==
             ContractStatus::pending,
         "other tenant untouched");
}

std::vector<jsonlite::Object> frames(StreamConnection& conn, const std::string& line) {
  std::vector<jsonlite::Object> out;
  for (const auto& f : conn.on_frame(line)) out.push_back(parse_or_die(f));
  return out;
}

void test_stream_state_machine() {
  auto rt = memory_runtime();
  ApiRouter api(*rt);

  {
    StreamConnection early(api, rt->sessions());
    auto out = frames(early, "{\"type\":\"request\",\"path\":\"/stats\"}");
    expect(out.size() == 2, "error then closed");
    expect(jsonlite::get_string(out[0], "type") == "error", "error frame");
    expect(jsonlite::get_string(out[1], "type") == "closed", "closed frame");
    expect(early.state() == StreamState::closed, "request before auth closes");
  }
  {
    StreamConnection bad_auth(api, rt->sessions());
    frames(bad_auth, "{\"type\":\"hello\"}");
    auto out = frames(bad_auth, "{\"type\":\"auth\",\"identity\":{\"user_id\":\"u\"}}");
    expect(bad_auth.state() == StreamState::closed, "identity without tenant closes");
    expect(jsonlite::get_string(jsonlite::get_object(out[0], "error"), "code") ==
               "authorization_error",
           "authorization_error frame");
  }

  StreamConnection conn(api, rt->sessions());
  expect(conn.state() == StreamState::connecting, "starts connecting");
  auto ack = frames(conn, "{\"type\":\"hello\"}");
  expect(jsonlite::get_string(ack[0], "type") == "hello_ack", "hello_ack");
  expect(jsonlite::get_u64(ack[0], "api_version") == version::API_VERSION, "api version");
  expect(conn.state() == StreamState::authenticating, "authenticating");

  auto ok = frames(conn,
                   "{\"type\":\"auth\",\"identity\":{\"tenant_id\":\"tenant-a\","
                   "\"user_id\":\"u-1\",\"role\":\"member\"}}");
  expect(jsonlite::get_string(ok[0], "type") == "auth_ok", "auth_ok");
  expect(conn.state() == StreamState::open, "open");
  const std::string sid = jsonlite::get_string(ok[0], "session_id");
  expect(!sid.empty() && sid == conn.session_id(), "session created for the connection");

  auto resp = frames(conn,
                     "{\"type\":\"request\",\"id\":\"r1\",\"method\":\"POST\","
                     "\"path\":\"/intent/submit\",\"body\":{\"type\":\"echo\"}}");
  expect(jsonlite::get_string(resp[0], "type") == "response", "response frame");
  expect(jsonlite::get_string(resp[0], "id") == "r1", "request id echoed");
  expect(jsonlite::get_u64(resp[0], "status") == 202, "admitted over the stream");
  const auto body = jsonlite::get_object(resp[0], "body");
  expect(jsonlite::get_string(body, "session_id") == sid, "stream session injected");

  auto junk = frames(conn, "{oops");
  expect(jsonlite::get_string(junk[0], "type") == "error", "bad frame answered");
  expect(conn.state() == StreamState::open, "open connection survives a bad frame");

  auto bye = frames(conn, "{\"type\":\"close\"}");
  expect(jsonlite::get_string(bye[0], "type") == "closed", "closed");
  expect(conn.state() == StreamState::closed, "closed state");
}

void test_run_stream_over_iostreams() {
  auto rt = memory_runtime();
  ApiRouter api(*rt);
  StreamConnection conn(api, rt->sessions());
  std::istringstream in(
      "{\"type\":\"hello\"}\n"
      "\n"
      "{\"type\":\"auth\",\"identity\":{\"tenant_id\":\"tenant-a\",\"role\":\"viewer\"}}\r\n"
      "{\"type\":\"request\",\"id\":\"h\",\"path\":\"/stats\"}\n"
      "{\"type\":\"close\"}\n"
      "{\"type\":\"request\",\"id\":\"late\",\"path\":\"/stats\"}\n");
  std::ostringstream out;
  const uint64_t handled = run_stream(in, out, conn);
  expect(handled == 4, "frames after close are not read");
  std::istringstream lines(out.str());
  std::string line;
  std::vector<std::string> types;
  while (std::getline(lines, line)) types.push_back(jsonlite::get_string(parse_or_die(line), "type"));
  expect(types.size() == 4, "one reply per frame");
  expect(types[0] == "hello_ack" && types[1] == "auth_ok" && types[2] == "response" &&
             types[3] == "closed",
         "reply sequence");
}

// ============================================================================
// Runtime
// ============================================================================

void test_runtime_recovers_on_start() {
  auto wal_store = std::make_shared<MemoryWalStore>();
  auto backend = std::make_shared<MemoryStateBackend>();
  {
    WriteAheadLog wal(wal_store, RetryPolicy{});
    const ExecutionRef ref{"exe-crashed", kTenantA, "s1"};
    Intent intent;
    intent.intent_id = "int-crashed";
    intent.type = IntentType::echo;
    intent.tenant_id = kTenantA;
    intent.session_id = "s1";
    ExecutionContext ctx;
    ctx.tenant_id = kTenantA;
    ctx.session_id = "s1";
    jsonlite::Object started;
    started["wal_format"] = make_u64(version::WAL_FORMAT_VERSION);
    started["intent_id"] = make_string(intent.intent_id);
    started["intent"] = jsonlite::make_object(intent_to_json(intent));
    started["context"] = jsonlite::make_object(context_to_json(ctx));
    Error e;
    expect(wal.append(ref, WalEventType::execution_started, started, &e).has_value(),
           "seed STARTED: " + e.message);
  }

  RuntimeOverrides o;
  o.wal_store = wal_store;
  o.state_backend = backend;
  o.recover_on_start = true;
  auto rt = memory_runtime(o);
  expect(rt->startup_recovery().scanned == 1, "one stream found");
  expect(rt->startup_recovery().resumed == 1, "resumed before serving");
  Error e;
  auto exec = rt->saga()->status("exe-crashed", kTenantA, &e);
  expect(exec && exec->status == ExecutionStatus::completed, "crashed execution completed");
  expect(exec->realm_name == realms::kContentRealm, "built-in realm drove it");
}

void test_runtime_durable_restart() {
  const std::string dir = scratch_dir("runtime");
  CoreConfig cfg = memory_config();
  cfg.durable = true;
  cfg.data_dir = dir;
  RuntimeOverrides o;
  o.start_sweeper = false;
  std::string exe;
  {
    Error e;
    auto rt = Runtime::create(cfg, &e, o);
    expect(rt != nullptr, "durable runtime: " + e.message);
    IntentSubmission sub;
    sub.type = "ingest_file";
    sub.parameters["file_name"] = make_string("notes.txt");
    sub.parameters["content"] = make_string("line one\nline two\n");
    auto a = rt->intake()->submit(sub, caller(kTenantA), &e);
    expect(a.has_value(), "submit ingest: " + e.message);
    exe = a->execution_id;
    auto done = rt->saga()->wait(exe, kTenantA, std::chrono::milliseconds(5000), &e);
    expect(done && done->status == ExecutionStatus::completed, "ingest completed");
    expect(done->steps.size() == 4, "validate, store_blob, extract_metadata, register");
    rt->shutdown();
  }
  Error e;
  auto rt = Runtime::create(cfg, &e, o);
  expect(rt != nullptr, "reopen: " + e.message);
  expect(rt->startup_recovery().already_terminal == 1, "terminal execution left alone");
  auto exec = rt->saga()->status(exe, kTenantA, &e);
  expect(exec && exec->status == ExecutionStatus::completed, "snapshot survived restart");
  auto events = rt->wal()->replay(exe, &e);
  expect(events.has_value(), "WAL chain survived restart");
  auto folded = fold(*events, &e);
  expect(folded && folded->last_sequence_no == exec->last_sequence_no, "fold matches snapshot");
  rt.reset();
  fs::remove_all(dir);
}

}  // namespace

int main() {
  set_log_threshold(LogLevel::error);
  std::cout << "=== Keystone Core Test Suite ===\n";

  std::cout << "\n[Storage]\n";
  run_test("memory backend versions and CAS", test_memory_backend_versions_and_cas);
  run_test("file backend survives reopen", test_file_backend_survives_reopen);
  run_test("file backend fails closed on damage", test_file_backend_fails_closed_on_damage);
  run_test("tiered backend reads through", test_tiered_backend_reads_through);

  std::cout << "\n[State Surface]\n";
  run_test("retries transient backend", test_surface_retries_transient_backend);
  run_test("keys are tenant scoped", test_surface_keys_are_tenant_scoped);
  run_test("TTL and create-only", test_surface_ttl_and_create_only);
  run_test("query by prefix", test_surface_query_by_prefix);

  std::cout << "\n[WAL]\n";
  run_test("sequence and chain", test_wal_sequence_and_chain);
  run_test("detects tampering", test_wal_detects_tampering);
  run_test("file store drops torn tail", test_wal_file_store_drops_torn_tail);
  run_test("audit queries are tenant partitioned", test_wal_audit_queries_are_tenant_partitioned);
  run_test("version gates", test_version_gates);
  run_test("hashing", test_hashing);

  std::cout << "\n[Sessions & Contracts]\n";
  run_test("session lifecycle", test_session_lifecycle);
  run_test("contract two-phase and scope", test_contract_two_phase_and_scope);
  run_test("contract TTL and sweep", test_contract_ttl_and_sweep);
  run_test("materialization policy and access", test_materialization_policy_and_access);

  std::cout << "\n[Config & RBAC]\n";
  run_test("config layers and validation", test_config_layers_and_validation);
  run_test("rbac roles", test_rbac_roles);

  std::cout << "\n[Intake]\n";
  run_test("context precedence", test_context_precedence);
  run_test("validation never reaches WAL", test_intake_validation_never_reaches_wal);
  run_test("idempotent submission converges", test_idempotent_submission_converges);

  std::cout << "\n[API & Stream]\n";
  run_test("routes and status codes", test_api_routes_and_status_codes);
  run_test("contract flow", test_api_contract_flow);
  run_test("claimed session must belong to caller", test_api_claimed_session_must_belong_to_caller);
  run_test("status wait is capped", test_api_status_wait_is_capped);
  run_test("admin sweep is tenant scoped", test_api_admin_sweep_is_tenant_scoped);
  run_test("stream state machine", test_stream_state_machine);
  run_test("run_stream over iostreams", test_run_stream_over_iostreams);

  std::cout << "\n[Runtime]\n";
  run_test("recovers on start", test_runtime_recovers_on_start);
  run_test("durable restart", test_runtime_durable_restart);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
