#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "keystone/capability.hpp"
#include "keystone/jsonlite.hpp"
#include "keystone/observability.hpp"
#include "keystone/saga.hpp"
#include "keystone/state_backend.hpp"
#include "keystone/state_surface.hpp"
#include "keystone/version.hpp"
#include "keystone/wal.hpp"
#include "keystone/worker.hpp"

using namespace keystone;
using jsonlite::make_string;
using jsonlite::make_u64;

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

constexpr const char* kTenant = "tenant-a";
constexpr const char* kSession = "sess-1";

// Coordinator over in-memory stores. Capabilities are registered on router
// before build().
struct Fixture {
  std::shared_ptr<MemoryStateBackend> backend = std::make_shared<MemoryStateBackend>();
  std::shared_ptr<MemoryWalStore> wal_store = std::make_shared<MemoryWalStore>();
  std::shared_ptr<StateSurface> state;
  std::shared_ptr<WriteAheadLog> wal;
  std::shared_ptr<CapabilityRouter> router = std::make_shared<CapabilityRouter>();
  std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>(4);
  std::shared_ptr<SagaCoordinator> saga;
  uint64_t step_timeout_ms;
  uint32_t max_handler_threads = 256;

  explicit Fixture(uint64_t timeout_ms = 2000) : step_timeout_ms(timeout_ms) {
    RetryPolicy retry{2, 1, 5};
    state = std::make_shared<StateSurface>(backend, retry);
    wal = std::make_shared<WriteAheadLog>(wal_store, retry);
  }

  ~Fixture() { pool->shutdown(); }

  void add(IntentType type, Capability cap) {
    const Error e = router->register_capability(type, std::move(cap));
    expect(e.ok(), "register: " + e.message);
  }

  void build() {
    router->seal();
    SagaOptions opts;
    opts.default_step_timeout_ms = step_timeout_ms;
    opts.worker_id = "w-test";
    opts.max_handler_threads = max_handler_threads;
    saga = std::make_shared<SagaCoordinator>(wal, state, router, pool, opts);
  }

  // A second coordinator over the same stores, as after a process restart.
  std::shared_ptr<SagaCoordinator> restart() {
    SagaOptions opts;
    opts.default_step_timeout_ms = step_timeout_ms;
    opts.worker_id = "w-restarted";
    return std::make_shared<SagaCoordinator>(
        std::make_shared<WriteAheadLog>(wal_store, RetryPolicy{2, 1, 5}), state, router, pool,
        opts);
  }
};

StepSpec step(const std::string& name, StepHandler handler, bool idempotent = true,
              uint32_t max_attempts = 1) {
  StepSpec s;
  s.name = name;
  s.handler = std::move(handler);
  s.idempotent = idempotent;
  s.max_attempts = max_attempts;
  return s;
}

StepHandler ok_with(const std::string& key, const std::string& value) {
  return [key, value](const StepContext&) {
    jsonlite::Object out;
    out[key] = make_string(value);
    return StepResult::success(std::move(out));
  };
}

Capability capability(std::vector<std::vector<StepSpec>> stages) {
  Capability cap;
  cap.realm_name = "test";
  cap.stages = std::move(stages);
  return cap;
}

Intent make_intent(const std::string& id, IntentType type = IntentType::echo) {
  Intent in;
  in.intent_id = "int_" + id;
  in.type = type;
  in.tenant_id = kTenant;
  in.session_id = kSession;
  in.parameters["n"] = make_u64(7);
  return in;
}

ExecutionContext make_context() {
  ExecutionContext ctx;
  ctx.tenant_id = kTenant;
  ctx.session_id = kSession;
  ctx.user_id = "u-1";
  return ctx;
}

Execution run_to_end(Fixture& f, const std::string& id, IntentType type = IntentType::echo) {
  Error e;
  auto started = f.saga->start(make_intent(id, type), make_context(), id, &e);
  expect(started.has_value(), "start " + id + ": " + e.message);
  expect(started->status == ExecutionStatus::pending, "start returns the pending execution");
  auto done = f.saga->wait(id, kTenant, std::chrono::milliseconds(5000), &e);
  expect(done.has_value(), "wait " + id + ": " + e.message);
  expect(done->terminal(), "execution " + id + " must reach a terminal state");
  return *done;
}

// Polls cond for up to two seconds.
bool eventually(const std::function<bool()>& cond) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!cond()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

std::vector<WalEvent> events_of(Fixture& f, const std::string& id) {
  Error e;
  auto events = f.wal->replay(id, &e);
  expect(events.has_value(), "replay " + id + ": " + e.message);
  return *events;
}

size_t count_type(const std::vector<WalEvent>& events, WalEventType type,
                  const std::string& step_id = "") {
  return static_cast<size_t>(std::count_if(events.begin(), events.end(), [&](const WalEvent& ev) {
    return ev.type == type &&
           (step_id.empty() || jsonlite::get_string(ev.payload, "step_id") == step_id);
  }));
}

const SagaStep& step_named(const Execution& exec, const std::string& name) {
  for (const auto& s : exec.steps) {
    if (s.capability_name == name) return s;
  }
  expect(false, "no step named " + name);
  return exec.steps.front();
}

// Appends the prefix of a WAL a crashed process would have left behind:
// STARTED, RUNNING, then any extra events.
void write_crashed_prefix(Fixture& f, const std::string& id,
                          const std::vector<std::pair<std::string, uint32_t>>& steps) {
  const ExecutionRef ref{id, kTenant, kSession};
  Error e;
  jsonlite::Object started;
  started["wal_format"] = make_u64(version::WAL_FORMAT_VERSION);
  started["intent_id"] = make_string("int_" + id);
  started["intent"] = jsonlite::make_object(intent_to_json(make_intent(id)));
  started["context"] = jsonlite::make_object(context_to_json(make_context()));
  expect(f.wal->append(ref, WalEventType::execution_started, started, &e).has_value(),
         "append STARTED: " + e.message);

  jsonlite::Array list;
  for (const auto& [name, stage] : steps) {
    jsonlite::Object so;
    so["step_id"] = make_string(id + ":" + name);
    so["capability_name"] = make_string(name);
    so["stage"] = make_u64(stage);
    list.push_back(jsonlite::make_object(std::move(so)));
  }
  jsonlite::Object running;
  running["realm"] = make_string("test");
  running["steps"] = jsonlite::make_array(std::move(list));
  expect(f.wal->append(ref, WalEventType::execution_running, running, &e).has_value(),
         "append RUNNING: " + e.message);
}

void append_step_event(Fixture& f, const std::string& id, WalEventType type,
                       const std::string& step_name, jsonlite::Object extra = {}) {
  Error e;
  extra["step_id"] = make_string(id + ":" + step_name);
  if (type == WalEventType::step_started) extra["attempt"] = make_u64(1);
  expect(f.wal->append(ExecutionRef{id, kTenant, kSession}, type, extra, &e).has_value(),
         "append " + to_string(type) + ": " + e.message);
}

// ============================================================================
// Forward path
// ============================================================================

void test_stages_complete_in_order() {
  Fixture f;
  StepHandler second = [](const StepContext& ctx) {
    auto it = ctx.prior_outputs.find("first");
    if (it == ctx.prior_outputs.end()) return StepResult::failure("first output missing");
    jsonlite::Object out;
    out["saw"] = make_string(jsonlite::get_string(it->second, "value"));
    out["tenant"] = make_string(ctx.context.tenant_id);
    return StepResult::success(std::move(out));
  };
  f.add(IntentType::echo, capability({{step("first", ok_with("value", "alpha"))},
                                      {step("second", second)}}));
  f.build();

  const Execution exec = run_to_end(f, "exe-happy");
  expect(exec.status == ExecutionStatus::completed, "execution completed");
  expect(exec.realm_name == "test", "realm recorded");
  expect(exec.steps.size() == 2, "two steps");
  const SagaStep& s2 = step_named(exec, "second");
  expect(jsonlite::get_string(s2.output, "saw") == "alpha", "second step sees first output");
  expect(jsonlite::get_string(s2.output, "tenant") == kTenant, "context threaded to handler");

  const auto events = events_of(f, "exe-happy");
  expect(events.front().type == WalEventType::execution_started, "first event STARTED");
  expect(events.back().type == WalEventType::execution_completed, "last event COMPLETED");
  expect(events.size() == 7, "STARTED RUNNING 2x(STEP_STARTED STEP_COMPLETED) COMPLETED");
  for (size_t i = 0; i < events.size(); ++i) {
    expect(events[i].sequence_no == i + 1, "sequence numbers are dense");
  }
  expect(exec.last_sequence_no == events.size(), "snapshot at the WAL head");
}

void test_parallel_stage_runs_concurrently() {
  Fixture f;
  auto live = std::make_shared<std::atomic<int>>(0);
  auto peak = std::make_shared<std::atomic<int>>(0);
  auto slow = [live, peak](const StepContext&) {
    const int now = ++*live;
    int prev = peak->load();
    while (now > prev && !peak->compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    --*live;
    return StepResult::success({});
  };
  f.add(IntentType::echo, capability({{step("left", slow), step("right", slow)},
                                      {step("join", ok_with("done", "yes"))}}));
  f.build();

  const Execution exec = run_to_end(f, "exe-parallel");
  expect(exec.status == ExecutionStatus::completed, "parallel execution completed");
  expect(peak->load() == 2, "both steps of the stage ran at the same time");
  const auto events = events_of(f, "exe-parallel");
  const auto join_started = std::find_if(events.begin(), events.end(), [](const WalEvent& ev) {
    return ev.type == WalEventType::step_started &&
           jsonlite::get_string(ev.payload, "step_id") == "exe-parallel:join";
  });
  expect(join_started != events.end(), "join started");
  expect(count_type(std::vector<WalEvent>(events.begin(), join_started),
                    WalEventType::step_completed) == 2,
         "next stage starts only after the whole stage completed");
}

void test_transient_failure_retried_when_idempotent() {
  Fixture f;
  auto calls = std::make_shared<std::atomic<int>>(0);
  StepHandler flaky = [calls](const StepContext& ctx) {
    if (++*calls < 3) return StepResult::failure("upstream busy", true);
    jsonlite::Object out;
    out["attempt"] = make_u64(ctx.attempt);
    return StepResult::success(std::move(out));
  };
  f.add(IntentType::echo, capability({{step("flaky", flaky, true, 3)}}));
  f.build();

  const uint64_t retries_before = global_core_stats().step_retries.load();
  const Execution exec = run_to_end(f, "exe-retry");
  expect(exec.status == ExecutionStatus::completed, "retried step completes");
  const SagaStep& s = step_named(exec, "flaky");
  expect(s.attempt_count == 3, "three attempts recorded");
  expect(jsonlite::get_u64(s.output, "attempt") == 3, "handler saw attempt number");
  const auto events = events_of(f, "exe-retry");
  expect(count_type(events, WalEventType::step_started) == 3, "one STEP_STARTED per attempt");
  expect(count_type(events, WalEventType::step_failed) == 2, "two failed attempts logged");
  expect(global_core_stats().step_retries.load() >= retries_before + 2, "retries counted");
}

void test_non_idempotent_step_not_retried() {
  Fixture f;
  auto calls = std::make_shared<std::atomic<int>>(0);
  StepHandler flaky = [calls](const StepContext&) {
    ++*calls;
    return StepResult::failure("upstream busy", true);
  };
  f.add(IntentType::echo, capability({{step("charge", flaky, false, 5)}}));
  f.build();

  const Execution exec = run_to_end(f, "exe-noretry");
  expect(exec.status == ExecutionStatus::failed, "nothing completed, so failed");
  expect(calls->load() == 1, "non-idempotent step invoked once");
  expect(exec.error_code == ErrorCode::step_execution_error, "cause recorded");
}

// ============================================================================
// Compensation
// ============================================================================

void test_compensation_runs_in_reverse() {
  Fixture f;
  auto undone = std::make_shared<std::vector<std::string>>();
  auto mu = std::make_shared<std::mutex>();
  auto undo = [undone, mu](const StepContext& ctx) {
    std::lock_guard<std::mutex> lk(*mu);
    undone->push_back(ctx.step_name);
    return StepResult::success({});
  };
  StepSpec a = step("A", ok_with("a", "1"));
  a.compensation = StepHandler(undo);
  StepSpec b = step("B", ok_with("b", "2"));
  b.compensation = StepHandler(undo);
  StepSpec c = step("C", [](const StepContext&) { return StepResult::failure("C exploded"); });
  f.add(IntentType::echo, capability({{a}, {b}, {c}}));
  f.build();

  const Execution exec = run_to_end(f, "exe-comp");
  expect(exec.status == ExecutionStatus::compensated, "execution compensated");
  expect(exec.error_code == ErrorCode::step_execution_error, "cause is the failed step");
  expect(exec.error.find("C exploded") != std::string::npos, "cause message kept");
  expect(undone->size() == 2, "both completed steps compensated");
  expect((*undone)[0] == "B" && (*undone)[1] == "A", "compensation is B then A");
  expect(step_named(exec, "A").status == StepStatus::compensated, "A compensated");
  expect(step_named(exec, "B").status == StepStatus::compensated, "B compensated");
  expect(step_named(exec, "C").status == StepStatus::failed, "C failed");
}

void test_failure_with_nothing_completed_is_failed() {
  Fixture f;
  f.add(IntentType::echo,
        capability({{step("only", [](const StepContext&) { return StepResult::failure("no"); })}}));
  f.build();
  const Execution exec = run_to_end(f, "exe-fail-first");
  expect(exec.status == ExecutionStatus::failed, "status failed");
  expect(count_type(events_of(f, "exe-fail-first"), WalEventType::step_compensating) == 0,
         "nothing to compensate");
}

void test_failed_compensation_fails_execution() {
  Fixture f;
  StepSpec a = step("A", ok_with("a", "1"));
  a.compensation = StepHandler([](const StepContext&) { return StepResult::failure("undo refused"); });
  StepSpec b = step("B", ok_with("b", "2"));
  b.compensation = StepHandler([](const StepContext&) { return StepResult::success({}); });
  StepSpec c = step("C", [](const StepContext&) { return StepResult::failure("C exploded"); });
  f.add(IntentType::echo, capability({{a}, {b}, {c}}));
  f.build();

  const Execution exec = run_to_end(f, "exe-comp-fail");
  expect(exec.status == ExecutionStatus::failed, "failed compensation ends failed");
  expect(exec.error.find("compensation failed") != std::string::npos, "error names compensation");
  expect(step_named(exec, "B").status == StepStatus::compensated, "B still compensated");
  expect(step_named(exec, "A").status == StepStatus::compensating, "A left compensating");
}

void test_step_timeout_abandons_handler() {
  Fixture f(50);
  StepHandler slow = [](const StepContext&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    return StepResult::success({});
  };
  f.add(IntentType::echo, capability({{step("slow", slow, true, 3)}}));
  f.build();

  const uint64_t timeouts_before = global_core_stats().step_timeouts.load();
  const uint64_t abandoned_before = global_core_stats().handlers_abandoned.load();
  const auto t0 = std::chrono::steady_clock::now();
  const Execution exec = run_to_end(f, "exe-timeout");
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(exec.status == ExecutionStatus::failed, "timed-out execution failed");
  expect(exec.error_code == ErrorCode::timeout, "cause is timeout");
  expect(step_named(exec, "slow").attempt_count == 1, "timeouts are not retried");
  expect(elapsed < std::chrono::milliseconds(350), "coordinator did not wait for the handler");
  expect(global_core_stats().step_timeouts.load() == timeouts_before + 1, "timeout counted");
  expect(global_core_stats().handlers_abandoned.load() == abandoned_before + 1,
         "abandoned handler counted");
  expect(f.saga->live_handlers() == 1, "abandoned handler still running");
  expect(eventually([&] { return f.saga->live_handlers() == 0; }),
         "abandoned handler thread exits on its own");
}

void test_handler_threads_are_bounded() {
  Fixture f(50);
  f.max_handler_threads = 1;
  StepHandler stuck = [](const StepContext&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    return StepResult::success({});
  };
  f.add(IntentType::echo, capability({{step("stuck", stuck, false)}}));
  f.add(IntentType::ingest_file, capability({{step("quick", ok_with("q", "1"), false)}}));
  f.build();

  const Execution timed_out = run_to_end(f, "exe-stuck");
  expect(timed_out.error_code == ErrorCode::timeout, "first execution timed out");
  expect(f.saga->live_handlers() == 1, "abandoned handler holds the only slot");

  const Execution refused = run_to_end(f, "exe-refused", IntentType::ingest_file);
  expect(refused.status == ExecutionStatus::failed, "no slot, step fails");
  expect(step_named(refused, "quick").error.find("capacity") != std::string::npos,
         "failure names handler capacity");

  expect(eventually([&] { return f.saga->live_handlers() == 0; }), "slot freed");
  const Execution later = run_to_end(f, "exe-later", IntentType::ingest_file);
  expect(later.status == ExecutionStatus::completed, "runs once the slot is free");
}

void test_handler_exception_becomes_step_error() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("throws", [](const StepContext&) -> StepResult {
                                        throw std::runtime_error("boom");
                                      })}}));
  f.build();
  const Execution exec = run_to_end(f, "exe-throw");
  const SagaStep& s = step_named(exec, "throws");
  expect(s.status == StepStatus::failed, "throwing step failed");
  expect(s.error_code == ErrorCode::step_execution_error, "exception mapped to step error");
  expect(s.error.find("boom") != std::string::npos, "exception message preserved");
}

void test_cancel_compensates_before_next_dispatch() {
  Fixture f;
  auto gate = std::make_shared<std::promise<void>>();
  std::shared_future<void> opened = gate->get_future().share();
  auto second_calls = std::make_shared<std::atomic<int>>(0);
  StepSpec a = step("A", [opened](const StepContext&) {
    opened.wait_for(std::chrono::seconds(2));
    return StepResult::success({});
  });
  a.compensation = StepHandler([](const StepContext&) { return StepResult::success({}); });
  StepSpec b = step("B", [second_calls](const StepContext&) {
    ++*second_calls;
    return StepResult::success({});
  });
  f.add(IntentType::echo, capability({{a}, {b}}));
  f.build();

  Error e;
  expect(f.saga->start(make_intent("exe-cancel"), make_context(), "exe-cancel", &e).has_value(),
         "start");
  for (int i = 0; i < 200; ++i) {
    auto s = f.saga->status("exe-cancel", kTenant, nullptr);
    if (s && !s->steps.empty() && s->steps[0].status == StepStatus::running) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  auto cancelled = f.saga->cancel("exe-cancel", kTenant, &e);
  expect(cancelled.has_value(), "cancel: " + e.message);
  expect(cancelled->cancel_requested, "flag set");
  gate->set_value();

  auto done = f.saga->wait("exe-cancel", kTenant, std::chrono::milliseconds(5000), &e);
  expect(done.has_value() && done->terminal(), "cancelled execution terminal");
  expect(done->status == ExecutionStatus::compensated, "completed A was compensated");
  expect(done->error_code == ErrorCode::cancelled, "cause is cancelled");
  expect(second_calls->load() == 0, "B never dispatched");

  auto again = f.saga->cancel("exe-cancel", kTenant, &e);
  expect(again.has_value() && again->status == ExecutionStatus::compensated,
         "cancelling a terminal execution returns it unchanged");
}

void test_unknown_capability_fails_without_compensation() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("x", ok_with("x", "1"))}}));
  f.build();
  const Execution exec = run_to_end(f, "exe-nocap", IntentType::generate_report);
  expect(exec.status == ExecutionStatus::failed, "failed at dispatch");
  expect(exec.error_code == ErrorCode::capability_not_found, "capability_not_found");
  expect(exec.steps.empty(), "no steps planned");
  expect(count_type(events_of(f, "exe-nocap"), WalEventType::execution_running) == 0,
         "never entered running");
}

// ============================================================================
// Replay, recovery and corruption
// ============================================================================

void test_fold_of_wal_equals_snapshot() {
  Fixture f;
  StepSpec a = step("A", ok_with("a", "1"));
  a.compensation = StepHandler([](const StepContext&) { return StepResult::success({}); });
  f.add(IntentType::echo,
        capability({{a}, {step("B", [](const StepContext&) { return StepResult::failure("no"); })}}));
  f.build();

  const Execution snap = run_to_end(f, "exe-fold");
  Error e;
  auto folded = fold(events_of(f, "exe-fold"), &e);
  expect(folded.has_value(), "fold: " + e.message);
  expect(jsonlite::to_json(execution_to_json(*folded)) == jsonlite::to_json(execution_to_json(snap)),
         "fold of the WAL equals the stored snapshot");
}

void test_resume_reinvokes_idempotent_step_once() {
  Fixture f;
  auto calls = std::make_shared<std::atomic<int>>(0);
  f.add(IntentType::echo, capability({{step("A", [calls](const StepContext&) {
                                        ++*calls;
                                        return StepResult::success({});
                                      })}}));
  f.build();
  write_crashed_prefix(f, "exe-resume", {{"A", 0}});
  append_step_event(f, "exe-resume", WalEventType::step_started, "A");

  auto rebooted = f.restart();
  Error e;
  auto exec = rebooted->recover("exe-resume", &e);
  expect(exec.has_value(), "recover: " + e.message);
  expect(exec->status == ExecutionStatus::completed, "resumed execution completed");
  expect(calls->load() == 1, "idempotent step re-invoked exactly once");
  const auto events = events_of(f, "exe-resume");
  expect(count_type(events, WalEventType::step_started) == 1, "no second STEP_STARTED");
  expect(step_named(*exec, "A").attempt_count == 1, "attempt count unchanged");
}

void test_resume_fails_non_idempotent_step() {
  Fixture f;
  auto b_calls = std::make_shared<std::atomic<int>>(0);
  auto a_undone = std::make_shared<std::atomic<int>>(0);
  StepSpec a = step("A", ok_with("a", "1"));
  a.compensation = StepHandler([a_undone](const StepContext&) {
    ++*a_undone;
    return StepResult::success({});
  });
  StepSpec b = step("B", [b_calls](const StepContext&) {
    ++*b_calls;
    return StepResult::success({});
  }, false);
  f.add(IntentType::echo, capability({{a}, {b}}));
  f.build();

  write_crashed_prefix(f, "exe-resume-ni", {{"A", 0}, {"B", 1}});
  append_step_event(f, "exe-resume-ni", WalEventType::step_started, "A");
  jsonlite::Object out;
  out["output"] = jsonlite::make_object({});
  append_step_event(f, "exe-resume-ni", WalEventType::step_completed, "A", out);
  append_step_event(f, "exe-resume-ni", WalEventType::step_started, "B");

  Error e;
  auto exec = f.restart()->recover("exe-resume-ni", &e);
  expect(exec.has_value(), "recover: " + e.message);
  expect(b_calls->load() == 0, "non-idempotent step not re-invoked");
  expect(step_named(*exec, "B").status == StepStatus::failed, "interrupted step failed");
  expect(step_named(*exec, "B").error.find("interrupted") != std::string::npos,
         "failure says interrupted");
  expect(a_undone->load() == 1, "completed step compensated");
  expect(exec->status == ExecutionStatus::compensated, "execution compensated");
  const auto events = events_of(f, "exe-resume-ni");
  expect(count_type(events, WalEventType::step_failed, "exe-resume-ni:B") == 1,
         "exactly one failed transition for the interrupted step");
}

void test_tampered_wal_freezes_execution() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("A", ok_with("a", "1"))}}));
  f.build();
  run_to_end(f, "exe-tamper");

  std::vector<std::string> lines;
  expect(f.wal_store->read("exe-tamper", &lines) == BackendStatus::ok, "read raw WAL");
  std::string forged = lines[1];
  const auto pos = forged.find("\"realm\":\"test\"");
  expect(pos != std::string::npos, "realm present in RUNNING line");
  forged.replace(pos, 14, "\"realm\":\"evil\"");
  expect(f.wal_store->tamper("exe-tamper", 1, forged), "tamper");

  const uint64_t corruptions_before = global_core_stats().state_corruptions.load();
  Error e;
  auto exec = f.restart()->recover("exe-tamper", &e);
  expect(!exec.has_value(), "recover refuses a broken chain");
  expect(e.code == ErrorCode::state_corruption, "state_corruption reported");
  auto frozen = f.saga->status("exe-tamper", kTenant, &e);
  expect(frozen.has_value(), "snapshot still readable");
  expect(frozen->corrupted, "marked corrupted");
  expect(frozen->status == ExecutionStatus::failed, "frozen as failed");
  expect(frozen->error_code == ErrorCode::state_corruption, "error code state_corruption");
  expect(global_core_stats().state_corruptions.load() > corruptions_before, "corruption counted");
}

void test_completed_without_started_freezes() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("A", ok_with("a", "1"))}}));
  f.build();
  write_crashed_prefix(f, "exe-skip", {{"A", 0}});
  jsonlite::Object out;
  out["output"] = jsonlite::make_object({});
  append_step_event(f, "exe-skip", WalEventType::step_completed, "A", out);

  Error e;
  auto exec = f.restart()->recover("exe-skip", &e);
  expect(!exec.has_value(), "impossible transition is not folded");
  expect(e.code == ErrorCode::state_corruption, "state_corruption reported");
  auto frozen = f.saga->status("exe-skip", kTenant, &e);
  expect(frozen.has_value(), "frozen snapshot written");
  expect(frozen->corrupted, "marked corrupted");
  expect(frozen->status == ExecutionStatus::failed, "frozen as failed");
}

void test_recover_all_reports_each_outcome() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("A", ok_with("a", "1"))}}));
  f.build();
  run_to_end(f, "exe-done");
  write_crashed_prefix(f, "exe-interrupted", {{"A", 0}});

  const RecoveryReport report = f.restart()->recover_all();
  expect(report.scanned == 2, "two streams scanned");
  expect(report.already_terminal == 1, "one already terminal");
  expect(report.resumed == 1, "one resumed");
  expect(report.corrupted == 0 && report.errors == 0, "no failures");
  auto exec = f.saga->status("exe-interrupted", kTenant, nullptr);
  expect(exec && exec->status == ExecutionStatus::completed, "interrupted execution finished");
}

// ============================================================================
// Isolation and admission guards
// ============================================================================

void test_status_is_tenant_scoped() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("A", ok_with("a", "1"))}}));
  f.build();
  run_to_end(f, "exe-iso");
  Error e;
  expect(!f.saga->status("exe-iso", "tenant-b", &e).has_value(), "other tenant cannot read");
  expect(e.code == ErrorCode::not_found, "reported as not_found");
  e = Error{};
  expect(!f.saga->cancel("exe-iso", "tenant-b", &e).has_value(), "other tenant cannot cancel");
  expect(e.code == ErrorCode::not_found, "cancel reported as not_found");
}

void test_terminal_executions_leave_no_live_state() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("A", ok_with("a", "1"))}}));
  f.build();
  for (int i = 0; i < 50; ++i) {
    const std::string id = "exe-drain-" + std::to_string(i);
    Error e;
    expect(f.saga->start(make_intent(id), make_context(), id, &e).has_value(), "start " + id);
    // A waiter contends for the lease while the driver releases it.
    auto done = f.saga->wait(id, kTenant, std::chrono::milliseconds(5000), &e);
    expect(done && done->status == ExecutionStatus::completed, id + " completed");
  }
  expect(eventually([&] { return f.saga->leases().size() == 0; }),
         "every lease released");
  expect(f.wal->cached_tails() == 0, "no WAL tail kept for terminal executions");
}

void test_duplicate_execution_id_rejected() {
  Fixture f;
  f.add(IntentType::echo, capability({{step("A", ok_with("a", "1"))}}));
  f.build();
  run_to_end(f, "exe-dup");
  Error e;
  expect(!f.saga->start(make_intent("exe-dup"), make_context(), "exe-dup", &e).has_value(),
         "second start with the same id rejected");
  expect(e.code == ErrorCode::validation_error, "validation_error");

  ExecutionContext wrong = make_context();
  wrong.tenant_id = "tenant-b";
  e = Error{};
  expect(!f.saga->start(make_intent("exe-mismatch"), wrong, "exe-mismatch", &e).has_value(),
         "context tenant must match intent tenant");
  expect(e.code == ErrorCode::validation_error, "mismatch is validation_error");
}

}  // namespace

int main() {
  set_log_threshold(LogLevel::error);
  std::cout << "=== Keystone Saga Coordinator Test Suite ===\n";

  std::cout << "\n[Forward path]\n";
  run_test("stages complete in order", test_stages_complete_in_order);
  run_test("parallel stage runs concurrently", test_parallel_stage_runs_concurrently);
  run_test("transient failure retried when idempotent", test_transient_failure_retried_when_idempotent);
  run_test("non-idempotent step not retried", test_non_idempotent_step_not_retried);

  std::cout << "\n[Compensation]\n";
  run_test("compensation runs in reverse", test_compensation_runs_in_reverse);
  run_test("failure with nothing completed", test_failure_with_nothing_completed_is_failed);
  run_test("failed compensation fails execution", test_failed_compensation_fails_execution);
  run_test("step timeout abandons handler", test_step_timeout_abandons_handler);
  run_test("handler threads are bounded", test_handler_threads_are_bounded);
  run_test("handler exception becomes step error", test_handler_exception_becomes_step_error);
  run_test("cancel compensates before next dispatch", test_cancel_compensates_before_next_dispatch);
  run_test("unknown capability fails without compensation",
           test_unknown_capability_fails_without_compensation);

  std::cout << "\n[Replay & Recovery]\n";
  run_test("fold of WAL equals snapshot", test_fold_of_wal_equals_snapshot);
  run_test("resume re-invokes idempotent step once", test_resume_reinvokes_idempotent_step_once);
  run_test("resume fails non-idempotent step", test_resume_fails_non_idempotent_step);
  run_test("tampered WAL freezes execution", test_tampered_wal_freezes_execution);
  run_test("completed without started freezes", test_completed_without_started_freezes);
  run_test("recover_all reports each outcome", test_recover_all_reports_each_outcome);

  std::cout << "\n[Isolation]\n";
  run_test("status is tenant scoped", test_status_is_tenant_scoped);
  run_test("terminal executions leave no live state", test_terminal_executions_leave_no_live_state);
  run_test("duplicate execution id rejected", test_duplicate_execution_id_rejected);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
