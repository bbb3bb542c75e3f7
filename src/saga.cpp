#include "keystone/saga.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <sstream>
#include <thread>

#include "keystone/observability.hpp"
#include "keystone/version.hpp"

namespace keystone {

using jsonlite::make_bool;
using jsonlite::make_object;
using jsonlite::make_string;
using jsonlite::make_u64;

namespace {

StateKey execution_key(const std::string& tenant_id, const std::string& execution_id) {
  return StateKey{tenant_id, ns::kExecution, execution_id, ""};
}

// Owned copy of everything a handler may read. The handler thread holds it
// by shared_ptr, so an abandoned (timed-out) handler never reads freed state.
struct HandlerInput {
  ExecutionContext                        context;
  Intent                                  intent;
  std::map<std::string, jsonlite::Object> prior_outputs;
  std::string                             step_id;
  std::string                             step_name;
  uint32_t                                attempt{1};
};

std::shared_ptr<const HandlerInput> make_input(const Execution& exec, const SagaStep& step,
                                               uint32_t attempt) {
  auto in = std::make_shared<HandlerInput>();
  in->context = exec.context;
  in->intent = exec.intent;
  for (const auto& s : exec.steps) {
    if (s.status == StepStatus::completed || s.status == StepStatus::compensating) {
      in->prior_outputs[s.capability_name] = s.output;
    }
  }
  in->step_id = step.step_id;
  in->step_name = step.capability_name;
  in->attempt = attempt;
  return in;
}

// Runs the handler on its own thread and waits at most timeout_ms. On timeout
// the thread is abandoned; it finishes on its own and its result is dropped.
// live counts handler threads still running, abandoned ones included. At
// max_live no thread is started and the step fails as a transient error.
StepResult invoke_with_timeout(const StepHandler& handler,
                               std::shared_ptr<const HandlerInput> input, uint64_t timeout_ms,
                               const std::shared_ptr<std::atomic<uint32_t>>& live,
                               uint32_t max_live, bool* timed_out) {
  *timed_out = false;
  if (live->fetch_add(1) >= max_live) {
    live->fetch_sub(1);
    return StepResult::failure(
        "handler capacity exhausted (" + std::to_string(max_live) + " threads running)", true);
  }
  CoreStats& stats = global_core_stats();
  stats.handlers_in_flight.fetch_add(1, std::memory_order_relaxed);

  auto promise = std::make_shared<std::promise<StepResult>>();
  auto future = promise->get_future();
  std::thread([handler, input, promise, live] {
    StepResult r;
    try {
      const StepContext ctx{input->context, input->intent, input->prior_outputs,
                            input->step_id, input->step_name, input->attempt};
      r = handler(ctx);
    } catch (const std::exception& e) {
      r = StepResult::failure(std::string("handler threw: ") + e.what());
    } catch (...) {
      r = StepResult::failure("handler threw a non-standard exception");
    }
    promise->set_value(std::move(r));
    live->fetch_sub(1);
    global_core_stats().handlers_in_flight.fetch_sub(1, std::memory_order_relaxed);
  }).detach();

  if (future.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
    *timed_out = true;
    stats.handlers_abandoned.fetch_add(1, std::memory_order_relaxed);
    StepResult r;
    r.ok = false;
    r.error_code = ErrorCode::timeout;
    r.error = "step exceeded " + std::to_string(timeout_ms) + "ms";
    return r;
  }
  StepResult r = future.get();
  if (!r.ok && r.error_code == ErrorCode::none) r.error_code = ErrorCode::step_execution_error;
  return r;
}

bool needs_compensation(const Execution& exec) {
  if (exec.cancel_requested) return true;
  for (const auto& s : exec.steps) {
    if (s.status == StepStatus::failed || s.status == StepStatus::compensating ||
        s.status == StepStatus::compensated) {
      return true;
    }
  }
  return false;
}

void emit(CoreEventKind kind, const Execution& exec, const std::string& step_id = "",
          ErrorCode code = ErrorCode::none, uint64_t duration_ns = 0) {
  CoreEvent ev;
  ev.kind = kind;
  ev.tenant_id = exec.tenant_id;
  ev.execution_id = exec.execution_id;
  ev.step_id = step_id;
  ev.error_code = code;
  ev.duration_ns = duration_ns;
  emit_core_event(ev);
}

}  // namespace

// ---------------------------------------------------------------------------
// ExecutionLeaseTable
// ---------------------------------------------------------------------------

std::shared_ptr<ExecutionLeaseTable::Lease> ExecutionLeaseTable::acquire(
    const std::string& execution_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& slot = leases_[execution_id];
  if (!slot) slot = std::make_shared<Lease>();
  return slot;
}

std::shared_ptr<ExecutionLeaseTable::Lease> ExecutionLeaseTable::find(
    const std::string& execution_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = leases_.find(execution_id);
  return it == leases_.end() ? nullptr : it->second;
}

void ExecutionLeaseTable::release(const std::string& execution_id) {
  std::shared_ptr<Lease> lease = find(execution_id);
  if (!lease) return;
  // Lock order is lease then table. A waiter holding lease->mu only delays
  // the release.
  std::lock_guard<std::mutex> lease_lk(lease->mu);
  if (lease->driving) return;
  std::lock_guard<std::mutex> lk(mu_);
  auto it = leases_.find(execution_id);
  if (it != leases_.end() && it->second == lease) leases_.erase(it);
}

size_t ExecutionLeaseTable::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return leases_.size();
}

std::string RecoveryReport::to_json() const {
  std::ostringstream o;
  o << "{\"scanned\":" << scanned << ",\"already_terminal\":" << already_terminal
    << ",\"resumed\":" << resumed << ",\"corrupted\":" << corrupted << ",\"errors\":" << errors
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// SagaCoordinator — transitions
// ---------------------------------------------------------------------------

SagaCoordinator::SagaCoordinator(std::shared_ptr<WriteAheadLog> wal,
                                 std::shared_ptr<StateSurface> state,
                                 std::shared_ptr<const CapabilityRouter> router,
                                 std::shared_ptr<WorkerPool> pool, SagaOptions options)
    : wal_(std::move(wal)),
      state_(std::move(state)),
      router_(std::move(router)),
      pool_(std::move(pool)),
      options_(std::move(options)) {
  if (options_.worker_id.empty()) options_.worker_id = global_worker_identity().worker_id;
  if (options_.default_step_timeout_ms == 0) options_.default_step_timeout_ms = 30000;
  if (options_.max_handler_threads == 0) options_.max_handler_threads = 1;
}

uint64_t SagaCoordinator::timeout_for(const StepSpec& spec) const {
  return spec.timeout_ms > 0 ? spec.timeout_ms : options_.default_step_timeout_ms;
}

void SagaCoordinator::write_snapshot(const Execution& exec) {
  Error e;
  if (!state_->set_key(execution_key(exec.tenant_id, exec.execution_id),
                       jsonlite::to_json(execution_to_json(exec)), std::nullopt, std::nullopt,
                       &e)) {
    // The WAL is authoritative; the next transition or recovery rewrites it.
    log_event(LogLevel::warn, "saga",
              "snapshot write failed for " + exec.execution_id + ": " + e.message);
  }
}

bool SagaCoordinator::transition_locked(ExecutionLeaseTable::Lease& lease, WalEventType type,
                                        jsonlite::Object payload, Error* err) {
  Execution& exec = lease.exec;
  const ExecutionRef ref{exec.execution_id, exec.tenant_id, exec.session_id};
  Error e;
  auto ev = wal_->append(ref, type, std::move(payload), &e);
  if (!ev) {
    if (e.code == ErrorCode::state_corruption) freeze(lease, e.message);
    log_event(LogLevel::error, "saga",
              exec.execution_id + ": cannot record " + to_string(type) + ": " + e.message);
    if (err) *err = e;
    return false;
  }
  Execution next = exec;
  if (!apply_wal_event(&next, *ev, &e)) {
    freeze(lease, e.message);
    if (err) *err = e;
    return false;
  }
  exec = std::move(next);
  write_snapshot(exec);
  return true;
}

bool SagaCoordinator::transition(ExecutionLeaseTable::Lease& lease, WalEventType type,
                                 jsonlite::Object payload, Error* err) {
  bool ok = false;
  {
    std::lock_guard<std::mutex> lk(lease.mu);
    lease.owner = options_.worker_id;
    ok = transition_locked(lease, type, std::move(payload), err);
    lease.owner.clear();
  }
  lease.cv.notify_all();
  return ok;
}

Execution SagaCoordinator::snapshot_of(ExecutionLeaseTable::Lease& lease) {
  std::lock_guard<std::mutex> lk(lease.mu);
  return lease.exec;
}

void SagaCoordinator::freeze(ExecutionLeaseTable::Lease& lease, const std::string& why) {
  Execution& exec = lease.exec;
  exec.status = ExecutionStatus::failed;
  exec.corrupted = true;
  exec.error_code = ErrorCode::state_corruption;
  exec.error = why;
  exec.completed_at_ms = state_->clock().now_unix_ms();
  write_snapshot(exec);
  wal_->forget(exec.execution_id);
  emit(CoreEventKind::state_corruption, exec, "", ErrorCode::state_corruption);
  log_event(LogLevel::error, "saga", exec.execution_id + " frozen for operator review: " + why);
}

void SagaCoordinator::freeze_unloaded(const std::string& execution_id, const std::string& why) {
  auto ref = wal_->stream_ref(execution_id);
  if (!ref) {
    log_event(LogLevel::error, "saga",
              execution_id + " unattributable corrupt WAL stream: " + why);
    return;
  }
  auto lease = leases_.acquire(execution_id);
  {
    std::lock_guard<std::mutex> lk(lease->mu);
    auto current = status(execution_id, ref->tenant_id, nullptr);
    if (current) {
      lease->exec = *current;
    } else {
      lease->exec = Execution{};
      lease->exec.execution_id = ref->execution_id;
      lease->exec.tenant_id = ref->tenant_id;
      lease->exec.session_id = ref->session_id;
    }
    lease->loaded = true;
    freeze(*lease, why);
  }
  leases_.release(execution_id);
}

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

std::optional<Execution> SagaCoordinator::start(const Intent& intent,
                                                const ExecutionContext& context,
                                                const std::string& execution_id, Error* err) {
  if (!valid_key_component(execution_id) || !valid_key_component(intent.tenant_id) ||
      context.tenant_id != intent.tenant_id) {
    fail(err, ErrorCode::validation_error, "execution requires a valid id and matching tenant");
    return std::nullopt;
  }
  Error probe;
  if (wal_->replay(execution_id, &probe) || probe.code != ErrorCode::not_found) {
    fail(err, ErrorCode::validation_error, "execution id already in use: " + execution_id);
    return std::nullopt;
  }

  auto lease = leases_.acquire(execution_id);
  Execution started;
  {
    std::lock_guard<std::mutex> lk(lease->mu);
    if (lease->loaded) {
      fail(err, ErrorCode::validation_error, "execution id already in use: " + execution_id);
      return std::nullopt;
    }
    lease->exec = Execution{};
    lease->exec.execution_id = execution_id;
    lease->exec.tenant_id = intent.tenant_id;
    lease->exec.session_id = intent.session_id;

    jsonlite::Object payload;
    payload["wal_format"] = make_u64(version::WAL_FORMAT_VERSION);
    payload["intent_id"] = make_string(intent.intent_id);
    payload["intent"] = make_object(intent_to_json(intent));
    payload["context"] = make_object(context_to_json(context));
    lease->owner = options_.worker_id;
    const bool ok = transition_locked(*lease, WalEventType::execution_started, std::move(payload), err);
    lease->owner.clear();
    if (!ok) {
      lease->exec = Execution{};
    } else {
      lease->loaded = true;
      lease->driving = true;
      started = lease->exec;
    }
  }
  if (!started.execution_id.empty()) {
    schedule(lease);
    log_event(LogLevel::info, "saga",
              execution_id + " started (" + to_string(intent.type) + ", tenant " + intent.tenant_id + ")");
    return started;
  }
  leases_.release(execution_id);
  return std::nullopt;
}

std::optional<Execution> SagaCoordinator::status(const std::string& execution_id,
                                                 const std::string& tenant_id, Error* err) const {
  if (!valid_key_component(execution_id) || !valid_key_component(tenant_id)) {
    fail(err, ErrorCode::not_found, "execution not found");
    return std::nullopt;
  }
  Error e;
  auto rec = state_->get_key(execution_key(tenant_id, execution_id), &e);
  if (!rec) {
    if (e.code == ErrorCode::not_found) {
      fail(err, ErrorCode::not_found, "execution not found: " + execution_id);
    } else if (err) {
      *err = e;
    }
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> perr;
  Execution exec;
  if (!execution_from_json(jsonlite::parse(rec->value, &perr), &exec) || perr ||
      exec.tenant_id != tenant_id) {
    fail(err, ErrorCode::state_corruption, "execution snapshot unreadable: " + execution_id);
    return std::nullopt;
  }
  return exec;
}

std::optional<Execution> SagaCoordinator::cancel(const std::string& execution_id,
                                                 const std::string& tenant_id, Error* err) {
  auto current = status(execution_id, tenant_id, err);
  if (!current) return std::nullopt;
  if (current->terminal()) return current;

  auto lease = leases_.acquire(execution_id);
  bool need_drive = false;
  Execution result;
  {
    std::lock_guard<std::mutex> lk(lease->mu);
    if (!lease->loaded) {
      // Not live in this process: rebuild from the WAL.
      Error e;
      auto events = wal_->replay(execution_id, &e);
      std::optional<Execution> folded;
      if (events) folded = fold(*events, &e);
      if (!folded) {
        if (err) *err = e;
        if (e.code == ErrorCode::state_corruption) {
          lease->exec = *current;
          lease->loaded = true;
          freeze(*lease, e.message);
        }
        return std::nullopt;
      }
      lease->exec = std::move(*folded);
      lease->loaded = true;
    }
    if (lease->exec.tenant_id != tenant_id) {
      fail(err, ErrorCode::not_found, "execution not found: " + execution_id);
      return std::nullopt;
    }
    if (!lease->exec.terminal() && !lease->exec.cancel_requested) {
      jsonlite::Object payload;
      payload["requested_by"] = make_string(tenant_id);
      lease->owner = options_.worker_id;
      const bool ok = transition_locked(*lease, WalEventType::cancel_requested, std::move(payload), err);
      lease->owner.clear();
      if (!ok) return std::nullopt;
      log_event(LogLevel::info, "saga", execution_id + " cancel requested");
    }
    if (!lease->exec.terminal() && !lease->driving) {
      lease->driving = true;
      need_drive = true;
    }
    result = lease->exec;
  }
  lease->cv.notify_all();
  if (need_drive) schedule(lease);
  return result;
}

std::optional<Execution> SagaCoordinator::wait(const std::string& execution_id,
                                               const std::string& tenant_id,
                                               std::chrono::milliseconds timeout, Error* err) {
  if (auto lease = leases_.find(execution_id)) {
    std::unique_lock<std::mutex> lk(lease->mu);
    if (lease->loaded && lease->exec.tenant_id == tenant_id) {
      lease->cv.wait_for(lk, timeout, [&] { return lease->exec.terminal() || !lease->driving; });
    }
  }
  return status(execution_id, tenant_id, err);
}

std::optional<Execution> SagaCoordinator::recover(const std::string& execution_id, Error* err) {
  auto lease = leases_.acquire(execution_id);
  {
    std::lock_guard<std::mutex> lk(lease->mu);
    if (lease->driving) {
      fail(err, ErrorCode::validation_error, execution_id + " is already being driven");
      return std::nullopt;
    }
  }

  Error e;
  auto events = wal_->replay(execution_id, &e);
  std::optional<Execution> folded;
  if (events) folded = fold(*events, &e);
  if (!folded) {
    leases_.release(execution_id);
    if (e.code == ErrorCode::state_corruption) freeze_unloaded(execution_id, e.message);
    if (err) *err = e;
    return std::nullopt;
  }

  {
    std::lock_guard<std::mutex> lk(lease->mu);
    if (lease->driving) {
      fail(err, ErrorCode::validation_error, execution_id + " is already being driven");
      return std::nullopt;
    }
    lease->exec = *folded;
    lease->loaded = true;
    if (lease->exec.terminal()) {
      // Heal a snapshot that lags the WAL (crash between append and write).
      auto stored = status(execution_id, lease->exec.tenant_id, nullptr);
      if (!stored || (!stored->corrupted && stored->last_sequence_no < lease->exec.last_sequence_no)) {
        write_snapshot(lease->exec);
      }
    } else {
      lease->driving = true;
    }
  }

  if (folded->terminal()) {
    wal_->forget(execution_id);
    leases_.release(execution_id);
    return folded;
  }

  emit(CoreEventKind::execution_recovered, *folded);
  log_event(LogLevel::info, "saga",
            execution_id + " resuming from sequence " + std::to_string(folded->last_sequence_no));
  drive(lease);
  return status(execution_id, folded->tenant_id, err);
}

RecoveryReport SagaCoordinator::recover_all() {
  RecoveryReport report;
  for (const auto& id : wal_->execution_ids()) {
    ++report.scanned;
    if (auto live = leases_.find(id)) {
      std::lock_guard<std::mutex> lk(live->mu);
      if (live->driving) continue;
    }
    Error e;
    auto events = wal_->replay(id, &e);
    std::optional<Execution> folded;
    if (events) folded = fold(*events, &e);
    if (!folded) {
      if (e.code == ErrorCode::state_corruption) {
        auto stored_ref = wal_->stream_ref(id);
        auto stored = stored_ref ? status(id, stored_ref->tenant_id, nullptr) : std::nullopt;
        if (!stored || !stored->corrupted) freeze_unloaded(id, e.message);
        ++report.corrupted;
      } else {
        ++report.errors;
      }
      continue;
    }
    if (folded->terminal()) {
      auto stored = status(id, folded->tenant_id, nullptr);
      if (!stored || (!stored->corrupted && stored->last_sequence_no < folded->last_sequence_no)) {
        write_snapshot(*folded);
      }
      ++report.already_terminal;
      continue;
    }
    Error re;
    if (recover(id, &re)) {
      ++report.resumed;
    } else {
      ++report.errors;
      log_event(LogLevel::warn, "saga", "recover " + id + ": " + re.message);
    }
  }
  log_event(LogLevel::info, "saga", "recovery " + report.to_json());
  return report;
}

// ---------------------------------------------------------------------------
// Driving
// ---------------------------------------------------------------------------

void SagaCoordinator::schedule(const LeasePtr& lease) {
  if (pool_->submit([this, lease] { drive(lease); })) return;
  std::string id;
  {
    std::lock_guard<std::mutex> lk(lease->mu);
    lease->driving = false;
    id = lease->exec.execution_id;
  }
  lease->cv.notify_all();
  log_event(LogLevel::warn, "saga", "worker pool closed; " + id + " left for recovery");
}

void SagaCoordinator::drive(const LeasePtr& lease) {
  Execution snap = snapshot_of(*lease);
  if (snap.terminal()) {
    finish_drive(lease);
    return;
  }

  Error e;
  const Capability* cap = router_->resolve(snap.intent.type, &e);
  if (!cap) {
    jsonlite::Object payload;
    payload["error_code"] = make_string(to_string(ErrorCode::capability_not_found));
    payload["error"] = make_string(e.message);
    transition(*lease, WalEventType::execution_failed, std::move(payload), nullptr);
    finish_drive(lease);
    return;
  }

  if (snap.status == ExecutionStatus::pending) {
    jsonlite::Array steps;
    uint32_t stage_idx = 0;
    for (const auto& stage : cap->stages) {
      for (const auto& spec : stage) {
        jsonlite::Object so;
        so["step_id"] = make_string(snap.execution_id + ":" + spec.name);
        so["capability_name"] = make_string(spec.name);
        so["stage"] = make_u64(stage_idx);
        steps.push_back(make_object(std::move(so)));
      }
      ++stage_idx;
    }
    jsonlite::Object payload;
    payload["realm"] = make_string(cap->realm_name);
    payload["steps"] = jsonlite::make_array(std::move(steps));
    if (!transition(*lease, WalEventType::execution_running, std::move(payload), nullptr)) {
      finish_drive(lease);
      return;
    }
  }

  if (!drive_steps(lease, *cap)) {
    log_event(LogLevel::warn, "saga", snap.execution_id + " drive aborted; left for recovery");
  }
  finish_drive(lease);
}

bool SagaCoordinator::drive_steps(const LeasePtr& lease, const Capability& cap) {
  // Steps left running by a previous process.
  for (const auto& step : snapshot_of(*lease).steps) {
    if (step.status != StepStatus::running) continue;
    const StepSpec* spec = cap.find(step.capability_name);
    if (spec && spec->idempotent) {
      log_event(LogLevel::info, "saga", step.step_id + " re-invoked after interruption");
      if (!run_step(lease, *spec, step.step_id, true).recorded) return false;
    } else {
      jsonlite::Object payload;
      payload["step_id"] = make_string(step.step_id);
      payload["error_code"] = make_string(to_string(ErrorCode::step_execution_error));
      payload["error"] = make_string("interrupted before completion");
      if (!transition(*lease, WalEventType::step_failed, std::move(payload), nullptr)) return false;
    }
  }

  for (uint32_t stage = 0; stage < cap.stages.size(); ++stage) {
    const Execution before = snapshot_of(*lease);
    if (before.terminal() || needs_compensation(before)) break;
    if (!run_stage(lease, cap, stage)) return false;
  }

  const Execution snap = snapshot_of(*lease);
  if (snap.terminal()) return true;
  const bool all_completed = std::all_of(snap.steps.begin(), snap.steps.end(), [](const SagaStep& s) {
    return s.status == StepStatus::completed;
  });
  if (!needs_compensation(snap) && all_completed) {
    return transition(*lease, WalEventType::execution_completed, {}, nullptr);
  }
  return compensate(lease, cap);
}

bool SagaCoordinator::run_stage(const LeasePtr& lease, const Capability& cap, uint32_t stage) {
  std::vector<std::pair<std::string, const StepSpec*>> work;
  for (const auto& step : snapshot_of(*lease).steps) {
    if (step.stage != stage || step.status != StepStatus::pending) continue;
    const StepSpec* spec = cap.find(step.capability_name);
    if (!spec) {
      jsonlite::Object payload;
      payload["error_code"] = make_string(to_string(ErrorCode::capability_not_found));
      payload["error"] = make_string("step '" + step.capability_name + "' no longer registered");
      return transition(*lease, WalEventType::execution_failed, std::move(payload), nullptr);
    }
    work.emplace_back(step.step_id, spec);
  }
  if (work.empty()) return true;
  if (work.size() == 1) return run_step(lease, *work[0].second, work[0].first, false).recorded;

  std::vector<std::future<StepOutcome>> running;
  running.reserve(work.size());
  for (const auto& [step_id, spec] : work) {
    running.push_back(std::async(std::launch::async, [this, lease, spec = spec, id = step_id] {
      return run_step(lease, *spec, id, false);
    }));
  }
  bool recorded = true;
  for (auto& f : running) recorded = f.get().recorded && recorded;
  return recorded;
}

SagaCoordinator::StepOutcome SagaCoordinator::run_step(const LeasePtr& lease,
                                                       const StepSpec& spec,
                                                       const std::string& step_id,
                                                       bool resume_running) {
  for (;;) {
    Execution snap = snapshot_of(*lease);
    const SagaStep* step = snap.find_step(step_id);
    if (!step || snap.terminal()) return {false, false};

    uint32_t attempt = step->attempt_count;
    if (!resume_running) {
      attempt = step->attempt_count + 1;
      jsonlite::Object payload;
      payload["step_id"] = make_string(step_id);
      payload["attempt"] = make_u64(attempt);
      payload["input"] = make_object(snap.intent.parameters);
      if (!transition(*lease, WalEventType::step_started, std::move(payload), nullptr)) {
        return {false, false};
      }
      snap = snapshot_of(*lease);
      step = snap.find_step(step_id);
    }
    resume_running = false;
    if (attempt == 0) attempt = 1;

    uint64_t duration_ns = 0;
    bool timed_out = false;
    StepResult r;
    {
      ScopeTimer timer(duration_ns);
      r = invoke_with_timeout(spec.handler, make_input(snap, *step, attempt), timeout_for(spec),
                              live_handlers_, options_.max_handler_threads, &timed_out);
    }

    if (r.ok) {
      jsonlite::Object payload;
      payload["step_id"] = make_string(step_id);
      payload["output"] = make_object(std::move(r.output));
      if (!transition(*lease, WalEventType::step_completed, std::move(payload), nullptr)) {
        return {false, false};
      }
      emit(CoreEventKind::step_completed, snap, step_id, ErrorCode::none, duration_ns);
      return {true, true};
    }

    if (timed_out) {
      emit(CoreEventKind::step_timeout, snap, step_id, ErrorCode::timeout, duration_ns);
      log_event(LogLevel::warn, "saga", step_id + " timed out; handler abandoned");
    }
    const bool cancel = snapshot_of(*lease).cancel_requested;
    const bool retry = !timed_out && r.transient && spec.idempotent &&
                       attempt < spec.max_attempts && !cancel;
    jsonlite::Object payload;
    payload["step_id"] = make_string(step_id);
    payload["error_code"] = make_string(to_string(r.error_code));
    payload["error"] = make_string(r.error);
    if (retry) payload["will_retry"] = make_bool(true);
    if (!transition(*lease, WalEventType::step_failed, std::move(payload), nullptr)) {
      return {false, false};
    }
    if (!retry) {
      emit(CoreEventKind::step_failed, snap, step_id, r.error_code, duration_ns);
      return {true, false};
    }
    emit(CoreEventKind::step_retried, snap, step_id, r.error_code, duration_ns);
  }
}

bool SagaCoordinator::compensate(const LeasePtr& lease, const Capability& cap) {
  Execution snap = snapshot_of(*lease);

  ErrorCode cause = ErrorCode::step_execution_error;
  std::string cause_msg = "execution aborted";
  if (snap.cancel_requested) {
    cause = ErrorCode::cancelled;
    cause_msg = "cancelled by caller";
  } else {
    for (const auto& s : snap.steps) {
      if (s.status == StepStatus::failed) {
        cause = s.error_code;
        cause_msg = s.capability_name + ": " + s.error;
        break;
      }
    }
  }

  std::vector<SagaStep> to_undo;
  bool any_compensated = false;
  for (const auto& s : snap.steps) {
    if (s.status == StepStatus::completed || s.status == StepStatus::compensating) {
      to_undo.push_back(s);
    }
    if (s.status == StepStatus::compensated) any_compensated = true;
  }
  std::sort(to_undo.begin(), to_undo.end(), [](const SagaStep& a, const SagaStep& b) {
    return a.completed_seq > b.completed_seq;
  });

  std::vector<std::string> failed_compensations;
  for (const auto& step : to_undo) {
    if (step.status == StepStatus::completed) {
      jsonlite::Object payload;
      payload["step_id"] = make_string(step.step_id);
      if (!transition(*lease, WalEventType::step_compensating, std::move(payload), nullptr)) {
        return false;
      }
    }
    const StepSpec* spec = cap.find(step.capability_name);
    if (spec && spec->compensation) {
      const Execution current = snapshot_of(*lease);
      const SagaStep* cur = current.find_step(step.step_id);
      bool timed_out = false;
      StepResult r = invoke_with_timeout(*spec->compensation,
                                         make_input(current, *cur, cur->attempt_count),
                                         timeout_for(*spec), live_handlers_,
                                         options_.max_handler_threads, &timed_out);
      if (!r.ok) {
        jsonlite::Object payload;
        payload["step_id"] = make_string(step.step_id);
        payload["phase"] = make_string("compensation");
        payload["error_code"] = make_string(to_string(r.error_code));
        payload["error"] = make_string(r.error);
        if (!transition(*lease, WalEventType::step_failed, std::move(payload), nullptr)) {
          return false;
        }
        log_event(LogLevel::error, "saga", step.step_id + " compensation failed: " + r.error);
        failed_compensations.push_back(step.capability_name);
        continue;
      }
    }
    jsonlite::Object payload;
    payload["step_id"] = make_string(step.step_id);
    if (!transition(*lease, WalEventType::step_compensated, std::move(payload), nullptr)) {
      return false;
    }
    any_compensated = true;
  }

  jsonlite::Object payload;
  if (!failed_compensations.empty()) {
    std::string names;
    for (const auto& n : failed_compensations) names += (names.empty() ? "" : ", ") + n;
    payload["error_code"] = make_string(to_string(ErrorCode::step_execution_error));
    payload["error"] = make_string("compensation failed: " + names + " (cause: " + cause_msg + ")");
    return transition(*lease, WalEventType::execution_failed, std::move(payload), nullptr);
  }
  payload["error_code"] = make_string(to_string(cause));
  payload["error"] = make_string(cause_msg);
  return transition(*lease,
                    any_compensated ? WalEventType::execution_compensated
                                    : WalEventType::execution_failed,
                    std::move(payload), nullptr);
}

void SagaCoordinator::finish_drive(const LeasePtr& lease) {
  Execution final_state;
  {
    std::lock_guard<std::mutex> lk(lease->mu);
    lease->driving = false;
    final_state = lease->exec;
  }
  lease->cv.notify_all();
  if (!final_state.terminal()) return;
  wal_->forget(final_state.execution_id);

  switch (final_state.status) {
    case ExecutionStatus::completed:
      emit(CoreEventKind::execution_completed, final_state);
      break;
    case ExecutionStatus::compensated:
      emit(CoreEventKind::execution_compensated, final_state, "", final_state.error_code);
      break;
    default:
      emit(CoreEventKind::execution_failed, final_state, "", final_state.error_code);
      break;
  }
  log_event(LogLevel::info, "saga",
            final_state.execution_id + " " + to_string(final_state.status) +
                (final_state.error.empty() ? "" : ": " + final_state.error));
  leases_.release(final_state.execution_id);
}

}  // namespace keystone
