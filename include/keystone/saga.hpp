#pragma once

// keystone/saga.hpp — Saga Coordinator.
//
// STATE MACHINE:
//   Execution: pending → running → completed | failed | compensated
//   SagaStep:  pending → running → completed | failed
//              completed → compensating → compensated   (on saga failure)
//
// DESIGN INVARIANTS (must not be broken):
//   1. WAL FIRST: every transition is appended to the WAL, then applied to the
//      in-memory execution through apply_wal_event(), then written as the
//      State Surface snapshot. A snapshot therefore always equals the fold of
//      the WAL prefix ending at its last_sequence_no.
//   2. LEASED: all appends for one execution happen under its lease
//      (ExecutionLeaseTable). Handlers run outside the lease.
//   3. REVERSE COMPENSATION: completed steps are compensated in reverse order
//      of their STEP_COMPLETED sequence numbers.
//   4. ABANDON, NEVER INTERRUPT: a handler that exceeds its timeout is
//      recorded as failed(timeout) and left to finish on its own thread; its
//      late result is discarded.
//   5. FROZEN ON CORRUPTION: an execution whose WAL fails verification or
//      folding is marked failed + corrupted in its snapshot and never driven
//      again. Nothing is repaired automatically.
//
// RESUME (recover):
//   A step found running (STEP_STARTED without a terminal event) is
//   re-invoked exactly once when declared idempotent; otherwise it is
//   recorded failed("interrupted") and compensation follows. A step found
//   compensating has its compensation re-run.
//
// COMPENSATION OUTCOME:
//   compensated when at least one completed step was compensated; failed when
//   nothing had completed. A compensation handler that fails leaves its step
//   compensating and ends the execution failed; the remaining steps are still
//   compensated.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "keystone/capability.hpp"
#include "keystone/state_surface.hpp"
#include "keystone/types.hpp"
#include "keystone/wal.hpp"
#include "keystone/worker.hpp"

namespace keystone {

// ---------------------------------------------------------------------------
// ExecutionLeaseTable — one lease per live execution
// ---------------------------------------------------------------------------
class ExecutionLeaseTable {
 public:
  struct Lease {
    std::mutex              mu;
    std::condition_variable cv;        // notified after every transition
    std::string             owner;     // worker holding mu; empty when free
    Execution               exec;      // authoritative while loaded
    bool                    loaded{false};
    bool                    driving{false};
  };

  std::shared_ptr<Lease> acquire(const std::string& execution_id);
  std::shared_ptr<Lease> find(const std::string& execution_id) const;

  // Drops the entry when it is not being driven. Holders keep their pointer.
  void release(const std::string& execution_id);

  size_t size() const;

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Lease>> leases_;
};

struct SagaOptions {
  uint64_t    default_step_timeout_ms{30000};
  std::string worker_id;
  // Handler threads alive at once, abandoned ones included.
  uint32_t    max_handler_threads{256};
};

struct RecoveryReport {
  uint64_t scanned{0};
  uint64_t already_terminal{0};
  uint64_t resumed{0};
  uint64_t corrupted{0};
  uint64_t errors{0};

  std::string to_json() const;
};

class SagaCoordinator {
 public:
  SagaCoordinator(std::shared_ptr<WriteAheadLog> wal, std::shared_ptr<StateSurface> state,
                  std::shared_ptr<const CapabilityRouter> router,
                  std::shared_ptr<WorkerPool> pool, SagaOptions options);

  // Appends EXECUTION_STARTED, writes the pending snapshot, and schedules the
  // execution on the worker pool. Returns the pending execution.
  std::optional<Execution> start(const Intent& intent, const ExecutionContext& context,
                                 const std::string& execution_id, Error* err);

  // Latest snapshot. not_found for unknown ids and for ids of other tenants.
  std::optional<Execution> status(const std::string& execution_id, const std::string& tenant_id,
                                  Error* err) const;

  // Records CANCEL_REQUESTED; the driver checks it before the next dispatch
  // and compensates. Cancelling a terminal execution returns it unchanged.
  std::optional<Execution> cancel(const std::string& execution_id, const std::string& tenant_id,
                                  Error* err);

  // Blocks until terminal or timeout, then returns the latest snapshot.
  std::optional<Execution> wait(const std::string& execution_id, const std::string& tenant_id,
                                std::chrono::milliseconds timeout, Error* err);

  // Replays the WAL and drives the execution to a terminal state on the
  // calling thread.
  std::optional<Execution> recover(const std::string& execution_id, Error* err);

  // recover() for every non-terminal execution found in the WAL.
  RecoveryReport recover_all();

  const ExecutionLeaseTable& leases() const { return leases_; }
  uint32_t live_handlers() const { return live_handlers_->load(); }

 private:
  using LeasePtr = std::shared_ptr<ExecutionLeaseTable::Lease>;

  struct StepOutcome {
    bool        recorded{false};   // false = WAL unavailable, drive aborted
    bool        ok{false};
  };

  bool transition(ExecutionLeaseTable::Lease& lease, WalEventType type, jsonlite::Object payload,
                  Error* err);
  bool transition_locked(ExecutionLeaseTable::Lease& lease, WalEventType type,
                         jsonlite::Object payload, Error* err);
  void write_snapshot(const Execution& exec);
  void freeze(ExecutionLeaseTable::Lease& lease, const std::string& why);
  void freeze_unloaded(const std::string& execution_id, const std::string& why);

  void schedule(const LeasePtr& lease);
  void drive(const LeasePtr& lease);
  bool drive_steps(const LeasePtr& lease, const Capability& cap);
  bool run_stage(const LeasePtr& lease, const Capability& cap, uint32_t stage);
  StepOutcome run_step(const LeasePtr& lease, const StepSpec& spec, const std::string& step_id,
                       bool resume_running);
  bool compensate(const LeasePtr& lease, const Capability& cap);
  void finish_drive(const LeasePtr& lease);

  Execution snapshot_of(ExecutionLeaseTable::Lease& lease);
  uint64_t timeout_for(const StepSpec& spec) const;

  std::shared_ptr<WriteAheadLog> wal_;
  std::shared_ptr<StateSurface> state_;
  std::shared_ptr<const CapabilityRouter> router_;
  std::shared_ptr<WorkerPool> pool_;
  SagaOptions options_;
  ExecutionLeaseTable leases_;
  // Shared with handler threads, which may outlive the coordinator.
  std::shared_ptr<std::atomic<uint32_t>> live_handlers_ =
      std::make_shared<std::atomic<uint32_t>>(0);
};

}  // namespace keystone
