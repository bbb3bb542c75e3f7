#pragma once

// keystone/wal.hpp — Per-execution write-ahead log.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: events are never modified or deleted. Corrections are new
//      events (STEP_COMPENSATING, EXECUTION_FAILED, ...).
//   2. SEQUENTIAL: sequence_no starts at 1 per execution and increments by
//      exactly 1. It is the sole ordering authority; recorded_at is
//      informational.
//   3. CHAINED: digest = BLAKE3("wal:" || prev_digest || canonical event
//      without digest). The first event chains from zero_digest(). replay()
//      verifies the whole chain and reports state_corruption on any break.
//   4. DURABLE-BEFORE-ACK: append() returns only after the store accepted the
//      line (fflush, and fsync when configured).
//   5. TENANT-PINNED: every event of one execution carries the same
//      tenant_id; an append under a different tenant is rejected.
//
// EXTENSION_POINT: remote_wal
//   A log service (Kafka topic per tenant, an immutable ledger) implements
//   IWalStore. BackendStatus::unavailable is retried by WriteAheadLog.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "keystone/clock.hpp"
#include "keystone/config.hpp"
#include "keystone/state_backend.hpp"
#include "keystone/types.hpp"

namespace keystone {

enum class WalEventType {
  execution_started,
  execution_running,
  step_started,
  step_completed,
  step_failed,
  step_compensating,
  step_compensated,
  cancel_requested,
  execution_completed,
  execution_failed,
  execution_compensated,
};

// Wire names: "EXECUTION_STARTED", "STEP_COMPLETED", ...
std::string to_string(WalEventType t);
std::optional<WalEventType> wal_event_type_from_string(const std::string& s);

struct WalEvent {
  std::string      event_id;
  std::string      execution_id;
  std::string      tenant_id;
  std::string      session_id;
  uint64_t         sequence_no{0};
  WalEventType     type{WalEventType::execution_started};
  jsonlite::Object payload;
  uint64_t         recorded_at_ms{0};
  std::string      prev_digest;
  std::string      digest;
};

// Canonical text the digest covers: every field except digest.
std::string wal_event_canonical(const WalEvent& e);
jsonlite::Object wal_event_to_json(const WalEvent& e);
bool wal_event_from_json(const jsonlite::Object& o, WalEvent* out);

struct ExecutionRef {
  std::string execution_id;
  std::string tenant_id;
  std::string session_id;
};

// ---------------------------------------------------------------------------
// IWalStore — raw line storage, one stream per execution
// ---------------------------------------------------------------------------
class IWalStore {
 public:
  virtual ~IWalStore() = default;

  // Appends one line (no trailing newline) to the execution's stream.
  virtual BackendStatus append(const std::string& execution_id, const std::string& line) = 0;

  // All lines of the stream in append order. not_found if the stream does
  // not exist.
  virtual BackendStatus read(const std::string& execution_id,
                             std::vector<std::string>* lines) const = 0;

  virtual std::vector<std::string> execution_ids() const = 0;
  virtual std::string store_id() const = 0;
};

class MemoryWalStore : public IWalStore {
 public:
  BackendStatus append(const std::string& execution_id, const std::string& line) override;
  BackendStatus read(const std::string& execution_id,
                     std::vector<std::string>* lines) const override;
  std::vector<std::string> execution_ids() const override;
  std::string store_id() const override { return "memory"; }

  // Test hook: overwrite one stored line in place to simulate tampering.
  bool tamper(const std::string& execution_id, size_t index, const std::string& line);

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<std::string>> streams_;
};

// Layout: <root>/wal/AB/<execution_id>.ndjson, AB = blake3(execution_id)[0:2].
// A torn final line (crash mid-append, no trailing newline) was never
// acknowledged; read() truncates it away and logs a warning.
class FileWalStore : public IWalStore {
 public:
  FileWalStore(std::string root, bool fsync_each_append);

  BackendStatus append(const std::string& execution_id, const std::string& line) override;
  BackendStatus read(const std::string& execution_id,
                     std::vector<std::string>* lines) const override;
  std::vector<std::string> execution_ids() const override;
  std::string store_id() const override { return "local_fs"; }

  std::string stream_path(const std::string& execution_id) const;

 private:
  std::mutex& stream_lock(const std::string& execution_id) const;

  std::string root_;
  bool fsync_;
  mutable std::array<std::mutex, 32> locks_;
};

// ---------------------------------------------------------------------------
// WriteAheadLog
// ---------------------------------------------------------------------------
class WriteAheadLog {
 public:
  WriteAheadLog(std::shared_ptr<IWalStore> store, RetryPolicy retry,
                std::shared_ptr<Clock> clock = system_clock());

  // Assigns the next sequence_no and chain digest atomically for the stream
  // and returns the event once stored. Failure modes: validation_error (bad
  // ref or tenant mismatch), transient_infra (store unavailable after
  // retries), state_corruption (existing stream fails verification).
  std::optional<WalEvent> append(const ExecutionRef& ref, WalEventType type,
                                 jsonlite::Object payload, Error* err);

  // Every event of the execution in sequence order, chain verified.
  std::optional<std::vector<WalEvent>> replay(const std::string& execution_id, Error* err) const;

  // One canonical JSON event per line, newline-terminated.
  std::optional<std::string> export_ndjson(const std::string& execution_id, Error* err) const;

  // Tenant-partitioned audit query. type nullopt = every type; limit 0 =
  // unbounded. Streams that fail verification are skipped and logged.
  std::vector<WalEvent> get_events(const std::string& tenant_id,
                                   std::optional<WalEventType> type, size_t limit) const;

  // Events of every execution in the session, grouped by execution in
  // order of first event.
  std::vector<WalEvent> replay_session(const std::string& tenant_id,
                                       const std::string& session_id) const;

  std::vector<std::string> execution_ids() const { return store_->execution_ids(); }

  // Identity of a stream taken from its first line without chain
  // verification. Used to attribute a stream that replay() rejects.
  std::optional<ExecutionRef> stream_ref(const std::string& execution_id) const;

  // Drops the cached stream tail so the next append re-reads the store.
  void forget(const std::string& execution_id);
  size_t cached_tails() const;

  std::string store_id() const { return store_->store_id(); }

 private:
  struct Tail {
    uint64_t    next_seq{1};
    std::string last_digest;
    std::string tenant_id;
  };

  std::mutex& stream_lock(const std::string& execution_id);

  std::shared_ptr<IWalStore> store_;
  RetryPolicy retry_;
  std::shared_ptr<Clock> clock_;
  std::array<std::mutex, 64> stream_locks_;
  mutable std::mutex tails_mu_;
  std::map<std::string, Tail> tails_;
};

// ---------------------------------------------------------------------------
// Fold — deterministic reconstruction of the Execution snapshot
// ---------------------------------------------------------------------------
// apply_wal_event() is the single transition function: the coordinator applies
// each event it appends through it, and fold() applies a replayed stream
// through it, so the live snapshot and the replayed one cannot diverge.
// An event that is impossible from the current state is state_corruption.
bool apply_wal_event(Execution* exec, const WalEvent& ev, Error* err);

std::optional<Execution> fold(const std::vector<WalEvent>& events, Error* err);

}  // namespace keystone
