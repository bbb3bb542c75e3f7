#pragma once

// keystone/observability.hpp — Logging, counters and core event stream.
//
// DESIGN:
//   CoreEvent is the observable unit. Admissions, step completions, timeouts,
//   retries and terminal execution transitions each emit one CoreEvent, which
//   is counted in the global CoreStats and, when KEYSTONE_EVENT_LOG is set,
//   appended as one JSON line to that file.
//
//   log_event() is the human-facing channel: "[keystone:<component>] message"
//   on stderr, filtered by KEYSTONE_LOG_LEVEL (debug|info|warn|error).
//
// INVARIANT:
//   Emission never blocks execution on I/O failure and never throws.
//   Events carry ids and error codes only; step inputs and outputs are never
//   written to the event stream.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "keystone/types.hpp"

namespace keystone {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
enum class LogLevel : uint8_t { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel l);
std::optional<LogLevel> log_level_from_string(const std::string& s);

// Threshold defaults to KEYSTONE_LOG_LEVEL, or warn.
LogLevel log_threshold();
void set_log_threshold(LogLevel level);

void log_event(LogLevel level, std::string_view component, const std::string& message);

// ---------------------------------------------------------------------------
// CoreEvent
// ---------------------------------------------------------------------------
enum class CoreEventKind {
  intent_admitted,
  intent_replayed,
  intent_rejected,
  step_completed,
  step_failed,
  step_timeout,
  step_retried,
  execution_completed,
  execution_failed,
  execution_compensated,
  execution_recovered,
  state_corruption,
  infra_retry,
  version_conflict,
  contract_expired,
};

std::string to_string(CoreEventKind k);

struct CoreEvent {
  CoreEventKind kind{CoreEventKind::intent_admitted};
  std::string   tenant_id;
  std::string   execution_id;
  std::string   step_id;
  ErrorCode     error_code{ErrorCode::none};
  uint64_t      duration_ns{0};
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0].
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// CoreStats — process-wide counters
// ---------------------------------------------------------------------------
class CoreStats {
 public:
  void record(const CoreEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> intents_admitted{0};
  alignas(64) std::atomic<uint64_t> intents_replayed{0};
  alignas(64) std::atomic<uint64_t> intents_rejected{0};

  alignas(64) std::atomic<uint64_t> steps_completed{0};
  alignas(64) std::atomic<uint64_t> steps_failed{0};
  alignas(64) std::atomic<uint64_t> step_timeouts{0};
  alignas(64) std::atomic<uint64_t> step_retries{0};
  // Handler threads still running; abandoned ones are counted until they exit.
  alignas(64) std::atomic<uint64_t> handlers_in_flight{0};
  alignas(64) std::atomic<uint64_t> handlers_abandoned{0};

  alignas(64) std::atomic<uint64_t> executions_completed{0};
  alignas(64) std::atomic<uint64_t> executions_failed{0};
  alignas(64) std::atomic<uint64_t> executions_compensated{0};
  alignas(64) std::atomic<uint64_t> executions_recovered{0};
  alignas(64) std::atomic<uint64_t> state_corruptions{0};

  alignas(64) std::atomic<uint64_t> infra_retries{0};
  alignas(64) std::atomic<uint64_t> version_conflicts{0};
  alignas(64) std::atomic<uint64_t> contracts_expired{0};

  // Step handler latency.
  LatencyHistogram step_latency;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<CoreEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<CoreEvent> ring_buffer_;
  size_t ring_head_{0};
};

CoreStats& global_core_stats();

// Records into global_core_stats() and appends to KEYSTONE_EVENT_LOG if set.
void emit_core_event(const CoreEvent& ev);

std::string core_event_to_json(const CoreEvent& ev);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace keystone
