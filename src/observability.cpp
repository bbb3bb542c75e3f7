#include "keystone/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

namespace keystone {

namespace {

inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

LogLevel initial_threshold() {
  const char* env = std::getenv("KEYSTONE_LOG_LEVEL");
  if (env && env[0]) {
    if (auto l = log_level_from_string(env)) return *l;
  }
  return LogLevel::warn;
}

std::atomic<uint8_t>& threshold_storage() {
  static std::atomic<uint8_t> t{static_cast<uint8_t>(initial_threshold())};
  return t;
}

std::mutex g_log_mu;

}  // namespace

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

std::string to_string(LogLevel l) {
  switch (l) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
  }
  return "error";
}

std::optional<LogLevel> log_level_from_string(const std::string& s) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warn" || s == "warning") return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return std::nullopt;
}

LogLevel log_threshold() {
  return static_cast<LogLevel>(threshold_storage().load(std::memory_order_relaxed));
}

void set_log_threshold(LogLevel level) {
  threshold_storage().store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

void log_event(LogLevel level, std::string_view component, const std::string& message) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(log_threshold())) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::fprintf(stderr, "[keystone:%.*s] %s: %s\n",
               static_cast<int>(component.size()), component.data(),
               to_string(level).c_str(), message.c_str());
}

// ---------------------------------------------------------------------------
// CoreEvent
// ---------------------------------------------------------------------------

std::string to_string(CoreEventKind k) {
  switch (k) {
    case CoreEventKind::intent_admitted:       return "intent_admitted";
    case CoreEventKind::intent_replayed:       return "intent_replayed";
    case CoreEventKind::intent_rejected:       return "intent_rejected";
    case CoreEventKind::step_completed:        return "step_completed";
    case CoreEventKind::step_failed:           return "step_failed";
    case CoreEventKind::step_timeout:          return "step_timeout";
    case CoreEventKind::step_retried:          return "step_retried";
    case CoreEventKind::execution_completed:   return "execution_completed";
    case CoreEventKind::execution_failed:      return "execution_failed";
    case CoreEventKind::execution_compensated: return "execution_compensated";
    case CoreEventKind::execution_recovered:   return "execution_recovered";
    case CoreEventKind::state_corruption:      return "state_corruption";
    case CoreEventKind::infra_retry:           return "infra_retry";
    case CoreEventKind::version_conflict:      return "version_conflict";
    case CoreEventKind::contract_expired:      return "contract_expired";
  }
  return "unknown";
}

std::string core_event_to_json(const CoreEvent& ev) {
  jsonlite::Object o;
  o["kind"] = jsonlite::make_string(to_string(ev.kind));
  if (!ev.tenant_id.empty()) o["tenant_id"] = jsonlite::make_string(ev.tenant_id);
  if (!ev.execution_id.empty()) o["execution_id"] = jsonlite::make_string(ev.execution_id);
  if (!ev.step_id.empty()) o["step_id"] = jsonlite::make_string(ev.step_id);
  if (ev.error_code != ErrorCode::none) o["error_code"] = jsonlite::make_string(to_string(ev.error_code));
  if (ev.duration_ns) o["duration_ns"] = jsonlite::make_u64(ev.duration_ns);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) counts[i] = buckets_[i].load(std::memory_order_relaxed);

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.50) / 1000.0);
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.95) / 1000.0);
  out += buf;
  out += ",\"p99_ms\":";
  std::snprintf(buf, sizeof(buf), "%.3f", percentile(0.99) / 1000.0);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// CoreStats
// ---------------------------------------------------------------------------

void CoreStats::record(const CoreEvent& ev) {
  switch (ev.kind) {
    case CoreEventKind::intent_admitted:       intents_admitted.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::intent_replayed:       intents_replayed.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::intent_rejected:       intents_rejected.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::step_completed:
      steps_completed.fetch_add(1, std::memory_order_relaxed);
      step_latency.record(ev.duration_ns);
      break;
    case CoreEventKind::step_failed:
      steps_failed.fetch_add(1, std::memory_order_relaxed);
      step_latency.record(ev.duration_ns);
      break;
    case CoreEventKind::step_timeout:          step_timeouts.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::step_retried:          step_retries.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::execution_completed:   executions_completed.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::execution_failed:      executions_failed.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::execution_compensated: executions_compensated.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::execution_recovered:   executions_recovered.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::state_corruption:      state_corruptions.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::infra_retry:           infra_retries.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::version_conflict:      version_conflicts.fetch_add(1, std::memory_order_relaxed); break;
    case CoreEventKind::contract_expired:      contracts_expired.fetch_add(1, std::memory_order_relaxed); break;
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<CoreEvent> CoreStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  // Oldest first.
  std::vector<CoreEvent> out;
  out.reserve(ring_buffer_.size());
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string CoreStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) { return std::to_string(a.load(std::memory_order_relaxed)); };
  std::string out;
  out.reserve(768);
  out += "{\"intents\":{\"admitted\":" + n(intents_admitted);
  out += ",\"replayed\":" + n(intents_replayed);
  out += ",\"rejected\":" + n(intents_rejected) + "}";
  out += ",\"steps\":{\"completed\":" + n(steps_completed);
  out += ",\"failed\":" + n(steps_failed);
  out += ",\"timeouts\":" + n(step_timeouts);
  out += ",\"retries\":" + n(step_retries);
  out += ",\"handlers_in_flight\":" + n(handlers_in_flight);
  out += ",\"handlers_abandoned\":" + n(handlers_abandoned);
  out += ",\"latency\":" + step_latency.to_json() + "}";
  out += ",\"executions\":{\"completed\":" + n(executions_completed);
  out += ",\"failed\":" + n(executions_failed);
  out += ",\"compensated\":" + n(executions_compensated);
  out += ",\"recovered\":" + n(executions_recovered);
  out += ",\"state_corruptions\":" + n(state_corruptions) + "}";
  out += ",\"infra\":{\"retries\":" + n(infra_retries);
  out += ",\"version_conflicts\":" + n(version_conflicts) + "}";
  out += ",\"contracts\":{\"expired\":" + n(contracts_expired) + "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

CoreStats& global_core_stats() {
  static CoreStats inst;
  return inst;
}

void emit_core_event(const CoreEvent& ev) {
  global_core_stats().record(ev);

  // Activation: KEYSTONE_EVENT_LOG=/path/to/events.jsonl
  const char* log_path = std::getenv("KEYSTONE_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = core_event_to_json(ev) + "\n";
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace keystone
