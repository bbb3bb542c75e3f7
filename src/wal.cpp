#include "keystone/wal.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#if !defined(_WIN32)
#include <unistd.h>
#endif

#include "keystone/hash.hpp"
#include "keystone/observability.hpp"
#include "keystone/version.hpp"

namespace fs = std::filesystem;

namespace keystone {

using jsonlite::make_object;
using jsonlite::make_string;
using jsonlite::make_u64;

// ---------------------------------------------------------------------------
// Event types
// ---------------------------------------------------------------------------

namespace {

struct WalEventTypeName {
  WalEventType type;
  const char*  name;
};

constexpr WalEventTypeName kWalEventTypeNames[] = {
  { WalEventType::execution_started,     "EXECUTION_STARTED" },
  { WalEventType::execution_running,     "EXECUTION_RUNNING" },
  { WalEventType::step_started,          "STEP_STARTED" },
  { WalEventType::step_completed,        "STEP_COMPLETED" },
  { WalEventType::step_failed,           "STEP_FAILED" },
  { WalEventType::step_compensating,     "STEP_COMPENSATING" },
  { WalEventType::step_compensated,      "STEP_COMPENSATED" },
  { WalEventType::cancel_requested,      "CANCEL_REQUESTED" },
  { WalEventType::execution_completed,   "EXECUTION_COMPLETED" },
  { WalEventType::execution_failed,      "EXECUTION_FAILED" },
  { WalEventType::execution_compensated, "EXECUTION_COMPENSATED" },
};

uint32_t stream_hash(const std::string& s) {
  uint32_t h = 2166136261u;
  for (unsigned char c : s) {
    h ^= c;
    h *= 16777619u;
  }
  return h;
}

}  // namespace

std::string to_string(WalEventType t) {
  for (const auto& row : kWalEventTypeNames) {
    if (row.type == t) return row.name;
  }
  return "UNKNOWN";
}

std::optional<WalEventType> wal_event_type_from_string(const std::string& s) {
  for (const auto& row : kWalEventTypeNames) {
    if (s == row.name) return row.type;
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

jsonlite::Object wal_event_to_json(const WalEvent& e) {
  jsonlite::Object o;
  o["event_id"] = make_string(e.event_id);
  o["execution_id"] = make_string(e.execution_id);
  o["tenant_id"] = make_string(e.tenant_id);
  o["session_id"] = make_string(e.session_id);
  o["sequence_no"] = make_u64(e.sequence_no);
  o["type"] = make_string(to_string(e.type));
  o["payload"] = make_object(e.payload);
  o["recorded_at"] = make_u64(e.recorded_at_ms);
  o["prev_digest"] = make_string(e.prev_digest);
  o["digest"] = make_string(e.digest);
  return o;
}

std::string wal_event_canonical(const WalEvent& e) {
  auto o = wal_event_to_json(e);
  o.erase("digest");
  return jsonlite::to_json(o);
}

bool wal_event_from_json(const jsonlite::Object& o, WalEvent* out) {
  using namespace jsonlite;
  auto type = wal_event_type_from_string(get_string(o, "type"));
  if (!type) return false;
  WalEvent e;
  e.event_id = get_string(o, "event_id");
  e.execution_id = get_string(o, "execution_id");
  e.tenant_id = get_string(o, "tenant_id");
  e.session_id = get_string(o, "session_id");
  e.sequence_no = get_u64(o, "sequence_no");
  e.type = *type;
  e.payload = get_object(o, "payload");
  e.recorded_at_ms = get_u64(o, "recorded_at");
  e.prev_digest = get_string(o, "prev_digest");
  e.digest = get_string(o, "digest");
  if (e.event_id.empty() || e.execution_id.empty() || e.tenant_id.empty() || e.sequence_no == 0) {
    return false;
  }
  *out = std::move(e);
  return true;
}

// ---------------------------------------------------------------------------
// MemoryWalStore
// ---------------------------------------------------------------------------

BackendStatus MemoryWalStore::append(const std::string& execution_id, const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  streams_[execution_id].push_back(line);
  return BackendStatus::ok;
}

BackendStatus MemoryWalStore::read(const std::string& execution_id,
                                   std::vector<std::string>* lines) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = streams_.find(execution_id);
  if (it == streams_.end()) return BackendStatus::not_found;
  if (lines) *lines = it->second;
  return BackendStatus::ok;
}

std::vector<std::string> MemoryWalStore::execution_ids() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> ids;
  ids.reserve(streams_.size());
  for (const auto& [id, _] : streams_) ids.push_back(id);
  return ids;
}

bool MemoryWalStore::tamper(const std::string& execution_id, size_t index,
                            const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = streams_.find(execution_id);
  if (it == streams_.end() || index >= it->second.size()) return false;
  it->second[index] = line;
  return true;
}

// ---------------------------------------------------------------------------
// FileWalStore
// ---------------------------------------------------------------------------

FileWalStore::FileWalStore(std::string root, bool fsync_each_append)
    : root_(std::move(root)), fsync_(fsync_each_append) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "wal", ec);
  if (ec) log_event(LogLevel::error, "wal", "cannot create " + root_ + "/wal: " + ec.message());
}

std::string FileWalStore::stream_path(const std::string& execution_id) const {
  return (fs::path(root_) / "wal" / blake3_hex(execution_id).substr(0, 2) /
          (execution_id + ".ndjson"))
      .string();
}

std::mutex& FileWalStore::stream_lock(const std::string& execution_id) const {
  return locks_[stream_hash(execution_id) % locks_.size()];
}

BackendStatus FileWalStore::append(const std::string& execution_id, const std::string& line) {
  const std::string path = stream_path(execution_id);
  std::lock_guard<std::mutex> lk(stream_lock(execution_id));

  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) return BackendStatus::unavailable;

  FILE* f = std::fopen(path.c_str(), "ab");
  if (!f) return BackendStatus::unavailable;

  std::fseek(f, 0, SEEK_END);
  const long pre_write_pos = std::ftell(f);
  const std::string framed = line + "\n";
  const bool written = std::fwrite(framed.data(), 1, framed.size(), f) == framed.size();
  bool flushed = std::fflush(f) == 0;
#if !defined(_WIN32)
  if (flushed && fsync_) flushed = ::fsync(fileno(f)) == 0;
#endif
  const long post_write_pos = std::ftell(f);
  std::fclose(f);

  if (!written || !flushed) return BackendStatus::unavailable;
  // The file must have grown by exactly the framed line.
  if (pre_write_pos >= 0 && post_write_pos >= 0 &&
      post_write_pos < pre_write_pos + static_cast<long>(framed.size())) {
    return BackendStatus::unavailable;
  }
  return BackendStatus::ok;
}

BackendStatus FileWalStore::read(const std::string& execution_id,
                                 std::vector<std::string>* lines) const {
  const std::string path = stream_path(execution_id);
  std::lock_guard<std::mutex> lk(stream_lock(execution_id));

  std::error_code ec;
  if (!fs::exists(path, ec)) return ec ? BackendStatus::unavailable : BackendStatus::not_found;

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return BackendStatus::unavailable;
  std::ostringstream buf;
  buf << ifs.rdbuf();
  const std::string data = buf.str();
  ifs.close();

  size_t complete = data.rfind('\n');
  complete = (complete == std::string::npos) ? 0 : complete + 1;
  if (complete < data.size()) {
    log_event(LogLevel::warn, "wal",
              "truncating torn tail of " + execution_id + " (" +
                  std::to_string(data.size() - complete) + " bytes)");
    fs::resize_file(path, complete, ec);
    if (ec) return BackendStatus::unavailable;
  }

  std::vector<std::string> out;
  size_t start = 0;
  while (start < complete) {
    const size_t nl = data.find('\n', start);
    out.push_back(data.substr(start, nl - start));
    start = nl + 1;
  }
  if (lines) *lines = std::move(out);
  return BackendStatus::ok;
}

std::vector<std::string> FileWalStore::execution_ids() const {
  std::vector<std::string> ids;
  std::error_code ec;
  const fs::path base = fs::path(root_) / "wal";
  for (auto it = fs::recursive_directory_iterator(base, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file() || it->path().extension() != ".ndjson") continue;
    ids.push_back(it->path().stem().string());
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

// ---------------------------------------------------------------------------
// WriteAheadLog
// ---------------------------------------------------------------------------

WriteAheadLog::WriteAheadLog(std::shared_ptr<IWalStore> store, RetryPolicy retry,
                             std::shared_ptr<Clock> clock)
    : store_(std::move(store)), retry_(retry), clock_(std::move(clock)) {}

std::mutex& WriteAheadLog::stream_lock(const std::string& execution_id) {
  return stream_locks_[stream_hash(execution_id) % stream_locks_.size()];
}

void WriteAheadLog::forget(const std::string& execution_id) {
  std::lock_guard<std::mutex> lk(tails_mu_);
  tails_.erase(execution_id);
}

size_t WriteAheadLog::cached_tails() const {
  std::lock_guard<std::mutex> lk(tails_mu_);
  return tails_.size();
}

std::optional<WalEvent> WriteAheadLog::append(const ExecutionRef& ref, WalEventType type,
                                              jsonlite::Object payload, Error* err) {
  if (ref.execution_id.empty() || ref.tenant_id.empty()) {
    fail(err, ErrorCode::validation_error, "WAL append requires execution_id and tenant_id");
    return std::nullopt;
  }

  std::lock_guard<std::mutex> stream_lk(stream_lock(ref.execution_id));

  std::optional<Tail> tail;
  {
    std::lock_guard<std::mutex> lk(tails_mu_);
    auto it = tails_.find(ref.execution_id);
    if (it != tails_.end()) tail = it->second;
  }
  if (!tail) {
    // Cold stream: derive the tail from what is already stored.
    Error rerr;
    auto existing = replay(ref.execution_id, &rerr);
    Tail t;
    t.last_digest = zero_digest();
    t.tenant_id = ref.tenant_id;
    if (existing) {
      if (!existing->empty()) {
        t.next_seq = existing->back().sequence_no + 1;
        t.last_digest = existing->back().digest;
        t.tenant_id = existing->front().tenant_id;
      }
    } else if (rerr.code != ErrorCode::not_found) {
      if (err) *err = rerr;
      return std::nullopt;
    }
    tail = t;
  }

  if (tail->tenant_id != ref.tenant_id) {
    fail(err, ErrorCode::validation_error,
         "WAL stream " + ref.execution_id + " belongs to another tenant");
    return std::nullopt;
  }

  WalEvent ev;
  ev.event_id = generate_id("evt");
  ev.execution_id = ref.execution_id;
  ev.tenant_id = ref.tenant_id;
  ev.session_id = ref.session_id;
  ev.sequence_no = tail->next_seq;
  ev.type = type;
  ev.payload = std::move(payload);
  ev.recorded_at_ms = clock_->now_unix_ms();
  ev.prev_digest = tail->last_digest;
  ev.digest = wal_chain_digest(ev.prev_digest, wal_event_canonical(ev));

  const std::string line = jsonlite::to_json(wal_event_to_json(ev));
  BackendStatus st = store_->append(ev.execution_id, line);
  for (uint32_t attempt = 0; st == BackendStatus::unavailable && attempt < retry_.max_retries;
       ++attempt) {
    CoreEvent ce;
    ce.kind = CoreEventKind::infra_retry;
    ce.tenant_id = ev.tenant_id;
    ce.execution_id = ev.execution_id;
    ce.error_code = ErrorCode::transient_infra;
    emit_core_event(ce);
    std::this_thread::sleep_for(std::chrono::milliseconds(retry_.delay_ms(attempt)));
    st = store_->append(ev.execution_id, line);
  }
  if (st != BackendStatus::ok) {
    // The stored tail is unknown after a failed append; re-derive it next time.
    forget(ev.execution_id);
    fail(err, ErrorCode::transient_infra,
         "WAL append failed for " + ev.execution_id + ": " + to_string(st));
    return std::nullopt;
  }

  {
    std::lock_guard<std::mutex> lk(tails_mu_);
    tails_[ev.execution_id] = Tail{ev.sequence_no + 1, ev.digest, ev.tenant_id};
  }
  log_event(LogLevel::debug, "wal",
            ev.execution_id + " #" + std::to_string(ev.sequence_no) + " " + to_string(type));
  return ev;
}

std::optional<std::vector<WalEvent>> WriteAheadLog::replay(const std::string& execution_id,
                                                           Error* err) const {
  std::vector<std::string> lines;
  BackendStatus st = store_->read(execution_id, &lines);
  for (uint32_t attempt = 0; st == BackendStatus::unavailable && attempt < retry_.max_retries;
       ++attempt) {
    std::this_thread::sleep_for(std::chrono::milliseconds(retry_.delay_ms(attempt)));
    st = store_->read(execution_id, &lines);
  }
  if (st == BackendStatus::not_found) {
    fail(err, ErrorCode::not_found, "no WAL stream for " + execution_id);
    return std::nullopt;
  }
  if (st != BackendStatus::ok) {
    fail(err, ErrorCode::transient_infra, "WAL read failed for " + execution_id);
    return std::nullopt;
  }

  auto corrupt = [&](const std::string& why) -> std::optional<std::vector<WalEvent>> {
    CoreEvent ce;
    ce.kind = CoreEventKind::state_corruption;
    ce.execution_id = execution_id;
    ce.error_code = ErrorCode::state_corruption;
    emit_core_event(ce);
    log_event(LogLevel::error, "wal", execution_id + ": " + why);
    fail(err, ErrorCode::state_corruption, "WAL " + execution_id + ": " + why);
    return std::nullopt;
  };

  std::vector<WalEvent> events;
  events.reserve(lines.size());
  std::string prev = zero_digest();
  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string at = "event " + std::to_string(i + 1);
    std::optional<jsonlite::JsonError> perr;
    auto obj = jsonlite::parse(lines[i], &perr);
    if (perr) return corrupt(at + " unparseable (" + perr->code + ")");
    WalEvent ev;
    if (!wal_event_from_json(obj, &ev)) return corrupt(at + " malformed");
    if (ev.execution_id != execution_id) return corrupt(at + " belongs to another execution");
    if (ev.sequence_no != i + 1) return corrupt(at + " has sequence_no " + std::to_string(ev.sequence_no));
    if (!events.empty() && ev.tenant_id != events.front().tenant_id) {
      return corrupt(at + " changes tenant");
    }
    if (ev.prev_digest != prev) return corrupt(at + " breaks the digest chain");
    if (wal_chain_digest(ev.prev_digest, wal_event_canonical(ev)) != ev.digest) {
      return corrupt(at + " digest mismatch");
    }
    prev = ev.digest;
    events.push_back(std::move(ev));
  }
  return events;
}

std::optional<std::string> WriteAheadLog::export_ndjson(const std::string& execution_id,
                                                        Error* err) const {
  auto events = replay(execution_id, err);
  if (!events) return std::nullopt;
  std::string out;
  for (const auto& ev : *events) {
    out += jsonlite::to_json(wal_event_to_json(ev));
    out += '\n';
  }
  return out;
}

std::optional<ExecutionRef> WriteAheadLog::stream_ref(const std::string& execution_id) const {
  std::vector<std::string> lines;
  if (store_->read(execution_id, &lines) != BackendStatus::ok || lines.empty()) return std::nullopt;
  std::optional<jsonlite::JsonError> perr;
  const auto obj = jsonlite::parse(lines.front(), &perr);
  if (perr) return std::nullopt;
  ExecutionRef ref{jsonlite::get_string(obj, "execution_id"), jsonlite::get_string(obj, "tenant_id"),
                   jsonlite::get_string(obj, "session_id")};
  if (ref.execution_id != execution_id || ref.tenant_id.empty()) return std::nullopt;
  return ref;
}

std::vector<WalEvent> WriteAheadLog::get_events(const std::string& tenant_id,
                                                std::optional<WalEventType> type,
                                                size_t limit) const {
  std::vector<WalEvent> out;
  for (const auto& id : store_->execution_ids()) {
    Error e;
    auto events = replay(id, &e);
    if (!events) {
      log_event(LogLevel::warn, "wal", "get_events skipping " + id + ": " + e.message);
      continue;
    }
    if (events->empty() || events->front().tenant_id != tenant_id) continue;
    for (auto& ev : *events) {
      if (type && ev.type != *type) continue;
      out.push_back(std::move(ev));
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const WalEvent& a, const WalEvent& b) {
    return a.recorded_at_ms < b.recorded_at_ms;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::vector<WalEvent> WriteAheadLog::replay_session(const std::string& tenant_id,
                                                    const std::string& session_id) const {
  std::vector<std::vector<WalEvent>> streams;
  for (const auto& id : store_->execution_ids()) {
    Error e;
    auto events = replay(id, &e);
    if (!events) {
      log_event(LogLevel::warn, "wal", "replay_session skipping " + id + ": " + e.message);
      continue;
    }
    if (events->empty()) continue;
    const auto& first = events->front();
    if (first.tenant_id != tenant_id || first.session_id != session_id) continue;
    streams.push_back(std::move(*events));
  }
  std::stable_sort(streams.begin(), streams.end(),
                   [](const std::vector<WalEvent>& a, const std::vector<WalEvent>& b) {
                     return a.front().recorded_at_ms < b.front().recorded_at_ms;
                   });
  std::vector<WalEvent> out;
  for (auto& s : streams) {
    for (auto& ev : s) out.push_back(std::move(ev));
  }
  return out;
}

// ---------------------------------------------------------------------------
// Fold
// ---------------------------------------------------------------------------

namespace {

bool corrupt_transition(Error* err, const Execution& exec, const WalEvent& ev,
                        const std::string& why) {
  return fail(err, ErrorCode::state_corruption,
              exec.execution_id + " #" + std::to_string(ev.sequence_no) + " " +
                  to_string(ev.type) + ": " + why);
}

ErrorCode payload_error_code(const jsonlite::Object& p) {
  return error_code_from_string(jsonlite::get_string(p, "error_code"))
      .value_or(ErrorCode::step_execution_error);
}

}  // namespace

bool apply_wal_event(Execution* exec, const WalEvent& ev, Error* err) {
  using namespace jsonlite;
  const auto& p = ev.payload;

  if (ev.sequence_no != exec->last_sequence_no + 1) {
    return corrupt_transition(err, *exec, ev, "out-of-order sequence_no");
  }
  if (ev.type != WalEventType::execution_started && exec->terminal()) {
    return corrupt_transition(err, *exec, ev, "event after terminal status");
  }

  auto step_for = [&](SagaStep** out) {
    *out = exec->find_step(get_string(p, "step_id"));
    return *out != nullptr;
  };
  SagaStep* step = nullptr;

  switch (ev.type) {
    case WalEventType::execution_started: {
      if (ev.sequence_no != 1) return corrupt_transition(err, *exec, ev, "start is not first");
      const auto compat = version::check_wal_format(static_cast<uint32_t>(get_u64(p, "wal_format")));
      if (!compat.ok) return corrupt_transition(err, *exec, ev, compat.description);
      Execution fresh;
      fresh.execution_id = ev.execution_id;
      fresh.tenant_id = ev.tenant_id;
      fresh.session_id = ev.session_id;
      fresh.intent_id = get_string(p, "intent_id");
      if (!intent_from_json(get_object(p, "intent"), &fresh.intent)) {
        return corrupt_transition(err, *exec, ev, "malformed intent");
      }
      fresh.context = context_from_json(get_object(p, "context"));
      fresh.status = ExecutionStatus::pending;
      fresh.started_at_ms = ev.recorded_at_ms;
      *exec = std::move(fresh);
      break;
    }
    case WalEventType::execution_running: {
      if (exec->status != ExecutionStatus::pending) {
        return corrupt_transition(err, *exec, ev, "not pending");
      }
      exec->realm_name = get_string(p, "realm");
      for (const auto& item : get_array(p, "steps")) {
        if (!is_object(item)) return corrupt_transition(err, *exec, ev, "malformed step list");
        const auto& so = std::get<Object>(item.v);
        SagaStep s;
        s.step_id = get_string(so, "step_id");
        s.execution_id = exec->execution_id;
        s.capability_name = get_string(so, "capability_name");
        s.stage = static_cast<uint32_t>(get_u64(so, "stage"));
        if (s.step_id.empty() || exec->find_step(s.step_id)) {
          return corrupt_transition(err, *exec, ev, "bad step id");
        }
        exec->steps.push_back(std::move(s));
      }
      exec->status = ExecutionStatus::running;
      break;
    }
    case WalEventType::step_started:
      if (exec->status != ExecutionStatus::running) return corrupt_transition(err, *exec, ev, "not running");
      if (!step_for(&step)) return corrupt_transition(err, *exec, ev, "unknown step");
      if (step->status != StepStatus::pending) return corrupt_transition(err, *exec, ev, "step not pending");
      step->status = StepStatus::running;
      step->attempt_count = static_cast<uint32_t>(get_u64(p, "attempt", step->attempt_count + 1));
      step->input = get_object(p, "input");
      break;
    case WalEventType::step_completed:
      if (!step_for(&step)) return corrupt_transition(err, *exec, ev, "unknown step");
      // Completion requires a preceding STEP_STARTED for the same step.
      if (step->status != StepStatus::running) return corrupt_transition(err, *exec, ev, "step not running");
      step->status = StepStatus::completed;
      step->output = get_object(p, "output");
      step->error_code = ErrorCode::none;
      step->error.clear();
      step->completed_seq = ev.sequence_no;
      break;
    case WalEventType::step_failed:
      if (!step_for(&step)) return corrupt_transition(err, *exec, ev, "unknown step");
      if (step->status == StepStatus::running) {
        step->status = get_bool(p, "will_retry") ? StepStatus::pending : StepStatus::failed;
      } else if (step->status != StepStatus::compensating) {
        // A failed compensation leaves the step compensating.
        return corrupt_transition(err, *exec, ev, "step not running or compensating");
      }
      step->error_code = payload_error_code(p);
      step->error = get_string(p, "error");
      break;
    case WalEventType::step_compensating:
      if (!step_for(&step)) return corrupt_transition(err, *exec, ev, "unknown step");
      if (step->status != StepStatus::completed) return corrupt_transition(err, *exec, ev, "step not completed");
      step->status = StepStatus::compensating;
      break;
    case WalEventType::step_compensated:
      if (!step_for(&step)) return corrupt_transition(err, *exec, ev, "unknown step");
      if (step->status != StepStatus::compensating) return corrupt_transition(err, *exec, ev, "step not compensating");
      step->status = StepStatus::compensated;
      step->error_code = ErrorCode::none;
      step->error.clear();
      break;
    case WalEventType::cancel_requested:
      exec->cancel_requested = true;
      break;
    case WalEventType::execution_completed:
      if (exec->status != ExecutionStatus::running) return corrupt_transition(err, *exec, ev, "not running");
      for (const auto& s : exec->steps) {
        if (s.status != StepStatus::completed) return corrupt_transition(err, *exec, ev, "step " + s.step_id + " incomplete");
      }
      exec->status = ExecutionStatus::completed;
      exec->completed_at_ms = ev.recorded_at_ms;
      break;
    case WalEventType::execution_failed:
      exec->status = ExecutionStatus::failed;
      exec->completed_at_ms = ev.recorded_at_ms;
      exec->error_code = payload_error_code(p);
      exec->error = get_string(p, "error");
      break;
    case WalEventType::execution_compensated:
      if (exec->status != ExecutionStatus::running) return corrupt_transition(err, *exec, ev, "not running");
      for (const auto& s : exec->steps) {
        if (s.status == StepStatus::running || s.status == StepStatus::completed ||
            s.status == StepStatus::compensating) {
          return corrupt_transition(err, *exec, ev, "step " + s.step_id + " not settled");
        }
      }
      exec->status = ExecutionStatus::compensated;
      exec->completed_at_ms = ev.recorded_at_ms;
      exec->error_code = payload_error_code(p);
      exec->error = get_string(p, "error");
      break;
  }
  exec->last_sequence_no = ev.sequence_no;
  return true;
}

std::optional<Execution> fold(const std::vector<WalEvent>& events, Error* err) {
  if (events.empty()) {
    fail(err, ErrorCode::not_found, "empty WAL stream");
    return std::nullopt;
  }
  if (events.front().type != WalEventType::execution_started) {
    fail(err, ErrorCode::state_corruption,
         events.front().execution_id + ": stream does not begin with EXECUTION_STARTED");
    return std::nullopt;
  }
  Execution exec;
  for (const auto& ev : events) {
    if (!apply_wal_event(&exec, ev, err)) return std::nullopt;
  }
  return exec;
}

}  // namespace keystone
