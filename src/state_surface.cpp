#include "keystone/state_surface.hpp"

#include <chrono>
#include <thread>

#include "keystone/observability.hpp"

namespace keystone {

bool valid_key_component(const std::string& s) {
  if (s.empty() || s.size() > 256) return false;
  for (unsigned char c : s) {
    if (c == '/' || c < 0x20 || c == 0x7f) return false;
  }
  return true;
}

bool StateKey::valid() const {
  if (!valid_key_component(tenant_id) || !valid_key_component(ns) ||
      !valid_key_component(scope_id)) {
    return false;
  }
  return name.empty() || valid_key_component(name);
}

std::string StateKey::path() const {
  std::string p = "tenant/" + tenant_id + "/" + ns + "/" + scope_id;
  if (!name.empty()) p += "/" + name;
  return p;
}

StateSurface::StateSurface(std::shared_ptr<IStateBackend> backend, RetryPolicy retry,
                           std::shared_ptr<Clock> clock)
    : backend_(std::move(backend)), retry_(retry), clock_(std::move(clock)) {}

template <typename Fn>
BackendStatus StateSurface::with_retry(const std::string& what, Fn&& fn) const {
  BackendStatus st = fn();
  for (uint32_t attempt = 0; st == BackendStatus::unavailable && attempt < retry_.max_retries;
       ++attempt) {
    CoreEvent ev;
    ev.kind = CoreEventKind::infra_retry;
    ev.error_code = ErrorCode::transient_infra;
    emit_core_event(ev);
    log_event(LogLevel::info, "state",
              what + " unavailable, retry " + std::to_string(attempt + 1) + "/" +
                  std::to_string(retry_.max_retries));
    std::this_thread::sleep_for(std::chrono::milliseconds(retry_.delay_ms(attempt)));
    st = fn();
  }
  return st;
}

namespace {

bool map_status(BackendStatus st, const std::string& key, Error* err) {
  switch (st) {
    case BackendStatus::ok:
      return true;
    case BackendStatus::not_found:
      return fail(err, ErrorCode::not_found, "state record not found: " + key);
    case BackendStatus::version_conflict:
      return fail(err, ErrorCode::version_conflict, "version conflict on " + key);
    case BackendStatus::unavailable:
      return fail(err, ErrorCode::transient_infra, "state backend unavailable for " + key);
    case BackendStatus::corrupt: {
      CoreEvent ev;
      ev.kind = CoreEventKind::state_corruption;
      ev.error_code = ErrorCode::state_corruption;
      emit_core_event(ev);
      log_event(LogLevel::error, "state", "integrity check failed for " + key);
      return fail(err, ErrorCode::state_corruption, "state record corrupt: " + key);
    }
  }
  return fail(err, ErrorCode::internal, "unknown backend status");
}

}  // namespace

std::optional<StateRecord> StateSurface::get_key(const StateKey& key, Error* err) const {
  if (!key.valid()) {
    fail(err, ErrorCode::validation_error, "invalid state key");
    return std::nullopt;
  }
  const std::string path = key.path();
  StateRecord rec;
  const auto st = with_retry("read " + path, [&] { return backend_->read(path, &rec); });
  if (!map_status(st, path, err)) return std::nullopt;
  if (rec.expired(clock_->now_unix_ms())) {
    fail(err, ErrorCode::not_found, "state record expired: " + path);
    return std::nullopt;
  }
  return rec;
}

std::optional<uint64_t> StateSurface::set_key(const StateKey& key, const std::string& value_json,
                                              std::optional<uint64_t> ttl_ms,
                                              std::optional<uint64_t> expected_version,
                                              Error* err) {
  if (!key.valid()) {
    fail(err, ErrorCode::validation_error, "invalid state key");
    return std::nullopt;
  }
  if (auto jerr = jsonlite::validate_strict(value_json)) {
    fail(err, ErrorCode::validation_error, "state value is not valid JSON: " + jerr->code);
    return std::nullopt;
  }
  const uint64_t now = clock_->now_unix_ms();
  StateRecord rec;
  rec.key = key.path();
  rec.value = value_json;
  rec.updated_at_ms = now;
  rec.expires_at_ms = (ttl_ms && *ttl_ms > 0) ? now + *ttl_ms : 0;

  // An expired record counts as absent for create-only writes.
  if (expected_version && *expected_version == 0) {
    StateRecord existing;
    const auto rst = with_retry("read " + rec.key, [&] { return backend_->read(rec.key, &existing); });
    if (rst == BackendStatus::ok && existing.expired(now)) {
      expected_version = existing.version;
    }
  }

  uint64_t version = 0;
  const auto st = with_retry("write " + rec.key,
                             [&] { return backend_->write(rec, expected_version, &version); });
  if (st == BackendStatus::version_conflict) {
    CoreEvent ev;
    ev.kind = CoreEventKind::version_conflict;
    ev.tenant_id = key.tenant_id;
    ev.error_code = ErrorCode::version_conflict;
    emit_core_event(ev);
    fail(err, ErrorCode::version_conflict,
         "version conflict on " + rec.key + ": expected " +
             std::to_string(expected_version.value_or(0)) + ", current " + std::to_string(version));
    return std::nullopt;
  }
  if (!map_status(st, rec.key, err)) return std::nullopt;
  return version;
}

std::optional<StateRecord> StateSurface::get(const std::string& tenant_id,
                                             const std::string& session_id,
                                             const std::string& name, Error* err) const {
  return get_key(StateKey{tenant_id, ns::kSession, session_id, name}, err);
}

std::optional<uint64_t> StateSurface::set(const std::string& tenant_id,
                                          const std::string& session_id, const std::string& name,
                                          const std::string& value_json,
                                          std::optional<uint64_t> ttl_ms,
                                          std::optional<uint64_t> expected_version, Error* err) {
  return set_key(StateKey{tenant_id, ns::kSession, session_id, name}, value_json, ttl_ms,
                 expected_version, err);
}

std::vector<StateRecord> StateSurface::query(const std::string& tenant_id, const StateQuery& q,
                                             Error* err) const {
  if (!valid_key_component(tenant_id) || (!q.ns.empty() && !valid_key_component(q.ns)) ||
      (!q.scope_id.empty() && !valid_key_component(q.scope_id)) ||
      (!q.scope_id.empty() && q.ns.empty())) {
    fail(err, ErrorCode::validation_error, "invalid state query");
    return {};
  }

  std::string prefix = "tenant/" + tenant_id + "/";
  if (!q.ns.empty()) prefix += q.ns + "/";
  if (!q.scope_id.empty()) prefix += q.scope_id;

  std::vector<StateRecord> raw;
  const auto st = with_retry("scan " + prefix, [&] { return backend_->scan(prefix, 0, &raw); });
  if (!map_status(st, prefix, err)) return {};

  const uint64_t now = clock_->now_unix_ms();
  std::vector<StateRecord> out;
  for (auto& rec : raw) {
    if (rec.expired(now)) continue;
    if (!q.scope_id.empty()) {
      // Scope ids are whole components: "e1" must not match "e10".
      const std::string rest = rec.key.substr(prefix.size());
      if (!rest.empty() && rest[0] != '/') continue;
      const std::string name = rest.empty() ? std::string() : rest.substr(1);
      if (!q.name_prefix.empty() && name.compare(0, q.name_prefix.size(), q.name_prefix) != 0) {
        continue;
      }
    } else if (!q.name_prefix.empty()) {
      const auto slash = rec.key.rfind('/');
      const std::string name = rec.key.substr(slash + 1);
      if (name.compare(0, q.name_prefix.size(), q.name_prefix) != 0) continue;
    }
    out.push_back(std::move(rec));
    if (q.limit > 0 && out.size() >= q.limit) break;
  }
  return out;
}

std::vector<StateRecord> StateSurface::scan_namespace(const std::string& ns_name,
                                                      Error* err) const {
  if (!valid_key_component(ns_name)) {
    fail(err, ErrorCode::validation_error, "invalid namespace");
    return {};
  }
  std::vector<StateRecord> raw;
  const auto st = with_retry("scan tenant/", [&] { return backend_->scan("tenant/", 0, &raw); });
  if (!map_status(st, "tenant/", err)) return {};

  const std::string marker = "/" + ns_name + "/";
  std::vector<StateRecord> out;
  for (auto& rec : raw) {
    // tenant/{t}/{ns}/...: the namespace is the third component.
    const auto first = rec.key.find('/');
    const auto second = rec.key.find('/', first + 1);
    if (second == std::string::npos) continue;
    if (rec.key.compare(second, marker.size(), marker) != 0) continue;
    out.push_back(std::move(rec));
  }
  return out;
}

size_t StateSurface::purge_expired() {
  return backend_->purge_expired(clock_->now_unix_ms());
}

}  // namespace keystone
