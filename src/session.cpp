#include "keystone/session.hpp"

#include "keystone/hash.hpp"
#include "keystone/observability.hpp"

namespace keystone {

namespace {

constexpr const char* kSessionRecord = "session";

StateKey session_key(const std::string& tenant_id, const std::string& session_id) {
  return StateKey{tenant_id, ns::kSession, session_id, kSessionRecord};
}

}  // namespace

SessionManager::SessionManager(std::shared_ptr<StateSurface> state) : state_(std::move(state)) {}

std::optional<Session> SessionManager::write(Session s, std::optional<uint64_t> expected_version,
                                             Error* err) {
  auto version = state_->set_key(session_key(s.tenant_id, s.session_id),
                                 jsonlite::to_json(session_to_json(s)), std::nullopt,
                                 expected_version, err);
  if (!version) return std::nullopt;
  s.version = *version;
  return s;
}

std::optional<Session> SessionManager::create_session(const std::string& tenant_id,
                                                      const std::string& user_id,
                                                      const jsonlite::Object& context,
                                                      Error* err) {
  if (!valid_key_component(tenant_id)) {
    fail(err, ErrorCode::validation_error, "tenant_id required");
    return std::nullopt;
  }
  Session s;
  s.session_id = generate_id("ses");
  s.tenant_id = tenant_id;
  s.user_id = user_id;
  s.created_at_ms = state_->clock().now_unix_ms();
  s.updated_at_ms = s.created_at_ms;
  s.context = context;
  auto out = write(std::move(s), 0, err);
  if (out) log_event(LogLevel::debug, "session", "created " + out->session_id + " for " + tenant_id);
  return out;
}

std::optional<Session> SessionManager::get_session(const std::string& session_id,
                                                   const std::string& tenant_id,
                                                   Error* err) const {
  if (!valid_key_component(session_id) || !valid_key_component(tenant_id)) {
    fail(err, ErrorCode::not_found, "session not found");
    return std::nullopt;
  }
  Error e;
  auto rec = state_->get_key(session_key(tenant_id, session_id), &e);
  if (!rec) {
    if (e.code == ErrorCode::not_found) {
      fail(err, ErrorCode::not_found, "session not found: " + session_id);
    } else if (err) {
      *err = e;
    }
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> perr;
  Session s;
  if (!session_from_json(jsonlite::parse(rec->value, &perr), &s) || perr ||
      s.tenant_id != tenant_id) {
    fail(err, ErrorCode::state_corruption, "session record unreadable: " + session_id);
    return std::nullopt;
  }
  s.version = rec->version;
  return s;
}

std::optional<Session> SessionManager::update_context(const std::string& session_id,
                                                      const std::string& tenant_id,
                                                      const jsonlite::Object& patch,
                                                      std::optional<uint64_t> expected_version,
                                                      Error* err) {
  // Without an expected version a merge that loses a race is re-read and
  // re-applied, so concurrent patches never drop each other's keys.
  constexpr int kMergeAttempts = 8;
  for (int attempt = 0;; ++attempt) {
    auto s = get_session(session_id, tenant_id, err);
    if (!s) return std::nullopt;
    if (expected_version && *expected_version != s->version) {
      fail(err, ErrorCode::version_conflict,
           "session " + session_id + " is at version " + std::to_string(s->version));
      return std::nullopt;
    }
    for (const auto& [k, v] : patch) s->context[k] = v;
    s->updated_at_ms = state_->clock().now_unix_ms();
    const uint64_t read_version = s->version;
    Error e;
    auto out = write(std::move(*s), read_version, &e);
    if (out) return out;
    if (e.code != ErrorCode::version_conflict || expected_version || attempt + 1 >= kMergeAttempts) {
      if (err) *err = e;
      return std::nullopt;
    }
  }
}

std::optional<Session> SessionManager::invalidate(const std::string& session_id,
                                                  const std::string& tenant_id,
                                                  const std::string& reason, Error* err) {
  auto s = get_session(session_id, tenant_id, err);
  if (!s) return std::nullopt;
  if (s->status == SessionStatus::invalid) return s;
  s->status = SessionStatus::invalid;
  s->invalidated_reason = reason.empty() ? "invalidated" : reason;
  s->updated_at_ms = state_->clock().now_unix_ms();
  const uint64_t read_version = s->version;
  auto out = write(std::move(*s), read_version, err);
  if (out) log_event(LogLevel::info, "session", session_id + " invalidated: " + out->invalidated_reason);
  return out;
}

}  // namespace keystone
