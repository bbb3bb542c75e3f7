#include "keystone/intake.hpp"

#include <cstdlib>

#include "keystone/hash.hpp"
#include "keystone/observability.hpp"

namespace keystone {

using jsonlite::get_object;
using jsonlite::get_string;
using jsonlite::make_string;
using jsonlite::make_u64;

namespace {

constexpr size_t kMaxIdempotencyKeyBytes = 512;
constexpr const char* kClaimAdmitted = "admitted";
constexpr const char* kClaimAborted = "aborted";

// Lifts the well-known keys of one context layer onto ctx; everything else
// lands in attributes, later layers overwriting earlier ones.
void overlay(ExecutionContext* ctx, const jsonlite::Object& layer) {
  for (const auto& [k, v] : layer) {
    if (k == "tenant_id" || k == "session_id") continue;
    if (k == "solution_id" && std::holds_alternative<std::string>(v.v)) {
      ctx->solution_id = std::get<std::string>(v.v);
    } else if (k == "locale" && std::holds_alternative<std::string>(v.v)) {
      ctx->locale = std::get<std::string>(v.v);
    } else if (k == "user_id" && std::holds_alternative<std::string>(v.v)) {
      ctx->user_id = std::get<std::string>(v.v);
    } else {
      ctx->attributes[k] = v;
    }
  }
}

void reject(const std::string& tenant_id, const Error& e) {
  CoreEvent ev;
  ev.kind = CoreEventKind::intent_rejected;
  ev.tenant_id = tenant_id;
  ev.error_code = e.code;
  emit_core_event(ev);
  log_event(LogLevel::info, "intake", "rejected (" + to_string(e.code) + "): " + e.message);
}

}  // namespace

CallerIdentity identity_from_json(const jsonlite::Object& o) {
  CallerIdentity c;
  c.tenant_id = get_string(o, "tenant_id");
  c.user_id = get_string(o, "user_id");
  c.role = get_string(o, "role");
  c.metadata = get_object(o, "metadata");
  return c;
}

IntentSubmission submission_from_json(const jsonlite::Object& o) {
  IntentSubmission s;
  s.type = get_string(o, "type");
  s.tenant_id = get_string(o, "tenant_id");
  s.session_id = get_string(o, "session_id");
  s.idempotency_key = get_string(o, "idempotency_key");
  s.parameters = get_object(o, "parameters");
  return s;
}

jsonlite::Object Admission::to_json() const {
  jsonlite::Object o;
  o["execution_id"] = make_string(execution_id);
  o["intent_id"] = make_string(intent_id);
  o["session_id"] = make_string(session_id);
  o["status"] = make_string(status);
  o["replayed"] = jsonlite::make_bool(replayed);
  return o;
}

ExecutionContext resolve_context(const CallerIdentity& caller, const Session& session,
                                 const jsonlite::Object& parameters) {
  ExecutionContext ctx;  // platform defaults
  ctx.user_id = session.user_id;
  overlay(&ctx, session.context);
  if (!caller.user_id.empty()) ctx.user_id = caller.user_id;
  overlay(&ctx, caller.metadata);
  overlay(&ctx, get_object(parameters, "context"));
  ctx.tenant_id = caller.tenant_id;
  ctx.session_id = session.session_id;
  return ctx;
}

// ---------------------------------------------------------------------------
// IntentIntake
// ---------------------------------------------------------------------------

IntentIntake::IntentIntake(std::shared_ptr<StateSurface> state,
                           std::shared_ptr<SessionManager> sessions,
                           std::shared_ptr<SagaCoordinator> saga)
    : state_(std::move(state)), sessions_(std::move(sessions)), saga_(std::move(saga)) {}

std::mutex& IntentIntake::key_lock(const std::string& digest) {
  const auto slot = std::strtoul(digest.substr(0, 6).c_str(), nullptr, 16);
  return key_locks_[slot % key_locks_.size()];
}

std::optional<IntentIntake::Claim> IntentIntake::read_claim(const StateKey& key, Error* err) const {
  Error e;
  auto rec = state_->get_key(key, &e);
  if (!rec) {
    if (e.code != ErrorCode::not_found && err) *err = e;
    return std::nullopt;
  }
  std::optional<jsonlite::JsonError> perr;
  const auto o = jsonlite::parse(rec->value, &perr);
  Claim c;
  c.execution_id = get_string(o, "execution_id");
  c.intent_id = get_string(o, "intent_id");
  c.state = get_string(o, "state");
  c.version = rec->version;
  if (perr || c.execution_id.empty()) {
    fail(err, ErrorCode::state_corruption, "idempotency record unreadable: " + key.path());
    return std::nullopt;
  }
  return c;
}

void IntentIntake::abort_claim(const StateKey& key, const Claim& claim, uint64_t version) {
  jsonlite::Object o;
  o["execution_id"] = make_string(claim.execution_id);
  o["intent_id"] = make_string(claim.intent_id);
  o["state"] = make_string(kClaimAborted);
  Error e;
  if (!state_->set_key(key, jsonlite::to_json(o), std::nullopt, version, &e)) {
    log_event(LogLevel::warn, "intake", "could not release claim " + key.path() + ": " + e.message);
  }
}

std::optional<Admission> IntentIntake::replay(const Claim& claim, const std::string& tenant_id,
                                              const std::string& session_id) const {
  Admission a;
  a.execution_id = claim.execution_id;
  a.intent_id = claim.intent_id;
  a.session_id = session_id;
  a.replayed = true;
  Error e;
  auto exec = saga_->status(claim.execution_id, tenant_id, &e);
  if (exec) {
    a.status = to_string(exec->status);
    a.session_id = exec->session_id;
  } else {
    // Claimed but the snapshot is not written yet (or was lost): the
    // execution exists from the caller's point of view.
    a.status = to_string(ExecutionStatus::pending);
  }
  CoreEvent ev;
  ev.kind = CoreEventKind::intent_replayed;
  ev.tenant_id = tenant_id;
  ev.execution_id = claim.execution_id;
  emit_core_event(ev);
  return a;
}

std::optional<Admission> IntentIntake::submit(const IntentSubmission& submission,
                                              const CallerIdentity& caller, Error* err) {
  Error e;
  if (!valid_key_component(caller.tenant_id)) {
    fail(&e, ErrorCode::validation_error, "caller identity has no valid tenant_id");
  } else if (!submission.tenant_id.empty() && submission.tenant_id != caller.tenant_id) {
    fail(&e, ErrorCode::validation_error, "intent tenant_id does not match caller tenant");
  } else if (submission.type.empty()) {
    fail(&e, ErrorCode::validation_error, "intent type is required");
  } else if (!intent_type_from_string(submission.type)) {
    fail(&e, ErrorCode::validation_error, "unknown intent type: " + submission.type);
  } else if (!submission.session_id.empty() && !valid_key_component(submission.session_id)) {
    fail(&e, ErrorCode::validation_error, "malformed session_id");
  } else if (submission.idempotency_key.size() > kMaxIdempotencyKeyBytes) {
    fail(&e, ErrorCode::validation_error, "idempotency_key too long");
  }
  if (!e.ok()) {
    reject(caller.tenant_id, e);
    if (err) *err = e;
    return std::nullopt;
  }
  const std::string& tenant_id = caller.tenant_id;

  std::optional<StateKey> claim_key;
  std::unique_lock<std::mutex> key_lk;
  std::optional<Claim> existing;
  if (!submission.idempotency_key.empty()) {
    const std::string digest = idempotency_digest(tenant_id, submission.idempotency_key);
    claim_key = StateKey{tenant_id, ns::kIdempotency, digest, ""};
    key_lk = std::unique_lock<std::mutex>(key_lock(digest));
    existing = read_claim(*claim_key, &e);
    if (!e.ok()) {
      if (err) *err = e;
      return std::nullopt;
    }
    if (existing && existing->state == kClaimAdmitted) {
      return replay(*existing, tenant_id, submission.session_id);
    }
  }

  // Session: explicit and active, or a fresh one.
  std::optional<Session> session;
  if (!submission.session_id.empty()) {
    session = sessions_->get_session(submission.session_id, tenant_id, &e);
    if (session && session->status != SessionStatus::active) {
      fail(&e, ErrorCode::validation_error, "session is invalid: " + session->session_id);
      session.reset();
    }
  } else {
    session = sessions_->create_session(tenant_id, caller.user_id, {}, &e);
  }
  if (!session) {
    reject(tenant_id, e);
    if (err) *err = e;
    return std::nullopt;
  }

  Claim claim;
  claim.execution_id = generate_id("exe");
  claim.intent_id = generate_id("int");
  claim.state = kClaimAdmitted;
  if (claim_key) {
    jsonlite::Object o;
    o["execution_id"] = make_string(claim.execution_id);
    o["intent_id"] = make_string(claim.intent_id);
    o["state"] = make_string(kClaimAdmitted);
    o["claimed_at"] = make_u64(state_->clock().now_unix_ms());
    const uint64_t expected = existing ? existing->version : 0;
    auto v = state_->set_key(*claim_key, jsonlite::to_json(o), std::nullopt, expected, &e);
    if (!v) {
      if (e.code == ErrorCode::version_conflict) {
        // Another process claimed the key first.
        Error re;
        auto winner = read_claim(*claim_key, &re);
        if (winner && winner->state == kClaimAdmitted) {
          return replay(*winner, tenant_id, session->session_id);
        }
      }
      if (err) *err = e;
      return std::nullopt;
    }
    claim.version = *v;
  }

  Intent intent;
  intent.intent_id = claim.intent_id;
  intent.idempotency_key = submission.idempotency_key;
  intent.type = *intent_type_from_string(submission.type);
  intent.tenant_id = tenant_id;
  intent.session_id = session->session_id;
  intent.parameters = submission.parameters;
  intent.submitted_at_ms = state_->clock().now_unix_ms();

  const ExecutionContext ctx = resolve_context(caller, *session, submission.parameters);
  auto exec = saga_->start(intent, ctx, claim.execution_id, &e);
  if (!exec) {
    if (claim_key) abort_claim(*claim_key, claim, claim.version);
    log_event(LogLevel::warn, "intake", "start failed for " + claim.execution_id + ": " + e.message);
    if (err) *err = e;
    return std::nullopt;
  }

  CoreEvent ev;
  ev.kind = CoreEventKind::intent_admitted;
  ev.tenant_id = tenant_id;
  ev.execution_id = claim.execution_id;
  emit_core_event(ev);

  Admission a;
  a.execution_id = claim.execution_id;
  a.intent_id = claim.intent_id;
  a.session_id = session->session_id;
  a.status = "admitted";
  return a;
}

}  // namespace keystone
