#include "keystone/api.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <sstream>

#include "keystone/observability.hpp"
#include "keystone/rbac.hpp"
#include "keystone/version.hpp"

namespace keystone {

using jsonlite::get_object;
using jsonlite::get_string;
using jsonlite::get_u64;
using jsonlite::make_string;
using jsonlite::make_u64;

namespace {

ApiResponse json_response(int status, const jsonlite::Object& body) {
  ApiResponse r;
  r.status = status;
  r.body = jsonlite::to_json(body);
  return r;
}

ApiResponse error_response(const Error& e) {
  ApiResponse r;
  r.status = http_status_for(e.code);
  r.body = error_body(e);
  return r;
}

ApiResponse error_response(ErrorCode code, const std::string& message) {
  return error_response(Error{code, message});
}

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> segs;
  std::string cur;
  for (char c : path) {
    if (c == '/') {
      if (!cur.empty()) segs.push_back(std::move(cur));
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) segs.push_back(std::move(cur));
  return segs;
}

// "a=1&b=2" into out; later keys win.
void parse_query(const std::string& qs, std::map<std::string, std::string>* out) {
  std::istringstream in(qs);
  std::string pair;
  while (std::getline(in, pair, '&')) {
    if (pair.empty()) continue;
    const auto eq = pair.find('=');
    if (eq == std::string::npos) {
      (*out)[pair] = "";
    } else {
      (*out)[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
  }
}

std::string query_or(const ApiRequest& req, const std::string& key, const std::string& def = "") {
  auto it = req.query.find(key);
  return it == req.query.end() ? def : it->second;
}

bool permitted(const ApiRequest& req, rbac::Permission perm, ApiResponse* denied) {
  const auto d = rbac::check(req.identity.tenant_id, rbac::role_or_viewer(req.identity.role), perm);
  if (d.ok) return true;
  *denied = error_response(ErrorCode::authorization_error, d.denial_reason);
  return false;
}

struct StatusCodeRule {
  ErrorCode code;
  int       status;
};

constexpr StatusCodeRule kStatusTable[] = {
    {ErrorCode::none, 200},
    {ErrorCode::validation_error, 400},
    {ErrorCode::json_parse_error, 400},
    {ErrorCode::config_invalid, 400},
    {ErrorCode::capability_not_found, 400},
    {ErrorCode::authorization_error, 403},
    {ErrorCode::not_found, 404},
    {ErrorCode::version_conflict, 409},
    {ErrorCode::cancelled, 409},
    {ErrorCode::transient_infra, 503},
};

}  // namespace

int http_status_for(ErrorCode code) {
  for (const auto& r : kStatusTable) {
    if (r.code == code) return r.status;
  }
  return 500;
}

std::string error_body(const Error& e) {
  jsonlite::Object inner;
  inner["code"] = make_string(to_string(e.code));
  inner["message"] = make_string(e.message);
  jsonlite::Object o;
  o["error"] = jsonlite::make_object(std::move(inner));
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// ApiRouter
// ---------------------------------------------------------------------------

ApiRouter::ApiRouter(Runtime& runtime) : rt_(runtime) {}

ApiResponse ApiRouter::handle(const ApiRequest& request) const {
  ApiRequest req = request;
  const auto qpos = req.path.find('?');
  if (qpos != std::string::npos) {
    parse_query(req.path.substr(qpos + 1), &req.query);
    req.path.erase(qpos);
  }
  const auto segs = split_path(req.path);

  jsonlite::Object body;
  if (!req.body.empty()) {
    if (auto perr = jsonlite::validate_strict(req.body)) {
      return error_response(ErrorCode::json_parse_error, perr->message);
    }
    std::optional<jsonlite::JsonError> perr;
    body = jsonlite::parse(req.body, &perr);
    if (perr) return error_response(ErrorCode::json_parse_error, perr->message);
  }

  try {
    return dispatch(req, segs, body);
  } catch (const std::exception& e) {
    log_event(LogLevel::error, "api", req.method + " " + req.path + ": " + e.what());
    return error_response(ErrorCode::internal, "internal error");
  }
}

ApiResponse ApiRouter::dispatch(const ApiRequest& req, const std::vector<std::string>& segs,
                                const jsonlite::Object& body) const {
  ApiResponse denied;
  if (segs.size() == 1 && segs[0] == "health" && req.method == "GET") {
    ApiResponse r;
    r.body = rt_.health_json();
    return r;
  }
  if (!valid_key_component(req.identity.tenant_id)) {
    return error_response(ErrorCode::validation_error, "identity carries no valid tenant_id");
  }
  if (segs.size() == 1 && segs[0] == "stats" && req.method == "GET") {
    if (!permitted(req, rbac::Permission::stats_read, &denied)) return denied;
    ApiResponse r;
    r.body = rt_.stats_json(req.identity.tenant_id);
    return r;
  }
  if (segs.empty()) return error_response(ErrorCode::not_found, "no route");

  const std::string& root = segs[0];
  if (root == "intent" && segs.size() == 2 && segs[1] == "submit" && req.method == "POST") {
    return submit_intent(req, body);
  }
  if (root == "session") {
    if (segs.size() == 2 && segs[1] == "create" && req.method == "POST") {
      return create_session(req, body);
    }
    return session_route(req, segs, body);
  }
  if (root == "execution") return execution_route(req, segs);
  if (root == "contracts") return contract_route(req, segs, body);
  if (root == "materializations") return materialization_route(req, segs);
  if (root == "admin") return admin_route(req, segs);
  return error_response(ErrorCode::not_found, "no route for " + req.method + " " + req.path);
}

ApiResponse ApiRouter::submit_intent(const ApiRequest& req, const jsonlite::Object& body) const {
  ApiResponse denied;
  if (!permitted(req, rbac::Permission::intent_submit, &denied)) return denied;
  Error e;
  auto admission = rt_.intake()->submit(submission_from_json(body), req.identity, &e);
  if (!admission) return error_response(e);
  return json_response(202, admission->to_json());
}

ApiResponse ApiRouter::create_session(const ApiRequest& req, const jsonlite::Object& body) const {
  ApiResponse denied;
  if (!permitted(req, rbac::Permission::session_write, &denied)) return denied;
  const std::string tenant = get_string(body, "tenant_id");
  if (!tenant.empty() && tenant != req.identity.tenant_id) {
    return error_response(ErrorCode::validation_error, "tenant_id does not match caller tenant");
  }
  std::string user = get_string(body, "user_id");
  if (user.empty()) {
    user = req.identity.user_id;
  } else if (!req.identity.user_id.empty() && user != req.identity.user_id) {
    return error_response(ErrorCode::authorization_error, "cannot create a session for another user");
  }
  Error e;
  auto s = rt_.sessions()->create_session(req.identity.tenant_id, user,
                                          get_object(body, "context"), &e);
  if (!s) return error_response(e);
  jsonlite::Object out;
  out["session_id"] = make_string(s->session_id);
  return json_response(201, out);
}

ApiResponse ApiRouter::session_route(const ApiRequest& req, const std::vector<std::string>& segs,
                                     const jsonlite::Object& body) const {
  ApiResponse denied;
  if (segs.size() < 2) return error_response(ErrorCode::not_found, "no route");
  const std::string& id = segs[1];
  const std::string& tenant = req.identity.tenant_id;
  const std::string q_tenant = query_or(req, "tenant_id");
  if (!q_tenant.empty() && q_tenant != tenant) {
    return error_response(ErrorCode::not_found, "session not found: " + id);
  }
  Error e;
  std::optional<Session> s;

  if (segs.size() == 2 && req.method == "GET") {
    if (!permitted(req, rbac::Permission::session_read, &denied)) return denied;
    s = rt_.sessions()->get_session(id, tenant, &e);
  } else if (segs.size() == 3 && segs[2] == "context" && req.method == "POST") {
    if (!permitted(req, rbac::Permission::session_write, &denied)) return denied;
    std::optional<uint64_t> expected;
    if (body.count("expected_version")) expected = get_u64(body, "expected_version");
    s = rt_.sessions()->update_context(id, tenant, get_object(body, "patch"), expected, &e);
  } else if (segs.size() == 3 && segs[2] == "invalidate" && req.method == "POST") {
    if (!permitted(req, rbac::Permission::session_write, &denied)) return denied;
    s = rt_.sessions()->invalidate(id, tenant, get_string(body, "reason", "invalidated"), &e);
  } else {
    return error_response(ErrorCode::not_found, "no route");
  }
  if (!s) return error_response(e);
  return json_response(200, session_to_json(*s));
}

ApiResponse ApiRouter::execution_route(const ApiRequest& req,
                                       const std::vector<std::string>& segs) const {
  ApiResponse denied;
  if (segs.size() != 3) return error_response(ErrorCode::not_found, "no route");
  const std::string& id = segs[1];
  const std::string& tenant = req.identity.tenant_id;
  const std::string& action = segs[2];
  Error e;

  if (action == "status" && req.method == "GET") {
    if (!permitted(req, rbac::Permission::execution_read, &denied)) return denied;
    std::optional<Execution> exec;
    // Long polls are capped at the step timeout.
    const uint64_t wait_ms =
        std::min<uint64_t>(std::strtoull(query_or(req, "wait_ms", "0").c_str(), nullptr, 10),
                           rt_.config().step_timeout_ms);
    if (wait_ms > 0) {
      exec = rt_.saga()->wait(id, tenant, std::chrono::milliseconds(wait_ms), &e);
    } else {
      exec = rt_.saga()->status(id, tenant, &e);
    }
    if (!exec) return error_response(e);
    return json_response(200, execution_status_json(*exec));
  }
  if (action == "cancel" && req.method == "POST") {
    if (!permitted(req, rbac::Permission::execution_cancel, &denied)) return denied;
    auto exec = rt_.saga()->cancel(id, tenant, &e);
    if (!exec) return error_response(e);
    jsonlite::Object out;
    out["execution_id"] = make_string(exec->execution_id);
    out["status"] = make_string(to_string(exec->status));
    out["cancel_requested"] = jsonlite::make_bool(exec->cancel_requested);
    return json_response(200, out);
  }
  if (action == "wal" && req.method == "GET") {
    if (!permitted(req, rbac::Permission::wal_export, &denied)) return denied;
    // Tenant gate: the snapshot lookup is tenant-scoped, the WAL is not.
    auto stream = rt_.wal()->stream_ref(id);
    if (!stream || stream->tenant_id != tenant) {
      return error_response(ErrorCode::not_found, "execution not found: " + id);
    }
    auto text = rt_.wal()->export_ndjson(id, &e);
    if (!text) return error_response(e);
    ApiResponse r;
    r.body = std::move(*text);
    r.content_type = "application/x-ndjson";
    return r;
  }
  return error_response(ErrorCode::not_found, "no route");
}

ApiResponse ApiRouter::contract_route(const ApiRequest& req, const std::vector<std::string>& segs,
                                      const jsonlite::Object& body) const {
  ApiResponse denied;
  const std::string& tenant = req.identity.tenant_id;
  auto contracts = rt_.contracts();
  Error e;

  if (segs.size() == 1 && req.method == "POST") {
    if (!permitted(req, rbac::Permission::contract_write, &denied)) return denied;
    auto c = contracts->create_pending(tenant, get_string(body, "artifact_reference"), &e);
    if (!c) return error_response(e);
    jsonlite::Object out;
    out["contract_id"] = make_string(c->contract_id);
    out["status"] = make_string(to_string(c->status));
    return json_response(201, out);
  }
  if (segs.size() < 2) return error_response(ErrorCode::not_found, "no route");
  const std::string& id = segs[1];

  if (segs.size() == 2 && req.method == "GET") {
    if (!permitted(req, rbac::Permission::contract_read, &denied)) return denied;
    auto c = contracts->get(tenant, id, &e);
    if (!c) return error_response(e);
    return json_response(200, contract_to_json(*c));
  }
  if (segs.size() != 3 || req.method != "POST") {
    return error_response(ErrorCode::not_found, "no route");
  }
  const std::string& action = segs[2];

  if (action == "authorize") {
    if (!permitted(req, rbac::Permission::contract_write, &denied)) return denied;
    auto c = contracts->authorize(tenant, id, scope_from_json(get_object(body, "scope")), &e);
    if (!c) return error_response(e);
    jsonlite::Object out;
    out["contract_id"] = make_string(c->contract_id);
    out["status"] = make_string(to_string(c->status));
    return json_response(200, out);
  }
  if (action == "revoke") {
    if (!permitted(req, rbac::Permission::contract_write, &denied)) return denied;
    auto c = contracts->revoke(tenant, id, &e);
    if (!c) return error_response(e);
    jsonlite::Object out;
    out["contract_id"] = make_string(c->contract_id);
    out["status"] = make_string(to_string(c->status));
    return json_response(200, out);
  }
  if (action == "materialize") {
    if (!permitted(req, rbac::Permission::materialize, &denied)) return denied;
    ContractScope requester;
    if (!requester_scope(req, get_string(body, "session_id"), get_string(body, "solution_id"),
                         &requester, &denied)) {
      return denied;
    }
    auto rec = rt_.materializer()->materialize(tenant, id, get_string(body, "representation_type"),
                                               requester, requester.solution_id, &e);
    if (!rec) return error_response(e);
    return json_response(201, materialization_to_json(*rec));
  }
  return error_response(ErrorCode::not_found, "no route");
}

ApiResponse ApiRouter::materialization_route(const ApiRequest& req,
                                             const std::vector<std::string>& segs) const {
  ApiResponse denied;
  if (req.method != "GET") return error_response(ErrorCode::not_found, "no route");
  if (!permitted(req, rbac::Permission::contract_read, &denied)) return denied;
  const std::string& tenant = req.identity.tenant_id;
  ContractScope requester;
  if (!requester_scope(req, query_or(req, "session_id"), query_or(req, "solution_id"), &requester,
                       &denied)) {
    return denied;
  }
  Error e;

  if (segs.size() == 1) {
    auto records = rt_.materializer()->list(tenant, requester, &e);
    if (!e.ok()) return error_response(e);
    jsonlite::Array items;
    for (const auto& r : records) items.push_back(jsonlite::make_object(materialization_to_json(r)));
    jsonlite::Object out;
    out["materializations"] = jsonlite::make_array(std::move(items));
    return json_response(200, out);
  }
  if (segs.size() == 2) {
    auto rec = rt_.materializer()->read(tenant, segs[1], requester, &e);
    if (!rec) return error_response(e);
    return json_response(200, materialization_to_json(*rec));
  }
  return error_response(ErrorCode::not_found, "no route");
}

// A claimed session must exist in the caller's tenant, be active, and belong
// to the caller when it is bound to a user. The solution id is a policy
// selector and is taken as given.
bool ApiRouter::requester_scope(const ApiRequest& req, const std::string& session_id,
                                const std::string& solution_id, ContractScope* out,
                                ApiResponse* denied) const {
  out->user_id = req.identity.user_id;
  out->solution_id = solution_id;
  if (session_id.empty()) return true;

  Error e;
  auto s = rt_.sessions()->get_session(session_id, req.identity.tenant_id, &e);
  std::string reason;
  if (!s) {
    reason = "unknown session: " + session_id;
  } else if (s->status != SessionStatus::active) {
    reason = "session is invalid: " + session_id;
  } else if (!s->user_id.empty() && s->user_id != req.identity.user_id) {
    reason = "session belongs to another user: " + session_id;
  }
  if (!reason.empty()) {
    *denied = error_response(ErrorCode::authorization_error, reason);
    return false;
  }
  out->session_id = session_id;
  return true;
}

ApiResponse ApiRouter::admin_route(const ApiRequest& req,
                                   const std::vector<std::string>& segs) const {
  ApiResponse denied;
  if (req.method != "POST" || segs.size() < 2) return error_response(ErrorCode::not_found, "no route");

  if (segs[1] == "sweep" && segs.size() == 2) {
    if (!permitted(req, rbac::Permission::sweep, &denied)) return denied;
    const auto report = rt_.contracts()->sweep_expired(rt_.state()->clock().now_unix_ms(),
                                                       req.identity.tenant_id);
    ApiResponse r;
    r.body = report.to_json();
    return r;
  }
  if (segs[1] == "recover" && segs.size() == 3) {
    if (!permitted(req, rbac::Permission::recovery, &denied)) return denied;
    auto stream = rt_.wal()->stream_ref(segs[2]);
    if (!stream || stream->tenant_id != req.identity.tenant_id) {
      return error_response(ErrorCode::not_found, "execution not found: " + segs[2]);
    }
    Error e;
    auto exec = rt_.saga()->recover(segs[2], &e);
    if (!exec) return error_response(e);
    return json_response(200, execution_status_json(*exec));
  }
  return error_response(ErrorCode::not_found, "no route");
}

// ---------------------------------------------------------------------------
// StreamConnection
// ---------------------------------------------------------------------------

namespace {

struct StreamStateName {
  StreamState state;
  const char* name;
};

constexpr StreamStateName kStreamStateNames[] = {
    {StreamState::connecting, "connecting"},
    {StreamState::authenticating, "authenticating"},
    {StreamState::open, "open"},
    {StreamState::closing, "closing"},
    {StreamState::closed, "closed"},
};

std::string frame(const jsonlite::Object& o) { return jsonlite::to_json(o); }

}  // namespace

std::string to_string(StreamState s) {
  for (const auto& n : kStreamStateNames) {
    if (n.state == s) return n.name;
  }
  return "unknown";
}

StreamConnection::StreamConnection(const ApiRouter& router,
                                   std::shared_ptr<SessionManager> sessions)
    : router_(router), sessions_(std::move(sessions)) {}

std::vector<std::string> StreamConnection::protocol_error(ErrorCode code,
                                                          const std::string& message,
                                                          bool terminate) {
  std::vector<std::string> out;
  jsonlite::Object err;
  err["code"] = make_string(to_string(code));
  err["message"] = make_string(message);
  jsonlite::Object f;
  f["type"] = make_string("error");
  f["error"] = jsonlite::make_object(std::move(err));
  f["state"] = make_string(to_string(state_));
  out.push_back(frame(f));
  if (terminate) {
    state_ = StreamState::closed;
    jsonlite::Object c;
    c["type"] = make_string("closed");
    out.push_back(frame(c));
  }
  return out;
}

std::vector<std::string> StreamConnection::on_frame(const std::string& line) {
  if (state_ == StreamState::closed || state_ == StreamState::closing) {
    return protocol_error(ErrorCode::validation_error, "connection is " + to_string(state_), false);
  }
  const bool before_open = state_ != StreamState::open;
  if (auto perr = jsonlite::validate_strict(line)) {
    return protocol_error(ErrorCode::json_parse_error, perr->message, before_open);
  }
  std::optional<jsonlite::JsonError> perr;
  const auto f = jsonlite::parse(line, &perr);
  if (perr) return protocol_error(ErrorCode::json_parse_error, perr->message, before_open);

  const std::string type = get_string(f, "type");
  if (type == "close") return on_close();
  switch (state_) {
    case StreamState::connecting:
      if (type == "hello") return on_hello(f);
      break;
    case StreamState::authenticating:
      if (type == "auth") return on_auth(f);
      break;
    case StreamState::open:
      if (type == "request") return on_request(f);
      break;
    default:
      break;
  }
  return protocol_error(ErrorCode::validation_error,
                        "unexpected frame '" + type + "' in state " + to_string(state_),
                        before_open);
}

std::vector<std::string> StreamConnection::on_hello(const jsonlite::Object&) {
  state_ = StreamState::authenticating;
  jsonlite::Object f;
  f["type"] = make_string("hello_ack");
  f["api_version"] = make_u64(version::API_VERSION);
  return {frame(f)};
}

std::vector<std::string> StreamConnection::on_auth(const jsonlite::Object& f) {
  // 1. identity
  CallerIdentity id = identity_from_json(get_object(f, "identity"));
  if (!valid_key_component(id.tenant_id)) {
    return protocol_error(ErrorCode::authorization_error, "identity has no valid tenant_id", true);
  }
  // 2. session
  Error e;
  std::optional<Session> s;
  const std::string sid = get_string(f, "session_id");
  if (sid.empty()) {
    s = sessions_->create_session(id.tenant_id, id.user_id, {}, &e);
  } else {
    s = sessions_->get_session(sid, id.tenant_id, &e);
    if (s && s->status != SessionStatus::active) {
      s.reset();
      e = Error{ErrorCode::authorization_error, "session is invalid: " + sid};
    }
  }
  if (!s) return protocol_error(e.code, e.message, true);

  identity_ = std::move(id);
  session_id_ = s->session_id;
  state_ = StreamState::open;
  log_event(LogLevel::debug, "stream", "open tenant=" + identity_.tenant_id + " session=" + session_id_);
  jsonlite::Object out;
  out["type"] = make_string("auth_ok");
  out["session_id"] = make_string(session_id_);
  out["tenant_id"] = make_string(identity_.tenant_id);
  return {frame(out)};
}

std::vector<std::string> StreamConnection::on_request(const jsonlite::Object& f) {
  ApiRequest req;
  req.method = get_string(f, "method", "GET");
  req.path = get_string(f, "path");
  req.query = jsonlite::get_string_map(f, "query");
  req.identity = identity_;

  jsonlite::Object body = get_object(f, "body");
  // Intents sent over the stream default to the connection's session.
  if (req.path == "/intent/submit" && get_string(body, "session_id").empty()) {
    body["session_id"] = make_string(session_id_);
  }
  if (!body.empty()) req.body = jsonlite::to_json(body);

  const ApiResponse resp = router_.handle(req);
  std::ostringstream o;
  o << "{\"body\":";
  if (resp.content_type == "application/json") {
    o << resp.body;
  } else {
    o << "\"" << jsonlite::escape(resp.body) << "\"";
  }
  o << ",\"content_type\":\"" << jsonlite::escape(resp.content_type) << "\""
    << ",\"id\":\"" << jsonlite::escape(get_string(f, "id")) << "\""
    << ",\"status\":" << resp.status
    << ",\"type\":\"response\"}";
  return {o.str()};
}

std::vector<std::string> StreamConnection::on_close() {
  state_ = StreamState::closing;
  jsonlite::Object f;
  f["type"] = make_string("closed");
  state_ = StreamState::closed;
  return {frame(f)};
}

void StreamConnection::on_disconnect() { state_ = StreamState::closed; }

uint64_t run_stream(std::istream& in, std::ostream& out, StreamConnection& conn) {
  uint64_t frames = 0;
  std::string line;
  while (conn.state() != StreamState::closed && std::getline(in, line)) {
    if (line.empty() || line == "\r") continue;
    if (line.back() == '\r') line.pop_back();
    ++frames;
    for (const auto& reply : conn.on_frame(line)) out << reply << "\n";
    out.flush();
  }
  conn.on_disconnect();
  return frames;
}

}  // namespace keystone
