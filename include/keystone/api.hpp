#pragma once

// keystone/api.hpp — Transport-agnostic API boundary and the NDJSON stream.
//
// ApiRouter maps (method, path, query, body, identity) to (status, body).
// It never throws: every failure becomes {"error":{"code","message"}} with
//
//   400 validation_error, json_parse_error, config_invalid, capability_not_found
//   403 authorization_error
//   404 not_found
//   409 version_conflict, cancelled
//   503 transient_infra
//   500 everything else
//
// Each route names one rbac::Permission, checked before dispatch. Tenant
// isolation comes from the identity: the caller's tenant_id is the only
// tenant any route reads or writes.
//
// STREAM (keystone serve): one JSON frame per line over stdio.
//
//   connecting ──hello──→ authenticating ──auth──→ open ──close──→ closing → closed
//
//   auth runs two ordered checks: the identity (tenant present), then the
//   session (exists and active under that tenant; absent = create one). A
//   failure of either, or any frame out of order before open, ends the
//   connection. In open, a bad frame gets an error frame and the connection
//   stays open.

#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "keystone/intake.hpp"
#include "keystone/runtime.hpp"
#include "keystone/types.hpp"

namespace keystone {

struct ApiRequest {
  std::string                        method;   // GET | POST
  std::string                        path;     // may carry ?query
  std::map<std::string, std::string> query;
  std::string                        body;     // JSON text; empty = {}
  CallerIdentity                     identity;
};

struct ApiResponse {
  int         status{200};
  std::string body;
  std::string content_type{"application/json"};
};

int http_status_for(ErrorCode code);
std::string error_body(const Error& e);

class ApiRouter {
 public:
  explicit ApiRouter(Runtime& runtime);

  ApiResponse handle(const ApiRequest& request) const;

 private:
  ApiResponse dispatch(const ApiRequest& req, const std::vector<std::string>& segs,
                       const jsonlite::Object& body) const;

  ApiResponse submit_intent(const ApiRequest& req, const jsonlite::Object& body) const;
  ApiResponse create_session(const ApiRequest& req, const jsonlite::Object& body) const;
  ApiResponse session_route(const ApiRequest& req, const std::vector<std::string>& segs,
                            const jsonlite::Object& body) const;
  ApiResponse execution_route(const ApiRequest& req, const std::vector<std::string>& segs) const;
  ApiResponse contract_route(const ApiRequest& req, const std::vector<std::string>& segs,
                             const jsonlite::Object& body) const;
  ApiResponse materialization_route(const ApiRequest& req,
                                    const std::vector<std::string>& segs) const;
  ApiResponse admin_route(const ApiRequest& req, const std::vector<std::string>& segs) const;

  // authorization_error when the claimed session is unknown, invalid or held
  // by another user.
  bool requester_scope(const ApiRequest& req, const std::string& session_id,
                       const std::string& solution_id, ContractScope* out,
                       ApiResponse* denied) const;

  Runtime& rt_;
};

// ---------------------------------------------------------------------------
// Stream connection
// ---------------------------------------------------------------------------
enum class StreamState { connecting, authenticating, open, closing, closed };

std::string to_string(StreamState s);

class StreamConnection {
 public:
  StreamConnection(const ApiRouter& router, std::shared_ptr<SessionManager> sessions);

  // Consumes one inbound line and returns the outbound frames.
  std::vector<std::string> on_frame(const std::string& line);

  // Peer went away: any state → closed.
  void on_disconnect();

  StreamState state() const { return state_; }
  const CallerIdentity& identity() const { return identity_; }
  const std::string& session_id() const { return session_id_; }

 private:
  std::vector<std::string> protocol_error(ErrorCode code, const std::string& message,
                                          bool terminate);
  std::vector<std::string> on_hello(const jsonlite::Object& frame);
  std::vector<std::string> on_auth(const jsonlite::Object& frame);
  std::vector<std::string> on_request(const jsonlite::Object& frame);
  std::vector<std::string> on_close();

  const ApiRouter& router_;
  std::shared_ptr<SessionManager> sessions_;
  StreamState state_{StreamState::connecting};
  CallerIdentity identity_;
  std::string session_id_;
};

// Reads frames from in until EOF or the connection closes. Returns the number
// of frames handled.
uint64_t run_stream(std::istream& in, std::ostream& out, StreamConnection& conn);

}  // namespace keystone
