#include "keystone/types.hpp"

#include <array>
#include <utility>

namespace keystone {

using jsonlite::make_bool;
using jsonlite::make_object;
using jsonlite::make_string;
using jsonlite::make_u64;

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

namespace {

struct ErrorCodeName {
  ErrorCode   code;
  const char* name;
};

constexpr ErrorCodeName kErrorCodeNames[] = {
  { ErrorCode::none,                 "" },
  { ErrorCode::validation_error,     "validation_error" },
  { ErrorCode::not_found,            "not_found" },
  { ErrorCode::capability_not_found, "capability_not_found" },
  { ErrorCode::authorization_error,  "authorization_error" },
  { ErrorCode::step_execution_error, "step_execution_error" },
  { ErrorCode::timeout,              "timeout" },
  { ErrorCode::transient_infra,      "transient_infra" },
  { ErrorCode::version_conflict,     "version_conflict" },
  { ErrorCode::state_corruption,     "state_corruption" },
  { ErrorCode::cancelled,            "cancelled" },
  { ErrorCode::config_invalid,       "config_invalid" },
  { ErrorCode::json_parse_error,     "json_parse_error" },
  { ErrorCode::internal,             "internal" },
};

struct IntentTypeName {
  IntentType  type;
  const char* name;
};

// Static catalog. Order defines all_intent_types().
constexpr IntentTypeName kIntentTypeNames[] = {
  { IntentType::ingest_file,          "ingest_file" },
  { IntentType::save_materialization, "save_materialization" },
  { IntentType::parse_content,        "parse_content" },
  { IntentType::extract_embeddings,   "extract_embeddings" },
  { IntentType::analyze_content,      "analyze_content" },
  { IntentType::assess_data_quality,  "assess_data_quality" },
  { IntentType::create_workflow,      "create_workflow" },
  { IntentType::generate_sop,         "generate_sop" },
  { IntentType::generate_report,      "generate_report" },
  { IntentType::generate_roadmap,     "generate_roadmap" },
  { IntentType::export_artifact,      "export_artifact" },
  { IntentType::echo,                 "echo" },
};

}  // namespace

std::string to_string(ErrorCode code) {
  for (const auto& row : kErrorCodeNames) {
    if (row.code == code) return row.name;
  }
  return "internal";
}

std::optional<ErrorCode> error_code_from_string(const std::string& s) {
  for (const auto& row : kErrorCodeNames) {
    if (s == row.name) return row.code;
  }
  return std::nullopt;
}

jsonlite::Object Error::to_json() const {
  jsonlite::Object o;
  o["code"] = make_string(to_string(code));
  o["message"] = make_string(message);
  return o;
}

bool fail(Error* err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
  return false;
}

// ---------------------------------------------------------------------------
// IntentType
// ---------------------------------------------------------------------------

std::string to_string(IntentType t) {
  for (const auto& row : kIntentTypeNames) {
    if (row.type == t) return row.name;
  }
  return "unknown";
}

std::optional<IntentType> intent_type_from_string(const std::string& s) {
  for (const auto& row : kIntentTypeNames) {
    if (s == row.name) return row.type;
  }
  return std::nullopt;
}

std::vector<IntentType> all_intent_types() {
  std::vector<IntentType> out;
  for (const auto& row : kIntentTypeNames) out.push_back(row.type);
  return out;
}

// ---------------------------------------------------------------------------
// Status enums
// ---------------------------------------------------------------------------

std::string to_string(SessionStatus s) {
  return s == SessionStatus::active ? "active" : "invalid";
}

std::string to_string(ExecutionStatus s) {
  switch (s) {
    case ExecutionStatus::pending:     return "pending";
    case ExecutionStatus::running:     return "running";
    case ExecutionStatus::completed:   return "completed";
    case ExecutionStatus::failed:      return "failed";
    case ExecutionStatus::compensated: return "compensated";
  }
  return "failed";
}

std::string to_string(StepStatus s) {
  switch (s) {
    case StepStatus::pending:      return "pending";
    case StepStatus::running:      return "running";
    case StepStatus::completed:    return "completed";
    case StepStatus::failed:       return "failed";
    case StepStatus::compensating: return "compensating";
    case StepStatus::compensated:  return "compensated";
  }
  return "failed";
}

std::string to_string(ContractStatus s) {
  switch (s) {
    case ContractStatus::pending: return "pending";
    case ContractStatus::active:  return "active";
    case ContractStatus::revoked: return "revoked";
    case ContractStatus::expired: return "expired";
  }
  return "revoked";
}

std::string to_string(MaterializationDecision d) {
  switch (d) {
    case MaterializationDecision::persist: return "persist";
    case MaterializationDecision::cache:   return "cache";
    case MaterializationDecision::discard: return "discard";
  }
  return "discard";
}

std::optional<SessionStatus> session_status_from_string(const std::string& s) {
  if (s == "active") return SessionStatus::active;
  if (s == "invalid") return SessionStatus::invalid;
  return std::nullopt;
}

std::optional<ExecutionStatus> execution_status_from_string(const std::string& s) {
  if (s == "pending") return ExecutionStatus::pending;
  if (s == "running") return ExecutionStatus::running;
  if (s == "completed") return ExecutionStatus::completed;
  if (s == "failed") return ExecutionStatus::failed;
  if (s == "compensated") return ExecutionStatus::compensated;
  return std::nullopt;
}

std::optional<StepStatus> step_status_from_string(const std::string& s) {
  if (s == "pending") return StepStatus::pending;
  if (s == "running") return StepStatus::running;
  if (s == "completed") return StepStatus::completed;
  if (s == "failed") return StepStatus::failed;
  if (s == "compensating") return StepStatus::compensating;
  if (s == "compensated") return StepStatus::compensated;
  return std::nullopt;
}

std::optional<ContractStatus> contract_status_from_string(const std::string& s) {
  if (s == "pending") return ContractStatus::pending;
  if (s == "active") return ContractStatus::active;
  if (s == "revoked") return ContractStatus::revoked;
  if (s == "expired") return ContractStatus::expired;
  return std::nullopt;
}

std::optional<MaterializationDecision> materialization_decision_from_string(const std::string& s) {
  if (s == "persist") return MaterializationDecision::persist;
  if (s == "cache") return MaterializationDecision::cache;
  if (s == "discard") return MaterializationDecision::discard;
  return std::nullopt;
}

bool is_terminal(ExecutionStatus s) {
  return s == ExecutionStatus::completed || s == ExecutionStatus::failed ||
         s == ExecutionStatus::compensated;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

jsonlite::Object session_to_json(const Session& s) {
  jsonlite::Object o;
  o["session_id"] = make_string(s.session_id);
  o["tenant_id"] = make_string(s.tenant_id);
  o["user_id"] = make_string(s.user_id);
  o["created_at"] = make_u64(s.created_at_ms);
  o["updated_at"] = make_u64(s.updated_at_ms);
  o["context"] = make_object(s.context);
  o["status"] = make_string(to_string(s.status));
  if (!s.invalidated_reason.empty()) o["invalidated_reason"] = make_string(s.invalidated_reason);
  return o;
}

bool session_from_json(const jsonlite::Object& o, Session* out) {
  using namespace jsonlite;
  Session s;
  s.session_id = get_string(o, "session_id");
  s.tenant_id = get_string(o, "tenant_id");
  s.user_id = get_string(o, "user_id");
  s.created_at_ms = get_u64(o, "created_at");
  s.updated_at_ms = get_u64(o, "updated_at");
  s.context = get_object(o, "context");
  s.invalidated_reason = get_string(o, "invalidated_reason");
  auto status = session_status_from_string(get_string(o, "status"));
  if (s.session_id.empty() || s.tenant_id.empty() || !status) return false;
  s.status = *status;
  *out = std::move(s);
  return true;
}

// ---------------------------------------------------------------------------
// Intent
// ---------------------------------------------------------------------------

jsonlite::Object intent_to_json(const Intent& i) {
  jsonlite::Object o;
  o["intent_id"] = make_string(i.intent_id);
  o["idempotency_key"] = make_string(i.idempotency_key);
  o["type"] = make_string(to_string(i.type));
  o["tenant_id"] = make_string(i.tenant_id);
  o["session_id"] = make_string(i.session_id);
  o["parameters"] = make_object(i.parameters);
  o["submitted_at"] = make_u64(i.submitted_at_ms);
  return o;
}

bool intent_from_json(const jsonlite::Object& o, Intent* out) {
  using namespace jsonlite;
  auto type = intent_type_from_string(get_string(o, "type"));
  if (!type) return false;
  Intent i;
  i.intent_id = get_string(o, "intent_id");
  i.idempotency_key = get_string(o, "idempotency_key");
  i.type = *type;
  i.tenant_id = get_string(o, "tenant_id");
  i.session_id = get_string(o, "session_id");
  i.parameters = get_object(o, "parameters");
  i.submitted_at_ms = get_u64(o, "submitted_at");
  *out = std::move(i);
  return true;
}

// ---------------------------------------------------------------------------
// ExecutionContext
// ---------------------------------------------------------------------------

jsonlite::Object context_to_json(const ExecutionContext& c) {
  jsonlite::Object o;
  o["tenant_id"] = make_string(c.tenant_id);
  o["session_id"] = make_string(c.session_id);
  o["user_id"] = make_string(c.user_id);
  o["solution_id"] = make_string(c.solution_id);
  o["locale"] = make_string(c.locale);
  o["attributes"] = make_object(c.attributes);
  return o;
}

ExecutionContext context_from_json(const jsonlite::Object& o) {
  ExecutionContext c;
  c.tenant_id = jsonlite::get_string(o, "tenant_id");
  c.session_id = jsonlite::get_string(o, "session_id");
  c.user_id = jsonlite::get_string(o, "user_id");
  c.solution_id = jsonlite::get_string(o, "solution_id");
  c.locale = jsonlite::get_string(o, "locale", "en");
  c.attributes = jsonlite::get_object(o, "attributes");
  return c;
}

// ---------------------------------------------------------------------------
// Execution / SagaStep
// ---------------------------------------------------------------------------

SagaStep* Execution::find_step(const std::string& step_id) {
  for (auto& s : steps) {
    if (s.step_id == step_id) return &s;
  }
  return nullptr;
}

const SagaStep* Execution::find_step(const std::string& step_id) const {
  for (const auto& s : steps) {
    if (s.step_id == step_id) return &s;
  }
  return nullptr;
}

jsonlite::Object step_to_json(const SagaStep& s) {
  jsonlite::Object o;
  o["step_id"] = make_string(s.step_id);
  o["execution_id"] = make_string(s.execution_id);
  o["capability_name"] = make_string(s.capability_name);
  o["stage"] = make_u64(s.stage);
  o["status"] = make_string(to_string(s.status));
  o["input"] = make_object(s.input);
  o["output"] = make_object(s.output);
  o["error_code"] = make_string(to_string(s.error_code));
  o["error"] = make_string(s.error);
  o["attempt_count"] = make_u64(s.attempt_count);
  o["completed_seq"] = make_u64(s.completed_seq);
  return o;
}

namespace {

bool step_from_json(const jsonlite::Object& o, SagaStep* out) {
  using namespace jsonlite;
  auto status = step_status_from_string(get_string(o, "status"));
  if (!status) return false;
  SagaStep s;
  s.step_id = get_string(o, "step_id");
  s.execution_id = get_string(o, "execution_id");
  s.capability_name = get_string(o, "capability_name");
  s.stage = static_cast<uint32_t>(get_u64(o, "stage"));
  s.status = *status;
  s.input = get_object(o, "input");
  s.output = get_object(o, "output");
  s.error_code = error_code_from_string(get_string(o, "error_code")).value_or(ErrorCode::internal);
  s.error = get_string(o, "error");
  s.attempt_count = static_cast<uint32_t>(get_u64(o, "attempt_count"));
  s.completed_seq = get_u64(o, "completed_seq");
  *out = std::move(s);
  return true;
}

}  // namespace

jsonlite::Object execution_to_json(const Execution& e) {
  jsonlite::Object o;
  o["execution_id"] = make_string(e.execution_id);
  o["intent_id"] = make_string(e.intent_id);
  o["tenant_id"] = make_string(e.tenant_id);
  o["session_id"] = make_string(e.session_id);
  o["intent"] = make_object(intent_to_json(e.intent));
  o["context"] = make_object(context_to_json(e.context));
  o["realm_name"] = make_string(e.realm_name);
  o["status"] = make_string(to_string(e.status));
  jsonlite::Array steps;
  for (const auto& s : e.steps) steps.push_back(make_object(step_to_json(s)));
  o["steps"] = jsonlite::make_array(std::move(steps));
  o["started_at"] = make_u64(e.started_at_ms);
  o["completed_at"] = make_u64(e.completed_at_ms);
  o["error_code"] = make_string(to_string(e.error_code));
  o["error"] = make_string(e.error);
  o["last_sequence_no"] = make_u64(e.last_sequence_no);
  o["cancel_requested"] = make_bool(e.cancel_requested);
  o["corrupted"] = make_bool(e.corrupted);
  return o;
}

bool execution_from_json(const jsonlite::Object& o, Execution* out) {
  using namespace jsonlite;
  auto status = execution_status_from_string(get_string(o, "status"));
  if (!status) return false;
  Execution e;
  e.execution_id = get_string(o, "execution_id");
  e.intent_id = get_string(o, "intent_id");
  e.tenant_id = get_string(o, "tenant_id");
  e.session_id = get_string(o, "session_id");
  if (e.execution_id.empty() || e.tenant_id.empty()) return false;
  if (!intent_from_json(get_object(o, "intent"), &e.intent)) return false;
  e.context = context_from_json(get_object(o, "context"));
  e.realm_name = get_string(o, "realm_name");
  e.status = *status;
  for (const auto& item : get_array(o, "steps")) {
    if (!is_object(item)) return false;
    SagaStep s;
    if (!step_from_json(std::get<Object>(item.v), &s)) return false;
    e.steps.push_back(std::move(s));
  }
  e.started_at_ms = get_u64(o, "started_at");
  e.completed_at_ms = get_u64(o, "completed_at");
  e.error_code = error_code_from_string(get_string(o, "error_code")).value_or(ErrorCode::internal);
  e.error = get_string(o, "error");
  e.last_sequence_no = get_u64(o, "last_sequence_no");
  e.cancel_requested = get_bool(o, "cancel_requested");
  e.corrupted = get_bool(o, "corrupted");
  *out = std::move(e);
  return true;
}

jsonlite::Object execution_status_json(const Execution& e) {
  jsonlite::Object o;
  o["execution_id"] = make_string(e.execution_id);
  o["intent_type"] = make_string(to_string(e.intent.type));
  o["status"] = make_string(to_string(e.status));
  o["started_at"] = make_u64(e.started_at_ms);
  o["completed_at"] = make_u64(e.completed_at_ms);
  o["last_sequence_no"] = make_u64(e.last_sequence_no);
  if (e.error_code != ErrorCode::none) {
    o["error"] = make_object(Error{e.error_code, e.error}.to_json());
  }
  if (e.cancel_requested) o["cancel_requested"] = make_bool(true);
  if (e.corrupted) o["corrupted"] = make_bool(true);
  jsonlite::Array steps;
  for (const auto& s : e.steps) {
    jsonlite::Object so;
    so["step_id"] = make_string(s.step_id);
    so["capability_name"] = make_string(s.capability_name);
    so["status"] = make_string(to_string(s.status));
    so["attempt_count"] = make_u64(s.attempt_count);
    if (s.error_code != ErrorCode::none) {
      so["error"] = make_object(Error{s.error_code, s.error}.to_json());
    }
    steps.push_back(make_object(std::move(so)));
  }
  o["steps"] = jsonlite::make_array(std::move(steps));
  return o;
}

// ---------------------------------------------------------------------------
// Contracts and materialization records
// ---------------------------------------------------------------------------

jsonlite::Object scope_to_json(const ContractScope& s) {
  jsonlite::Object o;
  if (!s.user_id.empty()) o["user_id"] = make_string(s.user_id);
  if (!s.session_id.empty()) o["session_id"] = make_string(s.session_id);
  if (!s.solution_id.empty()) o["solution_id"] = make_string(s.solution_id);
  return o;
}

ContractScope scope_from_json(const jsonlite::Object& o) {
  ContractScope s;
  s.user_id = jsonlite::get_string(o, "user_id");
  s.session_id = jsonlite::get_string(o, "session_id");
  s.solution_id = jsonlite::get_string(o, "solution_id");
  return s;
}

jsonlite::Object contract_to_json(const BoundaryContract& c) {
  jsonlite::Object o;
  o["contract_id"] = make_string(c.contract_id);
  o["tenant_id"] = make_string(c.tenant_id);
  o["artifact_reference"] = make_string(c.artifact_reference);
  o["status"] = make_string(to_string(c.status));
  o["scope"] = make_object(scope_to_json(c.scope));
  o["created_at"] = make_u64(c.created_at_ms);
  o["authorized_at"] = make_u64(c.authorized_at_ms);
  o["revoked_at"] = make_u64(c.revoked_at_ms);
  o["expired_at"] = make_u64(c.expired_at_ms);
  return o;
}

bool contract_from_json(const jsonlite::Object& o, BoundaryContract* out) {
  using namespace jsonlite;
  auto status = contract_status_from_string(get_string(o, "status"));
  if (!status) return false;
  BoundaryContract c;
  c.contract_id = get_string(o, "contract_id");
  c.tenant_id = get_string(o, "tenant_id");
  if (c.contract_id.empty() || c.tenant_id.empty()) return false;
  c.artifact_reference = get_string(o, "artifact_reference");
  c.status = *status;
  c.scope = scope_from_json(get_object(o, "scope"));
  c.created_at_ms = get_u64(o, "created_at");
  c.authorized_at_ms = get_u64(o, "authorized_at");
  c.revoked_at_ms = get_u64(o, "revoked_at");
  c.expired_at_ms = get_u64(o, "expired_at");
  *out = std::move(c);
  return true;
}

jsonlite::Object materialization_to_json(const MaterializationRecord& r) {
  jsonlite::Object o;
  o["record_id"] = make_string(r.record_id);
  o["contract_id"] = make_string(r.contract_id);
  o["tenant_id"] = make_string(r.tenant_id);
  o["artifact_reference"] = make_string(r.artifact_reference);
  o["representation_type"] = make_string(r.representation_type);
  o["decision"] = make_string(to_string(r.decision));
  o["stored_at"] = make_u64(r.stored_at_ms);
  o["expires_at"] = make_u64(r.expires_at_ms);
  return o;
}

bool materialization_from_json(const jsonlite::Object& o, MaterializationRecord* out) {
  using namespace jsonlite;
  auto decision = materialization_decision_from_string(get_string(o, "decision"));
  if (!decision) return false;
  MaterializationRecord r;
  r.record_id = get_string(o, "record_id");
  r.contract_id = get_string(o, "contract_id");
  r.tenant_id = get_string(o, "tenant_id");
  if (r.record_id.empty() || r.contract_id.empty() || r.tenant_id.empty()) return false;
  r.artifact_reference = get_string(o, "artifact_reference");
  r.representation_type = get_string(o, "representation_type");
  r.decision = *decision;
  r.stored_at_ms = get_u64(o, "stored_at");
  r.expires_at_ms = get_u64(o, "expires_at");
  *out = std::move(r);
  return true;
}

}  // namespace keystone
