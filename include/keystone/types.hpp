#pragma once

// keystone/types.hpp — Core data structures for the Keystone execution core.
//
// ARCHITECTURE NOTES:
//
// TENANT ISOLATION:
//   Every entity carries tenant_id. No type in this header is ever looked up
//   without it; storage keys embed it as the first path component
//   (tenant/{tenant_id}/...), so a read under tenant A can never address a
//   record written under tenant B.
//
// OWNERSHIP:
//   All members are value-owned. Sessions, executions and contracts are
//   snapshots: mutating a copy never mutates the stored record.
//
// ERROR REPORTING:
//   Module boundaries never throw. Operations report failure through an
//   Error* out-parameter (nullable) plus an empty std::optional / false return.
//   ErrorCode is the closed taxonomy shared by every layer and by the API
//   status-code mapping.
//
// EXTENSION_POINT: intent_catalog
//   IntentType is a closed enum. Adding a realm capability for a new intent
//   requires a new enumerator plus a row in the string table in types.cpp.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "keystone/jsonlite.hpp"

namespace keystone {

enum class ErrorCode {
  none,
  validation_error,
  not_found,
  capability_not_found,
  authorization_error,
  step_execution_error,
  timeout,
  transient_infra,
  version_conflict,
  state_corruption,
  cancelled,
  config_invalid,
  json_parse_error,
  internal,
};

std::string to_string(ErrorCode code);
std::optional<ErrorCode> error_code_from_string(const std::string& s);

// Error value carried through Error* out-parameters.
struct Error {
  ErrorCode   code{ErrorCode::none};
  std::string message;

  bool ok() const { return code == ErrorCode::none; }
  jsonlite::Object to_json() const;
};

// Writes code + message to *err when err is non-null. Returns false so call
// sites can `return fail(err, ...)` from bool-returning functions.
bool fail(Error* err, ErrorCode code, std::string message);

// ---------------------------------------------------------------------------
// IntentType — closed catalog of intents the core can dispatch
// ---------------------------------------------------------------------------
enum class IntentType {
  ingest_file,
  save_materialization,
  parse_content,
  extract_embeddings,
  analyze_content,
  assess_data_quality,
  create_workflow,
  generate_sop,
  generate_report,
  generate_roadmap,
  export_artifact,
  echo,
};

std::string to_string(IntentType t);
std::optional<IntentType> intent_type_from_string(const std::string& s);
std::vector<IntentType> all_intent_types();

// ---------------------------------------------------------------------------
// Status enums
// ---------------------------------------------------------------------------
enum class SessionStatus { active, invalid };
enum class ExecutionStatus { pending, running, completed, failed, compensated };
enum class StepStatus { pending, running, completed, failed, compensating, compensated };
enum class ContractStatus { pending, active, revoked, expired };
enum class MaterializationDecision { persist, cache, discard };

std::string to_string(SessionStatus s);
std::string to_string(ExecutionStatus s);
std::string to_string(StepStatus s);
std::string to_string(ContractStatus s);
std::string to_string(MaterializationDecision d);

std::optional<SessionStatus> session_status_from_string(const std::string& s);
std::optional<ExecutionStatus> execution_status_from_string(const std::string& s);
std::optional<StepStatus> step_status_from_string(const std::string& s);
std::optional<ContractStatus> contract_status_from_string(const std::string& s);
std::optional<MaterializationDecision> materialization_decision_from_string(const std::string& s);

bool is_terminal(ExecutionStatus s);

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------
struct Session {
  std::string      session_id;
  std::string      tenant_id;
  std::string      user_id;             // empty = anonymous
  uint64_t         created_at_ms{0};
  uint64_t         updated_at_ms{0};
  jsonlite::Object context;
  SessionStatus    status{SessionStatus::active};
  std::string      invalidated_reason;
  uint64_t         version{0};          // State Surface version of the record
};

jsonlite::Object session_to_json(const Session& s);
bool session_from_json(const jsonlite::Object& o, Session* out);

// ---------------------------------------------------------------------------
// Intent — immutable once admitted
// ---------------------------------------------------------------------------
struct Intent {
  std::string      intent_id;
  std::string      idempotency_key;     // empty = none
  IntentType       type{IntentType::echo};
  std::string      tenant_id;
  std::string      session_id;
  jsonlite::Object parameters;
  uint64_t         submitted_at_ms{0};
};

jsonlite::Object intent_to_json(const Intent& i);
bool intent_from_json(const jsonlite::Object& o, Intent* out);

// ---------------------------------------------------------------------------
// ExecutionContext — explicit tenant/session context threaded to every step
// ---------------------------------------------------------------------------
// Resolved once at admission (see intake.hpp for the precedence order) and
// stored with the execution. Never read from ambient state.
struct ExecutionContext {
  std::string      tenant_id;
  std::string      session_id;
  std::string      user_id;
  std::string      solution_id;
  std::string      locale{"en"};
  jsonlite::Object attributes;
};

jsonlite::Object context_to_json(const ExecutionContext& c);
ExecutionContext context_from_json(const jsonlite::Object& o);

// ---------------------------------------------------------------------------
// Execution (saga instance) and SagaStep
// ---------------------------------------------------------------------------
struct SagaStep {
  std::string      step_id;
  std::string      execution_id;
  std::string      capability_name;     // step name within the capability
  uint32_t         stage{0};            // parallel group index
  StepStatus       status{StepStatus::pending};
  jsonlite::Object input;
  jsonlite::Object output;
  ErrorCode        error_code{ErrorCode::none};
  std::string      error;
  uint32_t         attempt_count{0};
  uint64_t         completed_seq{0};    // WAL seq of STEP_COMPLETED (compensation order)
};

struct Execution {
  std::string           execution_id;
  std::string           intent_id;
  std::string           tenant_id;
  std::string           session_id;
  Intent                intent;
  ExecutionContext      context;
  std::string           realm_name;
  ExecutionStatus       status{ExecutionStatus::pending};
  std::vector<SagaStep> steps;
  uint64_t              started_at_ms{0};
  uint64_t              completed_at_ms{0};
  ErrorCode             error_code{ErrorCode::none};
  std::string           error;
  uint64_t              last_sequence_no{0};
  bool                  cancel_requested{false};
  bool                  corrupted{false};

  bool terminal() const { return is_terminal(status); }
  SagaStep* find_step(const std::string& step_id);
  const SagaStep* find_step(const std::string& step_id) const;
};

jsonlite::Object step_to_json(const SagaStep& s);
jsonlite::Object execution_to_json(const Execution& e);
bool execution_from_json(const jsonlite::Object& o, Execution* out);

// Caller-facing view: status plus per-step error summary. No inputs/outputs.
jsonlite::Object execution_status_json(const Execution& e);

// ---------------------------------------------------------------------------
// StateRecord — versioned key/value record
// ---------------------------------------------------------------------------
struct StateRecord {
  std::string key;                      // full namespaced path
  std::string value;                    // canonical JSON text
  uint64_t    version{0};               // 1 on first write, +1 on every write
  uint64_t    expires_at_ms{0};         // 0 = no TTL
  uint64_t    updated_at_ms{0};

  bool expired(uint64_t now_ms) const { return expires_at_ms != 0 && now_ms >= expires_at_ms; }
};

// ---------------------------------------------------------------------------
// Boundary contracts and materialization
// ---------------------------------------------------------------------------
// Scope dimensions: empty string = dimension absent. On a contract an absent
// dimension is a wildcard; on a requester it matches only wildcards.
struct ContractScope {
  std::string user_id;
  std::string session_id;
  std::string solution_id;

  bool empty() const { return user_id.empty() && session_id.empty() && solution_id.empty(); }
};

jsonlite::Object scope_to_json(const ContractScope& s);
ContractScope scope_from_json(const jsonlite::Object& o);

struct BoundaryContract {
  std::string    contract_id;
  std::string    tenant_id;
  std::string    artifact_reference;
  ContractStatus status{ContractStatus::pending};
  ContractScope  scope;
  uint64_t       created_at_ms{0};
  uint64_t       authorized_at_ms{0};
  uint64_t       revoked_at_ms{0};
  uint64_t       expired_at_ms{0};
  uint64_t       version{0};
};

jsonlite::Object contract_to_json(const BoundaryContract& c);
bool contract_from_json(const jsonlite::Object& o, BoundaryContract* out);

struct MaterializationRecord {
  std::string             record_id;
  std::string             contract_id;
  std::string             tenant_id;
  std::string             artifact_reference;
  std::string             representation_type;
  MaterializationDecision decision{MaterializationDecision::persist};
  uint64_t                stored_at_ms{0};
  uint64_t                expires_at_ms{0};   // set for cache decisions
};

jsonlite::Object materialization_to_json(const MaterializationRecord& r);
bool materialization_from_json(const jsonlite::Object& o, MaterializationRecord* out);

}  // namespace keystone
