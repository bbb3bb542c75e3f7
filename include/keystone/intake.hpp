#pragma once

// keystone/intake.hpp — Intent Intake, the public entry point.
//
// ADMISSION FLOW:
//   validate → (idempotency lookup) → session → idempotency claim →
//   SagaCoordinator::start
//
// IDEMPOTENCY:
//   The mapping (tenant_id, idempotency_key) → execution_id lives at
//   tenant/{t}/idempotency/{idempotency_digest(t, key)}. It is claimed with a
//   create-only write before the execution starts, so concurrent submitters of
//   one key converge on a single execution even across processes. Within a
//   process a striped lock table serializes submitters of the same key.
//   A claim whose start() failed is marked aborted and may be re-claimed.
//
// CONTEXT PRECEDENCE (highest first):
//   request parameters.context > caller identity metadata > session context >
//   platform defaults. tenant_id always comes from the caller identity.
//
// Validation failures are rejected here and never reach the WAL.

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "keystone/saga.hpp"
#include "keystone/session.hpp"
#include "keystone/state_surface.hpp"
#include "keystone/types.hpp"

namespace keystone {

// Already-authenticated caller. The core never verifies credentials.
struct CallerIdentity {
  std::string      tenant_id;
  std::string      user_id;
  std::string      role;       // rbac role name
  jsonlite::Object metadata;   // context overrides carried by the identity
};

CallerIdentity identity_from_json(const jsonlite::Object& o);

struct IntentSubmission {
  std::string      type;
  std::string      tenant_id;         // optional; must equal the caller tenant
  std::string      session_id;        // empty = create a session
  std::string      idempotency_key;   // empty = none
  jsonlite::Object parameters;
};

IntentSubmission submission_from_json(const jsonlite::Object& o);

struct Admission {
  std::string execution_id;
  std::string intent_id;
  std::string session_id;
  std::string status;      // "admitted", or the prior execution status on replay
  bool        replayed{false};

  jsonlite::Object to_json() const;
};

// Merges the four context layers. Exposed for the stream handshake and tests.
ExecutionContext resolve_context(const CallerIdentity& caller, const Session& session,
                                 const jsonlite::Object& parameters);

class IntentIntake {
 public:
  IntentIntake(std::shared_ptr<StateSurface> state, std::shared_ptr<SessionManager> sessions,
               std::shared_ptr<SagaCoordinator> saga);

  // Failure modes: validation_error (bad fields, tenant mismatch, unknown
  // type, invalid session), not_found (unknown session), transient_infra.
  std::optional<Admission> submit(const IntentSubmission& submission,
                                  const CallerIdentity& caller, Error* err);

 private:
  struct Claim {
    std::string execution_id;
    std::string intent_id;
    std::string state;          // "admitted" | "aborted"
    uint64_t    version{0};
  };

  std::optional<Admission> replay(const Claim& claim, const std::string& tenant_id,
                                  const std::string& session_id) const;
  std::optional<Claim> read_claim(const StateKey& key, Error* err) const;
  void abort_claim(const StateKey& key, const Claim& claim, uint64_t version);
  std::mutex& key_lock(const std::string& digest);

  std::shared_ptr<StateSurface> state_;
  std::shared_ptr<SessionManager> sessions_;
  std::shared_ptr<SagaCoordinator> saga_;
  std::array<std::mutex, 64> key_locks_;
};

}  // namespace keystone
