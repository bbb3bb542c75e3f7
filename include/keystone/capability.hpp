#pragma once

// keystone/capability.hpp — Realm capabilities and the Capability Router.
//
// CALL GRAPH (one-way):
//   SagaCoordinator → CapabilityRouter::resolve → StepSpec::handler
//   Handlers receive a read-only StepContext and return a StepResult. They
//   hold no coordinator handle and cannot append to the WAL or mutate the
//   execution; everything they influence flows through StepResult.
//
// REGISTRATION:
//   Capabilities are registered at startup, then the router is sealed.
//   Duplicate registration is config_invalid and the process refuses to start.
//   Lookups after seal() are lock-free reads of an immutable map.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "keystone/types.hpp"

namespace keystone {

struct StepContext {
  const ExecutionContext& context;
  const Intent&           intent;
  // Outputs of completed steps keyed by step name.
  const std::map<std::string, jsonlite::Object>& prior_outputs;
  std::string step_id;
  std::string step_name;
  uint32_t    attempt{1};
};

struct StepResult {
  bool             ok{true};
  jsonlite::Object output;
  ErrorCode        error_code{ErrorCode::none};
  std::string      error;
  bool             transient{false};   // retried up to max_attempts when the step is idempotent

  static StepResult success(jsonlite::Object out) {
    StepResult r;
    r.output = std::move(out);
    return r;
  }
  static StepResult failure(std::string message, bool transient_failure = false) {
    StepResult r;
    r.ok = false;
    r.error_code = ErrorCode::step_execution_error;
    r.error = std::move(message);
    r.transient = transient_failure;
    return r;
  }
};

using StepHandler = std::function<StepResult(const StepContext&)>;

struct StepSpec {
  std::string                name;
  StepHandler                handler;
  std::optional<StepHandler> compensation;   // reverses a completed step
  bool                       idempotent{false};
  uint32_t                   max_attempts{1};
  uint64_t                   timeout_ms{0};  // 0 = coordinator default
};

// Steps within one stage are independent and run concurrently; stages run in
// order.
struct Capability {
  std::string                        realm_name;
  std::vector<std::vector<StepSpec>> stages;

  size_t step_count() const;
  const StepSpec* find(const std::string& step_name) const;
};

class CapabilityRouter {
 public:
  // config_invalid on duplicate intent type, empty capability, duplicate step
  // names, missing handler, or registration after seal().
  Error register_capability(IntentType type, Capability capability);

  // capability_not_found when no realm registered the type.
  const Capability* resolve(IntentType type, Error* err) const;

  void seal() { sealed_.store(true, std::memory_order_release); }
  bool sealed() const { return sealed_.load(std::memory_order_acquire); }

  std::vector<IntentType> registered_types() const;

 private:
  mutable std::mutex mu_;
  std::atomic<bool> sealed_{false};
  std::map<IntentType, Capability> table_;
};

}  // namespace keystone
