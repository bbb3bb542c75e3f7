#include "keystone/capability.hpp"

#include <set>

#include "keystone/observability.hpp"

namespace keystone {

size_t Capability::step_count() const {
  size_t n = 0;
  for (const auto& stage : stages) n += stage.size();
  return n;
}

const StepSpec* Capability::find(const std::string& step_name) const {
  for (const auto& stage : stages) {
    for (const auto& spec : stage) {
      if (spec.name == step_name) return &spec;
    }
  }
  return nullptr;
}

Error CapabilityRouter::register_capability(IntentType type, Capability capability) {
  const std::string name = to_string(type);
  if (sealed()) {
    return Error{ErrorCode::config_invalid, "router sealed; cannot register " + name};
  }
  if (capability.realm_name.empty()) {
    return Error{ErrorCode::config_invalid, name + ": realm_name required"};
  }
  if (capability.step_count() == 0) {
    return Error{ErrorCode::config_invalid, name + ": capability has no steps"};
  }
  std::set<std::string> seen;
  for (const auto& stage : capability.stages) {
    if (stage.empty()) return Error{ErrorCode::config_invalid, name + ": empty stage"};
    for (const auto& spec : stage) {
      if (spec.name.empty() || spec.name.find('/') != std::string::npos) {
        return Error{ErrorCode::config_invalid, name + ": invalid step name '" + spec.name + "'"};
      }
      if (!spec.handler) return Error{ErrorCode::config_invalid, name + "." + spec.name + ": no handler"};
      if (spec.max_attempts == 0) {
        return Error{ErrorCode::config_invalid, name + "." + spec.name + ": max_attempts must be >= 1"};
      }
      if (!seen.insert(spec.name).second) {
        return Error{ErrorCode::config_invalid, name + ": duplicate step '" + spec.name + "'"};
      }
    }
  }

  std::lock_guard<std::mutex> lk(mu_);
  auto it = table_.find(type);
  if (it != table_.end()) {
    return Error{ErrorCode::config_invalid,
                 "duplicate capability for " + name + ": realms '" + it->second.realm_name +
                     "' and '" + capability.realm_name + "'"};
  }
  log_event(LogLevel::debug, "router", name + " -> " + capability.realm_name);
  table_.emplace(type, std::move(capability));
  return Error{};
}

const Capability* CapabilityRouter::resolve(IntentType type, Error* err) const {
  std::unique_lock<std::mutex> lk(mu_, std::defer_lock);
  if (!sealed()) lk.lock();
  auto it = table_.find(type);
  if (it == table_.end()) {
    fail(err, ErrorCode::capability_not_found, "no capability registered for " + to_string(type));
    return nullptr;
  }
  return &it->second;
}

std::vector<IntentType> CapabilityRouter::registered_types() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<IntentType> out;
  for (const auto& [type, _] : table_) out.push_back(type);
  return out;
}

}  // namespace keystone
