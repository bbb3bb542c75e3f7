#pragma once

// keystone/config.hpp — Runtime configuration.
//
// Sources, lowest to highest precedence:
//   1. default_config()
//   2. JSON config file (load_config_json)
//   3. KEYSTONE_* environment variables (apply_env_overrides)
//
// validate_config() runs after all three and is the single gate: the CLI
// refuses to start on any error it reports.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "keystone/types.hpp"

namespace keystone {

// Bounded exponential backoff for TransientInfraError at the State Surface and
// WAL boundary. delay(attempt) = min(base * 2^attempt, max).
struct RetryPolicy {
  uint32_t max_retries{4};
  uint64_t backoff_base_ms{10};
  uint64_t backoff_max_ms{1000};

  uint64_t delay_ms(uint32_t attempt) const;
};

// ---------------------------------------------------------------------------
// Materialization policy
// ---------------------------------------------------------------------------
// A policy maps representation types to decisions. An absent entry falls
// through to default_decision; an absent default falls through to the next
// policy level (solution → tenant → platform).
struct MaterializationPolicy {
  std::map<std::string, MaterializationDecision> decisions;
  std::optional<MaterializationDecision>         default_decision;
  std::optional<uint64_t>                        cache_ttl_ms;
};

struct MaterializationPolicySet {
  MaterializationPolicy                        platform;
  std::map<std::string, MaterializationPolicy> tenants;    // key: tenant_id
  std::map<std::string, MaterializationPolicy> solutions;  // key: tenant_id + "/" + solution_id
};

// Persist intent/journey/state_transition/governance_decision, discard
// everything else, cache TTL 30 days.
MaterializationPolicy platform_default_policy();

struct PolicyResolution {
  MaterializationDecision decision{MaterializationDecision::discard};
  uint64_t                cache_ttl_ms{0};
  std::string             source;   // "solution" | "tenant" | "platform"
};

PolicyResolution resolve_materialization(const MaterializationPolicySet& set,
                                         const std::string& tenant_id,
                                         const std::string& solution_id,
                                         const std::string& representation_type);

// ---------------------------------------------------------------------------
// CoreConfig
// ---------------------------------------------------------------------------
struct CoreConfig {
  std::string data_dir{".keystone"};
  bool        durable{true};            // false = hot store and in-memory WAL only
  uint32_t    worker_threads{4};
  uint64_t    step_timeout_ms{30000};
  RetryPolicy infra_retry;
  uint64_t    contract_ttl_ms{30ULL * 24 * 3600 * 1000};
  uint64_t    sweep_interval_ms{60000};
  std::string compression{"off"};       // "off" | "zstd"
  bool        fsync_wal{false};
  std::string log_level{"warn"};
  MaterializationPolicySet materialization;
};

CoreConfig default_config();

// Overlays the keys present in json_text onto *config. Unknown keys are
// reported as errors. Never throws.
bool load_config_json(const std::string& json_text, CoreConfig* config, Error* err);

// KEYSTONE_DATA_DIR, KEYSTONE_WORKER_THREADS, KEYSTONE_STEP_TIMEOUT_MS,
// KEYSTONE_INFRA_MAX_RETRIES, KEYSTONE_CONTRACT_TTL_MS,
// KEYSTONE_SWEEP_INTERVAL_MS, KEYSTONE_COMPRESSION, KEYSTONE_FSYNC_WAL,
// KEYSTONE_LOG_LEVEL.
void apply_env_overrides(CoreConfig* config);

struct ConfigValidationResult {
  bool ok{true};
  std::vector<std::string> errors;
};

ConfigValidationResult validate_config(const CoreConfig& config);

std::string config_to_json(const CoreConfig& config);

}  // namespace keystone
