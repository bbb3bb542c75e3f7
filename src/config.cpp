#include "keystone/config.hpp"

#include <cstdlib>
#include <set>
#include <sstream>

#include "keystone/observability.hpp"

namespace keystone {

namespace {

constexpr uint64_t kDayMs = 24ULL * 3600 * 1000;

const std::set<std::string> kTopLevelKeys = {
  "data_dir", "durable", "worker_threads", "step_timeout_ms", "infra",
  "contract_ttl_ms", "sweep_interval_ms", "compression", "fsync_wal",
  "log_level", "materialization",
};

bool is_u64(const jsonlite::Object& o, const std::string& key) {
  auto it = o.find(key);
  return it != o.end() && std::holds_alternative<std::uint64_t>(it->second.v);
}

void read_policy(const jsonlite::Object& o, const std::string& where,
                 MaterializationPolicy* out, std::vector<std::string>* errors) {
  MaterializationPolicy p;
  for (const auto& [type, decision] : jsonlite::get_string_map(o, "decisions")) {
    auto d = materialization_decision_from_string(decision);
    if (!d) {
      errors->push_back(where + ".decisions." + type + ": unknown decision '" + decision + "'");
      continue;
    }
    p.decisions[type] = *d;
  }
  if (o.contains("default")) {
    auto d = materialization_decision_from_string(jsonlite::get_string(o, "default"));
    if (!d) errors->push_back(where + ".default: unknown decision");
    else p.default_decision = *d;
  }
  if (is_u64(o, "cache_ttl_days")) {
    p.cache_ttl_ms = jsonlite::get_u64(o, "cache_ttl_days") * kDayMs;
  }
  *out = std::move(p);
}

std::optional<uint64_t> env_u64(const char* name) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return std::nullopt;
  try {
    return static_cast<uint64_t>(std::stoull(e));
  } catch (const std::exception&) {
    log_event(LogLevel::warn, "config", std::string("ignoring non-numeric ") + name);
    return std::nullopt;
  }
}

std::string policy_to_json(const MaterializationPolicy& p) {
  jsonlite::Object o;
  jsonlite::Object d;
  for (const auto& [type, decision] : p.decisions) d[type] = jsonlite::make_string(to_string(decision));
  o["decisions"] = jsonlite::make_object(std::move(d));
  if (p.default_decision) o["default"] = jsonlite::make_string(to_string(*p.default_decision));
  if (p.cache_ttl_ms) o["cache_ttl_days"] = jsonlite::make_u64(*p.cache_ttl_ms / kDayMs);
  return jsonlite::to_json(o);
}

// Looks up one level. Returns true when the level decided.
bool decide_at(const MaterializationPolicy& p, const std::string& type,
               MaterializationDecision* decision) {
  auto it = p.decisions.find(type);
  if (it != p.decisions.end()) {
    *decision = it->second;
    return true;
  }
  if (p.default_decision) {
    *decision = *p.default_decision;
    return true;
  }
  return false;
}

}  // namespace

uint64_t RetryPolicy::delay_ms(uint32_t attempt) const {
  if (attempt >= 63) return backoff_max_ms;
  const uint64_t d = backoff_base_ms << attempt;
  if (backoff_base_ms != 0 && (d >> attempt) != backoff_base_ms) return backoff_max_ms;  // overflow
  return d < backoff_max_ms ? d : backoff_max_ms;
}

MaterializationPolicy platform_default_policy() {
  MaterializationPolicy p;
  for (const char* t : {"intent", "journey", "state_transition", "governance_decision"}) {
    p.decisions[t] = MaterializationDecision::persist;
  }
  p.default_decision = MaterializationDecision::discard;
  p.cache_ttl_ms = 30 * kDayMs;
  return p;
}

PolicyResolution resolve_materialization(const MaterializationPolicySet& set,
                                         const std::string& tenant_id,
                                         const std::string& solution_id,
                                         const std::string& representation_type) {
  PolicyResolution r;
  const MaterializationPolicy* chosen = nullptr;

  if (!solution_id.empty()) {
    auto it = set.solutions.find(tenant_id + "/" + solution_id);
    if (it != set.solutions.end() && decide_at(it->second, representation_type, &r.decision)) {
      chosen = &it->second;
      r.source = "solution";
    }
  }
  if (!chosen) {
    auto it = set.tenants.find(tenant_id);
    if (it != set.tenants.end() && decide_at(it->second, representation_type, &r.decision)) {
      chosen = &it->second;
      r.source = "tenant";
    }
  }
  if (!chosen) {
    chosen = &set.platform;
    r.source = "platform";
    if (!decide_at(set.platform, representation_type, &r.decision)) {
      r.decision = MaterializationDecision::discard;
    }
  }

  if (r.decision == MaterializationDecision::cache) {
    r.cache_ttl_ms = chosen->cache_ttl_ms.value_or(set.platform.cache_ttl_ms.value_or(30 * kDayMs));
  }
  return r;
}

CoreConfig default_config() {
  CoreConfig c;
  c.materialization.platform = platform_default_policy();
  return c;
}

bool load_config_json(const std::string& json_text, CoreConfig* config, Error* err) {
  std::optional<jsonlite::JsonError> jerr;
  const auto o = jsonlite::parse(json_text, &jerr);
  if (jerr) return fail(err, ErrorCode::json_parse_error, jerr->message);

  std::vector<std::string> errors;
  for (const auto& [k, v] : o) {
    if (!kTopLevelKeys.contains(k)) errors.push_back("unknown key: " + k);
  }

  CoreConfig c = *config;
  c.data_dir = jsonlite::get_string(o, "data_dir", c.data_dir);
  c.durable = jsonlite::get_bool(o, "durable", c.durable);
  c.worker_threads = static_cast<uint32_t>(jsonlite::get_u64(o, "worker_threads", c.worker_threads));
  c.step_timeout_ms = jsonlite::get_u64(o, "step_timeout_ms", c.step_timeout_ms);
  c.contract_ttl_ms = jsonlite::get_u64(o, "contract_ttl_ms", c.contract_ttl_ms);
  c.sweep_interval_ms = jsonlite::get_u64(o, "sweep_interval_ms", c.sweep_interval_ms);
  c.compression = jsonlite::get_string(o, "compression", c.compression);
  c.fsync_wal = jsonlite::get_bool(o, "fsync_wal", c.fsync_wal);
  c.log_level = jsonlite::get_string(o, "log_level", c.log_level);

  const auto infra = jsonlite::get_object(o, "infra");
  c.infra_retry.max_retries = static_cast<uint32_t>(jsonlite::get_u64(infra, "max_retries", c.infra_retry.max_retries));
  c.infra_retry.backoff_base_ms = jsonlite::get_u64(infra, "backoff_base_ms", c.infra_retry.backoff_base_ms);
  c.infra_retry.backoff_max_ms = jsonlite::get_u64(infra, "backoff_max_ms", c.infra_retry.backoff_max_ms);

  const auto mat = jsonlite::get_object(o, "materialization");
  if (mat.contains("platform")) {
    read_policy(jsonlite::get_object(mat, "platform"), "materialization.platform",
                &c.materialization.platform, &errors);
  }
  for (const auto& [tenant, v] : jsonlite::get_object(mat, "tenants")) {
    if (!jsonlite::is_object(v)) { errors.push_back("materialization.tenants." + tenant + ": not an object"); continue; }
    read_policy(std::get<jsonlite::Object>(v.v), "materialization.tenants." + tenant,
                &c.materialization.tenants[tenant], &errors);
  }
  for (const auto& [key, v] : jsonlite::get_object(mat, "solutions")) {
    if (key.find('/') == std::string::npos) {
      errors.push_back("materialization.solutions." + key + ": key must be tenant_id/solution_id");
      continue;
    }
    if (!jsonlite::is_object(v)) { errors.push_back("materialization.solutions." + key + ": not an object"); continue; }
    read_policy(std::get<jsonlite::Object>(v.v), "materialization.solutions." + key,
                &c.materialization.solutions[key], &errors);
  }

  if (!errors.empty()) {
    std::string msg;
    for (const auto& e : errors) msg += (msg.empty() ? "" : "; ") + e;
    return fail(err, ErrorCode::config_invalid, msg);
  }
  *config = std::move(c);
  return true;
}

void apply_env_overrides(CoreConfig* config) {
  if (const char* e = std::getenv("KEYSTONE_DATA_DIR"); e && e[0]) config->data_dir = e;
  if (auto v = env_u64("KEYSTONE_WORKER_THREADS")) config->worker_threads = static_cast<uint32_t>(*v);
  if (auto v = env_u64("KEYSTONE_STEP_TIMEOUT_MS")) config->step_timeout_ms = *v;
  if (auto v = env_u64("KEYSTONE_INFRA_MAX_RETRIES")) config->infra_retry.max_retries = static_cast<uint32_t>(*v);
  if (auto v = env_u64("KEYSTONE_CONTRACT_TTL_MS")) config->contract_ttl_ms = *v;
  if (auto v = env_u64("KEYSTONE_SWEEP_INTERVAL_MS")) config->sweep_interval_ms = *v;
  if (const char* e = std::getenv("KEYSTONE_COMPRESSION"); e && e[0]) config->compression = e;
  if (const char* e = std::getenv("KEYSTONE_FSYNC_WAL"); e && e[0]) config->fsync_wal = std::string(e) == "1";
  if (const char* e = std::getenv("KEYSTONE_LOG_LEVEL"); e && e[0]) config->log_level = e;
}

ConfigValidationResult validate_config(const CoreConfig& c) {
  ConfigValidationResult r;
  auto err = [&r](std::string m) { r.ok = false; r.errors.push_back(std::move(m)); };

  if (c.durable && c.data_dir.empty()) err("data_dir must be set when durable");
  if (c.worker_threads == 0 || c.worker_threads > 256) err("worker_threads must be in [1, 256]");
  if (c.step_timeout_ms == 0) err("step_timeout_ms must be > 0");
  if (c.infra_retry.max_retries > 16) err("infra.max_retries must be <= 16");
  if (c.infra_retry.backoff_base_ms > c.infra_retry.backoff_max_ms) {
    err("infra.backoff_base_ms must be <= infra.backoff_max_ms");
  }
  if (c.contract_ttl_ms == 0) err("contract_ttl_ms must be > 0");
  if (c.sweep_interval_ms == 0) err("sweep_interval_ms must be > 0");
  if (c.compression != "off" && c.compression != "zstd") err("compression must be 'off' or 'zstd'");
#if !defined(KEYSTONE_WITH_ZSTD)
  if (c.compression == "zstd") err("compression 'zstd' requested but binary built without zstd");
#endif
  if (!log_level_from_string(c.log_level)) err("log_level must be debug|info|warn|error");
  return r;
}

std::string config_to_json(const CoreConfig& c) {
  std::ostringstream o;
  o << "{\"data_dir\":\"" << jsonlite::escape(c.data_dir) << "\""
    << ",\"durable\":" << (c.durable ? "true" : "false")
    << ",\"worker_threads\":" << c.worker_threads
    << ",\"step_timeout_ms\":" << c.step_timeout_ms
    << ",\"infra\":{\"max_retries\":" << c.infra_retry.max_retries
    << ",\"backoff_base_ms\":" << c.infra_retry.backoff_base_ms
    << ",\"backoff_max_ms\":" << c.infra_retry.backoff_max_ms << "}"
    << ",\"contract_ttl_ms\":" << c.contract_ttl_ms
    << ",\"sweep_interval_ms\":" << c.sweep_interval_ms
    << ",\"compression\":\"" << jsonlite::escape(c.compression) << "\""
    << ",\"fsync_wal\":" << (c.fsync_wal ? "true" : "false")
    << ",\"log_level\":\"" << jsonlite::escape(c.log_level) << "\""
    << ",\"materialization\":{\"platform\":" << policy_to_json(c.materialization.platform)
    << ",\"tenants\":{";
  bool first = true;
  for (const auto& [t, p] : c.materialization.tenants) {
    o << (first ? "" : ",") << "\"" << jsonlite::escape(t) << "\":" << policy_to_json(p);
    first = false;
  }
  o << "},\"solutions\":{";
  first = true;
  for (const auto& [s, p] : c.materialization.solutions) {
    o << (first ? "" : ",") << "\"" << jsonlite::escape(s) << "\":" << policy_to_json(p);
    first = false;
  }
  o << "}}}";
  return o.str();
}

}  // namespace keystone
