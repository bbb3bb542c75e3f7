#include "keystone/runtime.hpp"

#include <sstream>
#include <vector>

#include "keystone/observability.hpp"
#include "keystone/realms.hpp"
#include "keystone/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

namespace keystone {

std::unique_ptr<Runtime> Runtime::create(const CoreConfig& config, Error* err,
                                         RuntimeOverrides overrides) {
  const auto check = validate_config(config);
  if (!check.ok) {
    std::string msg = "invalid configuration:";
    for (const auto& e : check.errors) msg += " " + e + ";";
    fail(err, ErrorCode::config_invalid, msg);
    return nullptr;
  }
  if (auto level = log_level_from_string(config.log_level)) set_log_threshold(*level);

  std::unique_ptr<Runtime> rt(new Runtime(config));
  auto clock = overrides.clock ? overrides.clock : system_clock();

  std::shared_ptr<IStateBackend> backend = overrides.state_backend;
  if (!backend) {
    if (config.durable) {
      backend = std::make_shared<TieredStateBackend>(
          std::make_shared<MemoryStateBackend>(),
          std::make_shared<FileStateBackend>(config.data_dir, config.compression));
    } else {
      backend = std::make_shared<MemoryStateBackend>();
    }
  }
  std::shared_ptr<IWalStore> wal_store = overrides.wal_store;
  if (!wal_store) {
    if (config.durable) {
      wal_store = std::make_shared<FileWalStore>(config.data_dir, config.fsync_wal);
    } else {
      wal_store = std::make_shared<MemoryWalStore>();
    }
  }

  rt->state_ = std::make_shared<StateSurface>(backend, config.infra_retry, clock);
  rt->wal_ = std::make_shared<WriteAheadLog>(wal_store, config.infra_retry, clock);
  rt->sessions_ = std::make_shared<SessionManager>(rt->state_);
  rt->contracts_ = std::make_shared<BoundaryContractStore>(rt->state_, config.contract_ttl_ms);
  rt->materializer_ = std::make_shared<MaterializationAuthorizer>(rt->state_, rt->contracts_,
                                                                 config.materialization);

  rt->router_ = std::make_shared<CapabilityRouter>();
  const Error reg = overrides.register_realms
                        ? overrides.register_realms(*rt->router_, rt->materializer_)
                        : realms::register_content_realm(*rt->router_, rt->materializer_);
  if (!reg.ok()) {
    fail(err, ErrorCode::config_invalid, "realm registration failed: " + reg.message);
    return nullptr;
  }
  rt->router_->seal();

  rt->pool_ = std::make_shared<WorkerPool>(config.worker_threads);
  SagaOptions opts;
  opts.default_step_timeout_ms = config.step_timeout_ms;
  opts.worker_id = global_worker_identity().worker_id;
  rt->saga_ = std::make_shared<SagaCoordinator>(rt->wal_, rt->state_, rt->router_, rt->pool_, opts);
  rt->intake_ = std::make_shared<IntentIntake>(rt->state_, rt->sessions_, rt->saga_);

  if (overrides.recover_on_start) rt->startup_recovery_ = rt->saga_->recover_all();

  if (overrides.start_sweeper && config.sweep_interval_ms > 0) {
    rt->sweeper_ = std::make_unique<ContractSweeper>(
        rt->contracts_, std::chrono::milliseconds(config.sweep_interval_ms));
    rt->sweeper_->start();
  }

  log_event(LogLevel::info, "runtime",
            "started: state=" + rt->state_->backend_id() + " wal=" + rt->wal_->store_id() +
                " workers=" + std::to_string(config.worker_threads));
  return rt;
}

Runtime::~Runtime() { shutdown(); }

void Runtime::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  if (sweeper_) sweeper_->stop();
  if (pool_) pool_->shutdown();
}

std::string Runtime::health_json() const {
  const auto manifest = version::current_manifest(PROJECT_VERSION);
  std::ostringstream o;
  o << "{"
    << "\"ok\":" << (shut_down_ ? "false" : "true")
    << ",\"worker\":" << worker_identity_to_json(global_worker_identity())
    << ",\"pool\":" << worker_health_to_json(worker_health_snapshot(*pool_))
    << ",\"state_backend\":\"" << jsonlite::escape(state_->backend_id()) << "\""
    << ",\"wal_store\":\"" << jsonlite::escape(wal_->store_id()) << "\""
    << ",\"intents\":[";
  bool first = true;
  for (IntentType t : router_->registered_types()) {
    o << (first ? "" : ",") << "\"" << to_string(t) << "\"";
    first = false;
  }
  o << "]"
    << ",\"recovery\":" << startup_recovery_.to_json()
    << ",\"version\":" << version::manifest_to_json(manifest)
    << "}";
  return o.str();
}

std::string Runtime::stats_json(const std::string& tenant_id) const {
  constexpr size_t kRecentPerTenant = 20;
  std::vector<CoreEvent> recent;
  for (const auto& ev : global_core_stats().recent_events_snapshot()) {
    if (ev.tenant_id == tenant_id) recent.push_back(ev);
  }
  const size_t skip = recent.size() > kRecentPerTenant ? recent.size() - kRecentPerTenant : 0;

  std::ostringstream o;
  o << "{"
    << "\"core\":" << global_core_stats().to_json()
    << ",\"leases\":" << saga_->leases().size()
    << ",\"pool_task_failures\":" << pool_->task_failures()
    << ",\"recent_events\":[";
  for (size_t i = skip; i < recent.size(); ++i) {
    o << (i == skip ? "" : ",") << core_event_to_json(recent[i]);
  }
  o << "]";
  if (sweeper_) {
    o << ",\"sweeper\":{\"runs\":" << sweeper_->runs()
      << ",\"last\":" << sweeper_->last_report().to_json() << "}";
  }
  o << "}";
  return o.str();
}

}  // namespace keystone
