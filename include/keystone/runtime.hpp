#pragma once

// keystone/runtime.hpp — Process wiring of the execution core.
//
// STARTUP ORDER:
//   1. validate_config (refuse to start on any error)
//   2. State Surface backend: tiered(memory, local_fs) when durable, else memory
//   3. WAL store: local_fs when durable, else memory
//   4. realms registered, router sealed (duplicates → config_invalid)
//   5. worker pool, coordinator, intake
//   6. recover_all(): every non-terminal execution found in the WAL is driven
//      to a terminal state before the first request is served
//   7. contract sweeper started
//
// Shutdown is the reverse: sweeper stopped, pool drained and joined.

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "keystone/capability.hpp"
#include "keystone/clock.hpp"
#include "keystone/config.hpp"
#include "keystone/contracts.hpp"
#include "keystone/intake.hpp"
#include "keystone/saga.hpp"
#include "keystone/session.hpp"
#include "keystone/state_backend.hpp"
#include "keystone/state_surface.hpp"
#include "keystone/wal.hpp"
#include "keystone/worker.hpp"

namespace keystone {

using RealmRegistrar =
    std::function<Error(CapabilityRouter&, std::shared_ptr<MaterializationAuthorizer>)>;

// Test and embedding seams. Unset members take the config-driven default.
struct RuntimeOverrides {
  std::shared_ptr<IStateBackend> state_backend;
  std::shared_ptr<IWalStore>     wal_store;
  std::shared_ptr<Clock>         clock;
  RealmRegistrar                 register_realms;   // default: content realm
  bool                           recover_on_start{true};
  bool                           start_sweeper{true};
};

class Runtime {
 public:
  ~Runtime();
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  // config_invalid when validation or realm registration fails.
  static std::unique_ptr<Runtime> create(const CoreConfig& config, Error* err,
                                         RuntimeOverrides overrides = {});

  void shutdown();

  const CoreConfig& config() const { return config_; }
  std::shared_ptr<StateSurface> state() const { return state_; }
  std::shared_ptr<WriteAheadLog> wal() const { return wal_; }
  std::shared_ptr<SessionManager> sessions() const { return sessions_; }
  std::shared_ptr<SagaCoordinator> saga() const { return saga_; }
  std::shared_ptr<IntentIntake> intake() const { return intake_; }
  std::shared_ptr<BoundaryContractStore> contracts() const { return contracts_; }
  std::shared_ptr<MaterializationAuthorizer> materializer() const { return materializer_; }
  std::shared_ptr<const CapabilityRouter> router() const { return router_; }
  std::shared_ptr<WorkerPool> pool() const { return pool_; }
  ContractSweeper* sweeper() const { return sweeper_.get(); }
  const RecoveryReport& startup_recovery() const { return startup_recovery_; }

  // {"ok", "worker", "pool", "state_backend", "wal_store", "intents", "recovery", "version"}
  std::string health_json() const;

  // Process counters plus the most recent core events of one tenant.
  std::string stats_json(const std::string& tenant_id) const;

 private:
  explicit Runtime(CoreConfig config) : config_(std::move(config)) {}

  CoreConfig config_;
  std::shared_ptr<StateSurface> state_;
  std::shared_ptr<WriteAheadLog> wal_;
  std::shared_ptr<SessionManager> sessions_;
  std::shared_ptr<CapabilityRouter> router_;
  std::shared_ptr<WorkerPool> pool_;
  std::shared_ptr<SagaCoordinator> saga_;
  std::shared_ptr<IntentIntake> intake_;
  std::shared_ptr<BoundaryContractStore> contracts_;
  std::shared_ptr<MaterializationAuthorizer> materializer_;
  std::unique_ptr<ContractSweeper> sweeper_;
  RecoveryReport startup_recovery_;
  bool shut_down_{false};
};

}  // namespace keystone
