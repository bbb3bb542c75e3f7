#pragma once

// keystone/realms.hpp — Built-in content realm.
//
// The core ships one realm so the stream server can be driven end to end.
// Domain realms register the same way: build a Capability per IntentType and
// hand it to CapabilityRouter::register_capability before seal().
//
//   ingest_file           validate → {store_blob ∥ extract_metadata} → register
//   save_materialization  materialize (through MaterializationAuthorizer)
//   echo                  echo
//
// Handlers see only their StepContext plus collaborators captured at
// registration; none holds a coordinator handle.

#include <memory>

#include "keystone/capability.hpp"
#include "keystone/contracts.hpp"

namespace keystone {
namespace realms {

inline constexpr const char* kContentRealm = "content";

// Upper bound on inline file content accepted by ingest_file.
inline constexpr size_t kMaxInlineContentBytes = 16u * 1024 * 1024;

Capability ingest_file_capability();
Capability save_materialization_capability(std::shared_ptr<MaterializationAuthorizer> authorizer);
Capability echo_capability();

// Registers all three. Returns the first registration error.
Error register_content_realm(CapabilityRouter& router,
                             std::shared_ptr<MaterializationAuthorizer> authorizer);

}  // namespace realms
}  // namespace keystone
