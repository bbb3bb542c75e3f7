#pragma once

// keystone/rbac.hpp — Role-based access control for the API boundary.
//
// ROLES (ascending privilege):
//   viewer   — read sessions, executions and contracts.
//   member   — viewer + submit intents, write sessions, cancel, contracts.
//   operator — member + WAL export.
//   admin    — operator + recovery and contract sweeps.
//
// INVARIANTS:
//   - ApiRouter checks the route's permission before dispatch.
//   - Tenant isolation sits below RBAC: an admin of tenant A still cannot
//     address tenant B's records, because every key embeds the caller tenant.
//   - Fail closed: a permission missing from the table is admin-only, and an
//     unrecognized role string is viewer.

#include <cstdint>
#include <optional>
#include <string>

namespace keystone {
namespace rbac {

enum class Role : uint8_t {
  viewer    = 0,
  member    = 1,
  operator_ = 2,  // trailing underscore: keyword
  admin     = 3,
};

std::optional<Role> role_from_string(const std::string& s);
std::string role_to_string(Role r);

// Least privilege when s is empty or unknown.
Role role_or_viewer(const std::string& s);

enum class Permission {
  session_read,       // viewer+
  session_write,      // member+
  intent_submit,      // member+
  execution_read,     // viewer+
  execution_cancel,   // member+
  wal_export,         // operator+
  contract_read,      // viewer+
  contract_write,     // member+
  materialize,        // member+
  stats_read,         // viewer+
  recovery,           // admin
  sweep,              // admin
};

std::string permission_to_string(Permission p);

bool has_permission(Role role, Permission permission);

struct RbacDecision {
  bool        ok{false};
  Role        role{Role::viewer};
  std::string tenant_id;
  std::string denial_reason;  // set when !ok

  std::string to_json() const;
};

// Never throws. Denials are logged at info.
RbacDecision check(const std::string& tenant_id, Role role, Permission permission);

}  // namespace rbac
}  // namespace keystone
