#include "keystone/rbac.hpp"

#include <sstream>

#include "keystone/jsonlite.hpp"
#include "keystone/observability.hpp"

namespace keystone {
namespace rbac {

namespace {

struct RoleName {
  Role        role;
  const char* name;
};

constexpr RoleName kRoleNames[] = {
    {Role::viewer, "viewer"},
    {Role::member, "member"},
    {Role::operator_, "operator"},
    {Role::admin, "admin"},
};

struct PermissionRule {
  Permission  perm;
  Role        minimum_role;
  const char* name;
};

// Minimum role per permission. Anything not listed is admin-only.
constexpr PermissionRule kPermissionTable[] = {
    {Permission::session_read, Role::viewer, "session_read"},
    {Permission::session_write, Role::member, "session_write"},
    {Permission::intent_submit, Role::member, "intent_submit"},
    {Permission::execution_read, Role::viewer, "execution_read"},
    {Permission::execution_cancel, Role::member, "execution_cancel"},
    {Permission::wal_export, Role::operator_, "wal_export"},
    {Permission::contract_read, Role::viewer, "contract_read"},
    {Permission::contract_write, Role::member, "contract_write"},
    {Permission::materialize, Role::member, "materialize"},
    {Permission::stats_read, Role::viewer, "stats_read"},
    {Permission::recovery, Role::admin, "recovery"},
    {Permission::sweep, Role::admin, "sweep"},
};

}  // namespace

std::optional<Role> role_from_string(const std::string& s) {
  for (const auto& r : kRoleNames) {
    if (s == r.name) return r.role;
  }
  return std::nullopt;
}

std::string role_to_string(Role r) {
  for (const auto& n : kRoleNames) {
    if (n.role == r) return n.name;
  }
  return "unknown";
}

Role role_or_viewer(const std::string& s) { return role_from_string(s).value_or(Role::viewer); }

std::string permission_to_string(Permission p) {
  for (const auto& rule : kPermissionTable) {
    if (rule.perm == p) return rule.name;
  }
  return "unknown";
}

bool has_permission(Role role, Permission permission) {
  const auto level = static_cast<uint8_t>(role);
  for (const auto& rule : kPermissionTable) {
    if (rule.perm == permission) return level >= static_cast<uint8_t>(rule.minimum_role);
  }
  return role == Role::admin;
}

RbacDecision check(const std::string& tenant_id, Role role, Permission permission) {
  RbacDecision d;
  d.tenant_id = tenant_id;
  d.role = role;
  d.ok = has_permission(role, permission);
  if (!d.ok) {
    d.denial_reason = "role '" + role_to_string(role) + "' lacks permission " +
                      permission_to_string(permission);
    log_event(LogLevel::info, "rbac", "denied tenant " + tenant_id + ": " + d.denial_reason);
  }
  return d;
}

std::string RbacDecision::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"ok\":" << (ok ? "true" : "false")
    << ",\"role\":\"" << role_to_string(role) << "\""
    << ",\"tenant_id\":\"" << jsonlite::escape(tenant_id) << "\"";
  if (!denial_reason.empty()) {
    o << ",\"denial_reason\":\"" << jsonlite::escape(denial_reason) << "\"";
  }
  o << "}";
  return o.str();
}

}  // namespace rbac
}  // namespace keystone
