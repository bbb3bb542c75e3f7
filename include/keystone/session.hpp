#pragma once

// keystone/session.hpp — Session lifecycle.
//
// Sessions live at tenant/{tenant_id}/session/{session_id}/session. They are
// never deleted; invalidate() flips status and keeps the record readable.
// A session id looked up under the wrong tenant is not_found, never
// authorization_error, so callers cannot probe other tenants' ids.

#include <memory>
#include <optional>
#include <string>

#include "keystone/state_surface.hpp"
#include "keystone/types.hpp"

namespace keystone {

class SessionManager {
 public:
  explicit SessionManager(std::shared_ptr<StateSurface> state);

  // Always allocates a new session id.
  std::optional<Session> create_session(const std::string& tenant_id, const std::string& user_id,
                                        const jsonlite::Object& context, Error* err);

  std::optional<Session> get_session(const std::string& session_id, const std::string& tenant_id,
                                     Error* err) const;

  // Shallow merge of patch into context. With expected_version set, fails
  // with version_conflict when the stored record moved on.
  std::optional<Session> update_context(const std::string& session_id,
                                        const std::string& tenant_id,
                                        const jsonlite::Object& patch,
                                        std::optional<uint64_t> expected_version, Error* err);

  // Idempotent for already-invalid sessions (the first reason is kept).
  std::optional<Session> invalidate(const std::string& session_id, const std::string& tenant_id,
                                    const std::string& reason, Error* err);

 private:
  std::optional<Session> write(Session s, std::optional<uint64_t> expected_version, Error* err);

  std::shared_ptr<StateSurface> state_;
};

}  // namespace keystone
