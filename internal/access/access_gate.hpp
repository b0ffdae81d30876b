#pragma once

#include <string>

#include "flowstore/v1.hpp"
#include "internal/access/user.hpp"

namespace flowstore::access {

enum class AccessDecision {
  kAuthorized,
  kDenied,
  kNotFound,
};

/*
  Single permission gate for every store operation.

  ADMIN satisfies any capability; otherwise the requested capability
  must be granted explicitly. A null project yields kNotFound so each
  caller picks its own disclosure policy (list filters silently, get
  reports the denial).
*/
AccessDecision Authorize(const flowstore::v1::Project* project, const User& user, flowstore::v1::Capability capability);

// READ is satisfied by READ or ADMIN.
inline bool CanRead(const flowstore::v1::Project& project, const User& user) {
  return Authorize(&project, user, flowstore::v1::CAPABILITY_READ) == AccessDecision::kAuthorized;
}

bool HasCapability(const flowstore::v1::Permission& permission, flowstore::v1::Capability capability);

void Grant(flowstore::v1::Project* project, const std::string& user_id, flowstore::v1::Capability capability);

} // namespace flowstore::access
