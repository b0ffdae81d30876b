#include "access_gate.hpp"

namespace flowstore::access {

using namespace flowstore::v1;

bool HasCapability(const Permission& permission, Capability capability) {
  for (const auto granted : permission.capabilities()) {
    if (granted == capability) return true;
  }
  return false;
}

AccessDecision Authorize(const Project* project, const User& user, Capability capability) {
  if (project == nullptr) {
    return AccessDecision::kNotFound;
  }

  const auto it = project->permissions().find(user.id);
  if (it == project->permissions().end()) {
    return AccessDecision::kDenied;
  }

  if (HasCapability(it->second, CAPABILITY_ADMIN) || HasCapability(it->second, capability)) {
    return AccessDecision::kAuthorized;
  }
  return AccessDecision::kDenied;
}

void Grant(Project* project, const std::string& user_id, Capability capability) {
  auto& permission = (*project->mutable_permissions())[user_id];
  if (!HasCapability(permission, capability)) {
    permission.add_capabilities(capability);
  }
}

} // namespace flowstore::access
