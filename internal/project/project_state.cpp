#include "project_state.hpp"

#include <mutex>

namespace flowstore::project {

ProjectState::ProjectState(flowstore::v1::Project metadata, std::shared_ptr<const flowstore::flow::FlowMap> flows)
    : name_(metadata.name()), metadata_(std::move(metadata)), flows_(std::move(flows)) {
}

ProjectSnapshot ProjectState::Snapshot() const {
  std::shared_lock lock(mutex_);
  return ProjectSnapshot{metadata_, flows_};
}

flowstore::v1::Project ProjectState::Metadata() const {
  std::shared_lock lock(mutex_);
  return metadata_;
}

std::shared_ptr<const flowstore::flow::FlowMap> ProjectState::Flows() const {
  std::shared_lock lock(mutex_);
  return flows_;
}

access::AccessDecision ProjectState::Authorize(const access::User& user, flowstore::v1::Capability capability) const {
  std::shared_lock lock(mutex_);
  return access::Authorize(&metadata_, user, capability);
}

void ProjectState::SetFlows(std::shared_ptr<const flowstore::flow::FlowMap> flows) {
  std::unique_lock lock(mutex_);
  flows_ = std::move(flows);
}

ProjectSnapshot ProjectState::Update(const UpdateFn& update, const PersistFn& persist, std::shared_ptr<const flowstore::flow::FlowMap> flows) {
  std::unique_lock lock(mutex_);

  auto next = metadata_;
  update(&next);
  persist(next);

  metadata_ = std::move(next);
  if (flows) {
    flows_ = std::move(flows);
  }
  return ProjectSnapshot{metadata_, flows_};
}

} // namespace flowstore::project
