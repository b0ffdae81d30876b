#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "flowstore/v1.hpp"
#include "internal/access/access_gate.hpp"
#include "internal/flow/flow_map.hpp"

namespace flowstore::project {

/*
  Consistent copy of a project: metadata and the flow set that belongs to
  metadata.source(). Taken under the project's lock, so the pair never mixes
  two versions.
*/
struct ProjectSnapshot {
  flowstore::v1::Project                          metadata;
  std::shared_ptr<const flowstore::flow::FlowMap> flows;
};

/*
  In-memory state of one project.

  Readers take the shared lock and copy out. Writers take the exclusive
  lock, persist first, and publish only after the write succeeded, so a
  failed write leaves memory untouched.
*/
class ProjectState {
 public:
  using PersistFn = std::function<void(const flowstore::v1::Project&)>;
  using UpdateFn  = std::function<void(flowstore::v1::Project*)>;

  explicit ProjectState(flowstore::v1::Project metadata,
                        std::shared_ptr<const flowstore::flow::FlowMap> flows = std::make_shared<const flowstore::flow::FlowMap>());

  const std::string& Name() const {
    return name_;
  }

  ProjectSnapshot                                 Snapshot() const;
  flowstore::v1::Project                          Metadata() const;
  std::shared_ptr<const flowstore::flow::FlowMap> Flows() const;

  access::AccessDecision Authorize(const access::User& user, flowstore::v1::Capability capability) const;

  // Held by upload and prune for their whole run: Install Versions of
  // one project are created, published and removed one operation at a time.
  std::mutex& InstallMutex() const {
    return install_mutex_;
  }

  // Recovery only: publishes a fully loaded flow set in one step.
  void SetFlows(std::shared_ptr<const flowstore::flow::FlowMap> flows);

  /*
    Exclusive section: applies `update` to a copy of the metadata, hands the
    copy to `persist`, then publishes metadata (and `flows`, if given)
    together. Returns the published snapshot.
  */
  ProjectSnapshot Update(const UpdateFn& update, const PersistFn& persist,
                         std::shared_ptr<const flowstore::flow::FlowMap> flows = nullptr);

 private:
  const std::string name_;

  mutable std::mutex                              install_mutex_;
  mutable std::shared_mutex                       mutex_;
  flowstore::v1::Project                          metadata_;
  std::shared_ptr<const flowstore::flow::FlowMap> flows_;
};

using ProjectStatePtr = std::shared_ptr<ProjectState>;

} // namespace flowstore::project
