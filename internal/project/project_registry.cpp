#include "project_registry.hpp"

#include <algorithm>
#include <mutex>

namespace flowstore::project {

bool ProjectRegistry::Insert(ProjectStatePtr project) {
  std::unique_lock lock(mutex_);
  const auto       name = project->Name();
  return projects_.emplace(name, std::move(project)).second;
}

ProjectStatePtr ProjectRegistry::Find(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto             it = projects_.find(name);
  return it == projects_.end() ? nullptr : it->second;
}

bool ProjectRegistry::Contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return projects_.count(name) > 0;
}

// Sorted by name.
std::vector<ProjectStatePtr> ProjectRegistry::List() const {
  std::vector<ProjectStatePtr> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(projects_.size());
    for (const auto& [name, project] : projects_) result.push_back(project);
  }
  std::sort(result.begin(), result.end(), [](const ProjectStatePtr& a, const ProjectStatePtr& b) { return a->Name() < b->Name(); });
  return result;
}

std::vector<std::string> ProjectRegistry::Names() const {
  std::vector<std::string> names;
  {
    std::shared_lock lock(mutex_);
    names.reserve(projects_.size());
    for (const auto& [name, project] : projects_) names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::size_t ProjectRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return projects_.size();
}

} // namespace flowstore::project
