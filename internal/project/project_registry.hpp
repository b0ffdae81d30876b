#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/project/project_state.hpp"

namespace flowstore::project {

/*
  name -> project. Concurrent lookups; inserts are exclusive and never
  replace an existing entry. Projects are never removed.
*/
class ProjectRegistry {
 public:
  // false if the name is already taken
  bool Insert(ProjectStatePtr project);

  ProjectStatePtr Find(const std::string& name) const;

  bool Contains(const std::string& name) const;

  std::vector<ProjectStatePtr> List() const;

  std::vector<std::string> Names() const;

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                        mutex_;
  std::unordered_map<std::string, ProjectStatePtr> projects_;
};

} // namespace flowstore::project
