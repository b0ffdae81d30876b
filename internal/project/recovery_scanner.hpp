#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "internal/flow/flow_map.hpp"
#include "internal/project/project_state.hpp"

namespace flowstore::project {

/*
  Startup scan of the store root.

  <root>/<name>/project.json          metadata (project.json_old if the
                                      process died between the renames)
  <root>/<name>/<version>/<id>.flow   flows of the current version

  Bad entries are logged and skipped: a broken project never stops the
  others from loading, a broken flow never stops its siblings. Only an
  unreadable root throws.
*/
class RecoveryScanner {
 public:
  explicit RecoveryScanner(std::filesystem::path root);

  std::vector<ProjectStatePtr> Scan() const;

  // nullopt (logged) if neither the file nor its backup can be loaded
  static std::optional<flowstore::v1::Project> LoadMetadata(const std::filesystem::path& project_dir);

  static std::shared_ptr<const flowstore::flow::FlowMap> LoadFlows(const std::filesystem::path& version_dir, const std::string& project_name);

 private:
  ProjectStatePtr ScanProject(const std::filesystem::path& project_dir) const;

  std::filesystem::path root_;
};

} // namespace flowstore::project
