#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "flowstore/v1.hpp"
#include "internal/access/user.hpp"
#include "internal/cache/properties_cache.hpp"
#include "internal/flow/flow_loader.hpp"
#include "internal/project/project_registry.hpp"
#include "internal/project/project_state.hpp"
#include "internal/storage/atomic_file_writer.hpp"

namespace flowstore::core {

struct ProjectManagerOptions {
  std::filesystem::path root;
  bool                  fsync{false};
  std::size_t           cache_max_entries{cache::PropertiesCache::kDefaultMaxEntries};
  std::chrono::seconds  cache_idle{cache::PropertiesCache::kDefaultIdle};
};

/*
  Project store over a single directory tree.

  Construction creates the root if needed and recovers every project
  from disk before returning. All public operations are thread-safe:
    - project creation is serialized store-wide
    - project.json writes are serialized store-wide
    - a project's metadata and flow set change together under that
      project's exclusive lock; other projects are unaffected

  Errors are reported with the exceptions in internal/util/errors.hpp.
*/
class ProjectManager {
 public:
  ProjectManager(ProjectManagerOptions options, std::shared_ptr<const flow::FlowLoader> loader);

  ProjectManager(const ProjectManager&)            = delete;
  ProjectManager& operator=(const ProjectManager&) = delete;

  project::ProjectSnapshot CreateProject(const std::string& name, const std::string& description, const access::User& creator);

  /*
    Loads flows from `staged_dir`, writes them into a new Install Version
    and moves `staged_dir` to <version>/src. Uploads and prunes of one
    project run one at a time; each new version sorts after the current one. The version becomes current
    only if `force` is set or no flow reported an error; otherwise
    util::UploadRejected is thrown and the project is left as it was.
  */
  project::ProjectSnapshot UploadProject(const std::string& name, const std::filesystem::path& staged_dir, const access::User& uploader,
                                         bool force);

  // Re-persists the in-memory metadata of `name`.
  void CommitProject(const std::string& name);

  /*
    Replaces the capabilities of `user_id` on `name`; an empty list removes
    the user. `admin` needs ADMIN and the project must keep at least one
    admin. Persisted before it becomes visible.
  */
  project::ProjectSnapshot SetUserPermission(const std::string& name, const access::User& admin, const std::string& user_id,
                                             const std::vector<flowstore::v1::Capability>& capabilities);

  // Projects `user` can read. Others are silently left out.
  std::vector<project::ProjectSnapshot> GetProjects(const access::User& user) const;

  // util::NotFound if absent, util::PermissionDenied if not readable.
  project::ProjectSnapshot GetProject(const std::string& name, const access::User& user) const;

  std::vector<std::string> GetProjectNames() const;

  // Parsed <source> from the current version's src/ directory, served through the cache.
  flowstore::v1::Properties GetProperties(const std::string& name, const std::string& source, const access::User& user);

  /*
    Removes superseded Install Versions (older than the current one),
    keeping the newest `keep` of them. Requires ADMIN. Returns removed
    directory names.
  */
  std::vector<std::string> PruneInstallVersions(const std::string& name, const access::User& user, std::size_t keep);

  const std::filesystem::path& RootPath() const {
    return options_.root;
  }

  const cache::PropertiesCache& Cache() const {
    return cache_;
  }

 private:
  project::ProjectStatePtr RequireProject(const std::string& name) const;

  void                  WriteProjectFile(const flowstore::v1::Project& metadata);
  void                  WriteFlowFile(const std::filesystem::path& directory, const flowstore::v1::Flow& flow);
  std::filesystem::path CreateInstallDirectory(const std::filesystem::path& project_dir, const std::string& current_version) const;
  void                  MoveSources(const std::filesystem::path& staged_dir, const std::filesystem::path& destination) const;

  ProjectManagerOptions                  options_;
  std::shared_ptr<const flow::FlowLoader> loader_;
  storage::AtomicFileWriter              writer_;
  cache::PropertiesCache                 cache_;
  project::ProjectRegistry               registry_;

  std::mutex create_mutex_;
  std::mutex metadata_write_mutex_;
};

} // namespace flowstore::core
