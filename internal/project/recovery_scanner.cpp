#include "recovery_scanner.hpp"

#include <algorithm>
#include <system_error>

#include "internal/flow/flow_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/serialization/json_codec.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::project {

namespace fs = std::filesystem;

using flowstore::observability::IntField;
using flowstore::observability::StringField;
using namespace flowstore::storage::common;

namespace {

std::vector<fs::directory_entry> SortedEntries(const fs::path& directory) {
  std::vector<fs::directory_entry> entries;
  for (const auto& entry : fs::directory_iterator(directory)) entries.push_back(entry);
  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path().filename() < b.path().filename(); });
  return entries;
}

bool TryParse(const fs::path& path, flowstore::v1::Project* project) {
  try {
    serialization::ParseJsonFromFile(path, project);
    return true;
  } catch (const util::PersistenceError& e) {
    FLOWSTORE_LOG_ERROR("Project file couldn't be read", {StringField("path", path.string()), StringField("error", e.what())});
  } catch (const util::InvalidFormat& e) {
    FLOWSTORE_LOG_ERROR("Project file is malformed", {StringField("path", path.string()), StringField("error", e.what())});
  }
  return false;
}

} // namespace

RecoveryScanner::RecoveryScanner(fs::path root) : root_(std::move(root)) {
}

std::vector<ProjectStatePtr> RecoveryScanner::Scan() const {
  std::vector<ProjectStatePtr> projects;

  for (const auto& entry : SortedEntries(root_)) {
    std::error_code ec;
    if (!entry.is_directory(ec)) {
      FLOWSTORE_LOG_ERROR("Error loading project: not a directory", {StringField("path", entry.path().string())});
      continue;
    }

    if (auto project = ScanProject(entry.path())) {
      projects.push_back(std::move(project));
    }
  }

  FLOWSTORE_LOG_INFO("Recovery scan finished", {StringField("root", root_.string()), IntField("projects", static_cast<int64_t>(projects.size()))});
  return projects;
}

std::optional<flowstore::v1::Project> RecoveryScanner::LoadMetadata(const fs::path& project_dir) {
  const auto project_file = project_dir / kProjectFilename;
  const auto backup_file  = project_dir / (std::string(kProjectFilename) + kProjectBackupSuffix);

  std::error_code ec;
  flowstore::v1::Project metadata;
  const bool has_project = fs::exists(project_file, ec);
  if (has_project && TryParse(project_file, &metadata)) {
    return metadata;
  }

  if (fs::exists(backup_file, ec)) {
    FLOWSTORE_LOG_WARN("Loading project backup file", {StringField("path", backup_file.string())});
    metadata.Clear();
    if (TryParse(backup_file, &metadata)) return metadata;
    return std::nullopt;
  }

  if (has_project) {
    return std::nullopt;
  }

  FLOWSTORE_LOG_ERROR("Error loading project: project file not found",
                      {StringField("path", project_dir.string()), StringField("file", kProjectFilename)});
  return std::nullopt;
}

ProjectStatePtr RecoveryScanner::ScanProject(const fs::path& project_dir) const {
  auto metadata = LoadMetadata(project_dir);
  if (!metadata) {
    return nullptr;
  }

  const auto dir_name = project_dir.filename().string();
  if (metadata->name() != dir_name || !IsValidProjectName(metadata->name())) {
    FLOWSTORE_LOG_ERROR("Error loading project: name does not match directory",
                        {StringField("path", project_dir.string()), StringField("name", metadata->name())});
    return nullptr;
  }

  FLOWSTORE_LOG_INFO("Loading project", {StringField("project", metadata->name())});

  auto project = std::make_shared<ProjectState>(*metadata);

  const auto& source = metadata->source();
  if (source.empty()) {
    FLOWSTORE_LOG_INFO("No flows uploaded", {StringField("project", metadata->name())});
    return project;
  }

  const auto      version_dir = project_dir / source;
  std::error_code ec;
  if (!fs::exists(version_dir, ec)) {
    FLOWSTORE_LOG_ERROR("Project source dir doesn't exist", {StringField("path", version_dir.string())});
    return project;
  }
  if (!fs::is_directory(version_dir, ec)) {
    FLOWSTORE_LOG_ERROR("Project source dir is not a directory", {StringField("path", version_dir.string())});
    return project;
  }

  try {
    project->SetFlows(LoadFlows(version_dir, metadata->name()));
  } catch (const fs::filesystem_error& e) {
    FLOWSTORE_LOG_ERROR("Cannot list project source dir", {StringField("path", version_dir.string()), StringField("error", e.what())});
  }
  return project;
}

std::shared_ptr<const flowstore::flow::FlowMap> RecoveryScanner::LoadFlows(const fs::path& version_dir, const std::string& project_name) {
  std::vector<std::shared_ptr<flowstore::v1::Flow>> loaded;

  for (const auto& entry : SortedEntries(version_dir)) {
    if (!IsFlowFile(entry)) continue;

    auto flow = std::make_shared<flowstore::v1::Flow>();
    try {
      serialization::ParseJsonFromFile(entry.path(), flow.get());
    } catch (const util::PersistenceError& e) {
      FLOWSTORE_LOG_ERROR("Error reading flow file", {StringField("path", entry.path().string()), StringField("error", e.what())});
      continue;
    } catch (const util::InvalidFormat& e) {
      FLOWSTORE_LOG_ERROR("Error parsing flow file", {StringField("path", entry.path().string()), StringField("error", e.what())});
      continue;
    }

    if (flow->id().empty()) {
      FLOWSTORE_LOG_ERROR("Error loading flow: missing id", {StringField("path", entry.path().string()), StringField("project", project_name)});
      continue;
    }

    flowstore::flow::Initialize(flow.get());
    FLOWSTORE_LOG_DEBUG("Loaded flow", {StringField("project", project_name), StringField("flow", flow->id())});
    loaded.push_back(std::move(flow));
  }

  // id order, as uploads publish them ("a-b.flow" sorts before "a.flow")
  std::sort(loaded.begin(), loaded.end(), [](const auto& a, const auto& b) { return a->id() < b->id(); });

  auto flows = std::make_shared<flowstore::flow::FlowMap>();
  for (auto& flow : loaded) flows->Insert(std::move(flow));
  return flows;
}

} // namespace flowstore::project
