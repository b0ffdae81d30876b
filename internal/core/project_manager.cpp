#include "project_manager.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_set>
#include <utility>

#include "internal/access/access_gate.hpp"
#include "internal/flow/flow_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/project/recovery_scanner.hpp"
#include "internal/props/properties_parser.hpp"
#include "internal/serialization/json_codec.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowstore::core {

namespace fs = std::filesystem;

using namespace flowstore::v1;
using flowstore::access::AccessDecision;
using flowstore::observability::BoolField;
using flowstore::observability::IntField;
using flowstore::observability::SpanScope;
using flowstore::observability::StringField;
using flowstore::project::ProjectSnapshot;
using flowstore::project::ProjectState;
using flowstore::project::ProjectStatePtr;
using namespace flowstore::storage::common;

namespace {

// Same-millisecond uploads to one project step the timestamp forward.
constexpr int kInstallDirectoryAttempts = 100;

bool IsBlank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

void PrepareRoot(const fs::path& root) {
  std::error_code ec;
  if (fs::exists(root, ec)) {
    if (!fs::is_directory(root, ec)) {
      throw util::PersistenceError("Project directory " + root.string() + " is really a file");
    }
    return;
  }

  FLOWSTORE_LOG_INFO("Project directory doesn't exist, creating", {StringField("root", root.string())});
  fs::create_directories(root, ec);
  if (ec) {
    throw util::PersistenceError("Cannot create project directory " + root.string() + ": " + ec.message());
  }
}

} // namespace

ProjectManager::ProjectManager(ProjectManagerOptions options, std::shared_ptr<const flow::FlowLoader> loader)
    : options_(std::move(options)),
      loader_(std::move(loader)),
      writer_(options_.fsync),
      cache_(options_.cache_max_entries, options_.cache_idle) {
  if (!loader_) {
    throw std::invalid_argument("ProjectManager requires a flow loader");
  }

  FLOWSTORE_LOG_INFO("Using project directory", {StringField("root", options_.root.string())});
  PrepareRoot(options_.root);

  project::RecoveryScanner scanner(options_.root);
  for (auto& project : scanner.Scan()) {
    if (!registry_.Insert(project)) {
      FLOWSTORE_LOG_ERROR("Duplicate project skipped during recovery", {StringField("project", project->Name())});
    }
  }
}

ProjectStatePtr ProjectManager::RequireProject(const std::string& name) const {
  auto project = registry_.Find(name);
  if (!project) {
    throw util::NotFound("Project " + name + " not found");
  }
  return project;
}

// ------------------------------------------------------------
// Persistence
// ------------------------------------------------------------

void ProjectManager::WriteProjectFile(const Project& metadata) {
  const auto json = serialization::ToJson(metadata);

  std::lock_guard lock(metadata_write_mutex_);
  FLOWSTORE_LOG_INFO("Writing project file", {StringField("project", metadata.name())});
  writer_.Persist(ProjectPath(options_.root, metadata.name()), kProjectFilename, json, kProjectBackupSuffix);
}

void ProjectManager::WriteFlowFile(const fs::path& directory, const Flow& flow) {
  FLOWSTORE_LOG_INFO("Writing flow file", {StringField("directory", directory.string()), StringField("flow", flow.id())});
  writer_.Persist(directory, FlowFilename(flow.id()).string(), serialization::ToJson(flow), kFlowBackupSuffix);
}

fs::path ProjectManager::CreateInstallDirectory(const fs::path& project_dir, const std::string& current_version) const {
  auto stamp = util::Now();

  // never sort below the published version, even if the clock stepped back
  if (auto current = util::ParseInstallVersion(current_version); current && *current >= stamp) {
    stamp = *current + std::chrono::milliseconds(1);
  }
  for (int attempt = 0; attempt < kInstallDirectoryAttempts; ++attempt) {
    const auto      dir = project_dir / util::FormatInstallVersion(stamp);
    std::error_code ec;
    if (fs::create_directory(dir, ec)) {
      return dir;
    }
    if (ec) {
      throw util::PersistenceError("Cannot create directory " + dir.string() + ": " + ec.message());
    }
    stamp += std::chrono::milliseconds(1);
  }
  throw util::PersistenceError("Cannot create install directory in " + project_dir.string());
}

void ProjectManager::MoveSources(const fs::path& staged_dir, const fs::path& destination) const {
  std::error_code ec;
  fs::rename(staged_dir, destination, ec);
  if (!ec) {
    return;
  }

  if (ec != std::errc::cross_device_link) {
    throw util::PersistenceError("Cannot move " + staged_dir.string() + " to " + destination.string() + ": " + ec.message());
  }

  // rename cannot cross filesystems
  try {
    fs::copy(staged_dir, destination, fs::copy_options::recursive);
  } catch (const fs::filesystem_error& e) {
    throw util::PersistenceError("Cannot copy " + staged_dir.string() + " to " + destination.string(), e);
  }
  fs::remove_all(staged_dir, ec);
  if (ec) {
    FLOWSTORE_LOG_WARN("Cannot remove staged directory", {StringField("path", staged_dir.string()), StringField("error", ec.message())});
  }
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

ProjectSnapshot ProjectManager::CreateProject(const std::string& name, const std::string& description, const access::User& creator) {
  SpanScope span("ProjectManager.CreateProject");
  span.SetAttribute("project", name);

  std::lock_guard lock(create_mutex_);

  if (IsBlank(name)) {
    throw util::ValidationError("Project name cannot be empty.");
  }
  if (IsBlank(description)) {
    throw util::ValidationError("Description cannot be empty.");
  }
  if (creator.id.empty()) {
    throw util::ValidationError("Valid creator user must be set.");
  }
  if (!IsValidProjectName(name)) {
    throw util::ValidationError("Project names must start with a letter, followed by any number of letters, digits, '-' or '_'.");
  }

  const auto      project_dir = ProjectPath(options_.root, name);
  std::error_code ec;
  if (registry_.Contains(name) || fs::exists(project_dir, ec)) {
    throw util::AlreadyExists("Project " + name + " already exists.");
  }

  if (!fs::create_directory(project_dir, ec)) {
    throw util::PersistenceError("Project directory " + name + " cannot be created in " + options_.root.string() +
                                 (ec ? ": " + ec.message() : std::string()));
  }

  const auto now = util::ToUnixMillis(util::Now());

  Project metadata;
  metadata.set_name(name);
  metadata.set_description(description);
  metadata.set_create_time_ms(now);
  metadata.set_last_modified_time_ms(now);
  metadata.set_last_modified_user(creator.id);
  access::Grant(&metadata, creator.id, CAPABILITY_ADMIN);

  FLOWSTORE_LOG_INFO("Creating project", {StringField("project", name), StringField("user", creator.id)});
  try {
    WriteProjectFile(metadata);
  } catch (const util::PersistenceError& e) {
    span.RecordException(e.what());
    fs::remove_all(project_dir, ec);
    throw;
  }

  auto project = std::make_shared<ProjectState>(metadata);
  registry_.Insert(project);
  return project->Snapshot();
}

// ------------------------------------------------------------
// Upload
// ------------------------------------------------------------

ProjectSnapshot ProjectManager::UploadProject(const std::string& name, const fs::path& staged_dir, const access::User& uploader, bool force) {
  SpanScope span("ProjectManager.UploadProject");
  span.SetAttribute("project", name);

  FLOWSTORE_LOG_INFO("Uploading files", {StringField("project", name), StringField("user", uploader.id), BoolField("force", force)});

  auto project = RequireProject(name);
  if (project->Authorize(uploader, CAPABILITY_WRITE) != AccessDecision::kAuthorized) {
    throw util::PermissionDenied("Permission denied. Do not have write access.");
  }

  std::error_code ec;
  if (!fs::is_directory(staged_dir, ec)) {
    throw util::ValidationError("Upload directory " + staged_dir.string() + " does not exist");
  }

  // one upload or prune per project at a time; the next one starts from
  // this one's published (or rejected) state
  std::lock_guard install_lock(project->InstallMutex());

  // ------------------------------------------------------------
  // 1. load + validate
  // ------------------------------------------------------------
  flow::FlowLoadResult loaded;
  try {
    loaded = loader_->Load(staged_dir);
  } catch (const fs::filesystem_error& e) {
    throw util::PersistenceError("Cannot read upload directory " + staged_dir.string(), e);
  }

  // a job shared by several flows reports its problems once
  std::vector<std::string>        errors;
  std::unordered_set<std::string> seen_errors;
  const auto                      add_error = [&](const std::string& error) {
    if (seen_errors.insert(error).second) errors.push_back(error);
  };
  for (const auto& error : loaded.errors) add_error(error);
  for (const auto& flow : loaded.flows) {
    for (const auto& error : flow.errors()) add_error(error);
  }

  // id order, the order recovery rebuilds the flow map in
  std::sort(loaded.flows.begin(), loaded.flows.end(), [](const Flow& a, const Flow& b) { return a.id() < b.id(); });

  // ------------------------------------------------------------
  // 2. new Install Version with one file per flow
  // ------------------------------------------------------------
  const auto project_dir = ProjectPath(options_.root, name);
  const auto install_dir = CreateInstallDirectory(project_dir, project->Metadata().source());
  const auto version     = install_dir.filename().string();
  span.SetAttribute("version", version);

  auto flows = std::make_shared<flow::FlowMap>();
  for (auto& flow : loaded.flows) {
    flow::Initialize(&flow);
    try {
      WriteFlowFile(install_dir, flow);
    } catch (const util::PersistenceError& e) {
      span.RecordException(e.what());
      FLOWSTORE_LOG_ERROR("Upload aborted", {StringField("project", name), StringField("version", version), StringField("error", e.what())});
      throw;
    }
    flows->Insert(std::make_shared<const Flow>(std::move(flow)));
  }

  MoveSources(staged_dir, install_dir / kSourceDirectory);

  // ------------------------------------------------------------
  // 3. commit or reject
  // ------------------------------------------------------------
  if (!force && !errors.empty()) {
    FLOWSTORE_LOG_INFO("Errors found loading project",
                       {StringField("project", name), StringField("version", version), IntField("errors", static_cast<int64_t>(errors.size()))});
    span.RecordException("upload rejected");
    throw util::UploadRejected(std::move(errors));
  }

  const auto now      = util::ToUnixMillis(util::Now());
  auto       snapshot = project->Update(
      [&](Project* metadata) {
        metadata->set_source(version);
        metadata->set_last_modified_time_ms(now);
        metadata->set_last_modified_user(uploader.id);
      },
      [this](const Project& metadata) { WriteProjectFile(metadata); }, flows);

  FLOWSTORE_LOG_INFO("Installed project version",
                     {StringField("project", name), StringField("version", version), IntField("flows", static_cast<int64_t>(flows->Size())),
                      IntField("errors", static_cast<int64_t>(errors.size()))});
  return snapshot;
}

// ------------------------------------------------------------
// Commit
// ------------------------------------------------------------

void ProjectManager::CommitProject(const std::string& name) {
  SpanScope span("ProjectManager.CommitProject");
  span.SetAttribute("project", name);

  auto project = registry_.Find(name);
  if (!project) {
    throw util::NotFound("Project " + name + " doesn't exist.");
  }

  project->Update([](Project*) {}, [this](const Project& metadata) { WriteProjectFile(metadata); });
}

// ------------------------------------------------------------
// Permissions
// ------------------------------------------------------------

ProjectSnapshot ProjectManager::SetUserPermission(const std::string& name, const access::User& admin, const std::string& user_id,
                                                  const std::vector<Capability>& capabilities) {
  SpanScope span("ProjectManager.SetUserPermission");
  span.SetAttribute("project", name);

  if (IsBlank(user_id)) {
    throw util::ValidationError("Valid user must be set.");
  }
  for (const auto capability : capabilities) {
    if (capability == CAPABILITY_UNSPECIFIED || !Capability_IsValid(capability)) {
      throw util::ValidationError("Unknown capability " + std::to_string(static_cast<int>(capability)));
    }
  }

  auto project = RequireProject(name);

  // checked against the metadata being replaced, under the project's lock
  auto snapshot = project->Update(
      [&](Project* metadata) {
        if (access::Authorize(metadata, admin, CAPABILITY_ADMIN) != AccessDecision::kAuthorized) {
          throw util::PermissionDenied("Permission denied. Do not have admin access.");
        }

        metadata->mutable_permissions()->erase(user_id);
        for (const auto capability : capabilities) access::Grant(metadata, user_id, capability);

        const auto& permissions = metadata->permissions();
        const bool  has_admin   = std::any_of(permissions.begin(), permissions.end(), [](const auto& entry) {
          return access::HasCapability(entry.second, CAPABILITY_ADMIN);
        });
        if (!has_admin) {
          throw util::ValidationError("Project " + name + " must keep at least one admin.");
        }
      },
      [this](const Project& metadata) { WriteProjectFile(metadata); });

  FLOWSTORE_LOG_INFO("Updated user permission", {StringField("project", name), StringField("admin", admin.id), StringField("user", user_id),
                                                 IntField("capabilities", static_cast<int64_t>(capabilities.size()))});
  return snapshot;
}

// ------------------------------------------------------------
// Query
// ------------------------------------------------------------

std::vector<ProjectSnapshot> ProjectManager::GetProjects(const access::User& user) const {
  std::vector<ProjectSnapshot> result;
  for (const auto& project : registry_.List()) {
    auto snapshot = project->Snapshot();
    if (access::CanRead(snapshot.metadata, user)) {
      result.push_back(std::move(snapshot));
    }
  }
  return result;
}

ProjectSnapshot ProjectManager::GetProject(const std::string& name, const access::User& user) const {
  auto project = registry_.Find(name);

  // one snapshot for both the check and the result
  ProjectSnapshot snapshot;
  if (project) snapshot = project->Snapshot();

  switch (access::Authorize(project ? &snapshot.metadata : nullptr, user, CAPABILITY_READ)) {
    case AccessDecision::kAuthorized:
      return snapshot;
    case AccessDecision::kDenied:
      throw util::PermissionDenied("Permission denied. Do not have read access.");
    case AccessDecision::kNotFound:
    default:
      throw util::NotFound("Project " + name + " not found");
  }
}

std::vector<std::string> ProjectManager::GetProjectNames() const {
  return registry_.Names();
}

// ------------------------------------------------------------
// Properties
// ------------------------------------------------------------

Properties ProjectManager::GetProperties(const std::string& name, const std::string& source, const access::User& user) {
  SpanScope span("ProjectManager.GetProperties");
  span.SetAttribute("project", name);

  auto project = RequireProject(name);
  auto metadata = project->Metadata();
  if (access::Authorize(&metadata, user, CAPABILITY_READ) != AccessDecision::kAuthorized) {
    throw util::PermissionDenied("Permission denied. Do not have read access.");
  }
  if (metadata.source().empty()) {
    throw util::NotFound("Project " + name + " has no uploaded sources");
  }
  ValidateRelativeSource(source);

  const auto key = cache::PropertiesCache::Key(name, metadata.source(), source);
  if (auto cached = cache_.Get(key)) {
    span.AddEvent("cache_hit");
    return std::move(*cached);
  }

  const auto      file = options_.root / key;
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    throw util::NotFound("Source file " + file.string() + " doesn't exist.");
  }

  auto props = props::ParsePropertiesFile(file);
  cache_.Put(key, props);
  return props;
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

std::vector<std::string> ProjectManager::PruneInstallVersions(const std::string& name, const access::User& user, std::size_t keep) {
  SpanScope span("ProjectManager.PruneInstallVersions");
  span.SetAttribute("project", name);

  auto project = RequireProject(name);
  if (project->Authorize(user, CAPABILITY_ADMIN) != AccessDecision::kAuthorized) {
    throw util::PermissionDenied("Permission denied. Do not have admin access.");
  }

  // an upload in progress holds this until its version is published or rejected
  std::lock_guard install_lock(project->InstallMutex());

  const auto current = project->Metadata().source();
  if (current.empty()) {
    return {};
  }

  // Only versions older than the current one: newer directories belong
  // to rejected uploads.
  std::vector<std::string> superseded;
  const auto               project_dir = ProjectPath(options_.root, name);
  try {
    for (const auto& entry : fs::directory_iterator(project_dir)) {
      std::error_code ec;
      const auto      dir_name = entry.path().filename().string();
      if (entry.is_directory(ec) && util::ParseInstallVersion(dir_name) && dir_name < current) {
        superseded.push_back(dir_name);
      }
    }
  } catch (const fs::filesystem_error& e) {
    throw util::PersistenceError("Cannot list " + project_dir.string(), e);
  }

  std::sort(superseded.rbegin(), superseded.rend());

  std::vector<std::string> removed;
  for (std::size_t i = keep; i < superseded.size(); ++i) {
    std::error_code ec;
    fs::remove_all(project_dir / superseded[i], ec);
    if (ec) {
      throw util::PersistenceError("Cannot remove " + (project_dir / superseded[i]).string() + ": " + ec.message());
    }
    FLOWSTORE_LOG_INFO("Removed install version", {StringField("project", name), StringField("version", superseded[i])});
    removed.push_back(superseded[i]);
  }
  return removed;
}

} // namespace flowstore::core
