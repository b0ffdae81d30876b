#include "factory.hpp"

#include "internal/config/config_loader.hpp"
#include "internal/flow/directory_flow_loader.hpp"

namespace flowstore::factory {

core::ProjectManagerOptions BuildOptions(const flowstore::runtime::config::RuntimeConfig& config) {
  auto resolved = config;
  config::ConfigLoader::ApplyDefaults(&resolved);

  core::ProjectManagerOptions options;
  options.root              = resolved.store().root_path();
  options.fsync             = resolved.store().fsync();
  options.cache_max_entries = resolved.properties_cache().max_entries();
  options.cache_idle        = std::chrono::seconds(resolved.properties_cache().idle_seconds());
  return options;
}

/*
    Build the store; recovery runs before this returns
*/
std::shared_ptr<core::ProjectManager> Build(const flowstore::runtime::config::RuntimeConfig& config) {
  auto loader = std::make_shared<const flow::DirectoryFlowLoader>();
  return std::make_shared<core::ProjectManager>(BuildOptions(config), std::move(loader));
}

} // namespace flowstore::factory
