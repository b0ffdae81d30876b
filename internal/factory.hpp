#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/project_manager.hpp"

namespace flowstore::factory {

/*
  Composition root: the only place that picks concrete collaborators
  (directory flow loader, cache limits, fsync policy).
*/
core::ProjectManagerOptions BuildOptions(const flowstore::runtime::config::RuntimeConfig& config);

std::shared_ptr<core::ProjectManager> Build(const flowstore::runtime::config::RuntimeConfig& config);

} // namespace flowstore::factory
