#pragma once

#include "internal/flow/flow_loader.hpp"

namespace flowstore::flow {

/*
  Loads flows from a directory of *.job properties files.

    <job>.job   type=<job type>
                dependencies=<job>,<job>,...

  Every job nothing else depends on names a flow made of itself and
  everything reachable through its dependencies. Problems (duplicate job
  names, unknown dependencies, cycles, unreadable files) are collected,
  not thrown.
*/
class DirectoryFlowLoader final : public FlowLoader {
 public:
  static constexpr char kJobExtension[]       = ".job";
  static constexpr char kTypeProperty[]       = "type";
  static constexpr char kDependencyProperty[] = "dependencies";

  FlowLoadResult Load(const std::filesystem::path& directory) const override;
};

} // namespace flowstore::flow
