#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "flowstore/v1.hpp"

namespace flowstore::flow {

struct FlowLoadResult {
  // insertion order = discovery order
  std::vector<flowstore::v1::Flow> flows;

  // Problems not attached to a single flow. Per-flow problems live in Flow::errors.
  std::vector<std::string> errors;
};

/*
  Turns a staged upload directory into flows.

  Structural problems are reported, never thrown; only an unreadable
  directory throws.
*/
class FlowLoader {
 public:
  virtual ~FlowLoader() = default;

  virtual FlowLoadResult Load(const std::filesystem::path& directory) const = 0;
};

} // namespace flowstore::flow
