#pragma once

#include <string>

namespace flowstore::access {

// Caller identity. Permission tables are keyed by id.
struct User {
  std::string id;
};

} // namespace flowstore::access
