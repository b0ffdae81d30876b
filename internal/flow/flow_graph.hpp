#pragma once

#include "flowstore/v1.hpp"

namespace flowstore::flow {

/*
  Resolves a flow's internal references before it is persisted or
  published: start nodes (no in-flow dependency, sorted by id) and the
  end node (the job the flow is named after). Idempotent.
*/
void Initialize(flowstore::v1::Flow* flow);

} // namespace flowstore::flow
