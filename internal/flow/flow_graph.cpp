#include "flow_graph.hpp"

#include <set>
#include <string>
#include <unordered_set>

namespace flowstore::flow {

void Initialize(flowstore::v1::Flow* flow) {
  std::unordered_set<std::string> node_ids;
  for (const auto& node : flow->nodes()) node_ids.insert(node.id());

  std::unordered_set<std::string> has_dependency;
  for (const auto& edge : flow->edges()) {
    // edges to unknown jobs do not make the target less of a start node
    if (edge.error().empty() && node_ids.count(edge.source_id()) > 0) {
      has_dependency.insert(edge.target_id());
    }
  }

  std::set<std::string> start_nodes;
  for (const auto& id : node_ids) {
    if (has_dependency.count(id) == 0) start_nodes.insert(id);
  }

  flow->clear_start_nodes();
  for (const auto& id : start_nodes) flow->add_start_nodes(id);

  flow->set_end_node(node_ids.count(flow->id()) > 0 ? flow->id() : std::string());
  flow->set_initialized(true);
}

} // namespace flowstore::flow
