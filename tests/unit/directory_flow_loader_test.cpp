#include "internal/flow/directory_flow_loader.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

#include "internal/flow/flow_graph.hpp"
#include "test_dirs.hpp"

namespace {

using flowstore::flow::DirectoryFlowLoader;
using flowstore::testing::TempDir;
using flowstore::testing::WriteJob;
using flowstore::testing::WriteText;

bool AnyErrorContains(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

std::vector<std::string> FlowErrors(const flowstore::v1::Flow& flow) {
  return {flow.errors().begin(), flow.errors().end()};
}

void TestFlowsAreJobsNobodyDependsOn() {
  TempDir dir("loader_flows");
  WriteJob(dir.path(), "extract");
  WriteJob(dir.path(), "transform", "extract");
  WriteJob(dir.path(), "load", "transform");
  WriteJob(dir.path() / "nested", "report", "extract");
  WriteText(dir.path() / "README.txt", "not a job");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.errors.empty());
  assert(result.flows.size() == 2);

  std::vector<std::string> ids;
  for (const auto& flow : result.flows) ids.push_back(flow.id());
  std::sort(ids.begin(), ids.end());
  assert((ids == std::vector<std::string>{"load", "report"}));

  for (auto flow : result.flows) {
    assert(flow.errors().empty());
    flowstore::flow::Initialize(&flow);
    assert(flow.initialized());
    assert(flow.end_node() == flow.id());
    assert(flow.start_nodes_size() == 1);
    assert(flow.start_nodes(0) == "extract");
    if (flow.id() == "load") {
      assert(flow.nodes_size() == 3);
      assert(flow.edges_size() == 2);
    }
  }
}

void TestNodeCarriesTypeSourceAndProperties() {
  TempDir dir("loader_node");
  WriteJob(dir.path() / "jobs", "only", "", "javaprocess");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.flows.size() == 1);
  const auto& node = result.flows[0].nodes(0);
  assert(node.id() == "only");
  assert(node.type() == "javaprocess");
  assert(node.source() == "jobs/only.job");
  assert(node.properties().at("command") == "echo only");
}

void TestDuplicateJobName() {
  TempDir dir("loader_duplicate");
  WriteJob(dir.path() / "a", "job");
  WriteJob(dir.path() / "b", "job");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.flows.size() == 1);
  assert(AnyErrorContains(result.errors, "Duplicate job name job"));
}

void TestUnknownDependency() {
  TempDir dir("loader_unknown_dep");
  WriteJob(dir.path(), "end", "ghost");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.flows.size() == 1);
  const auto errors = FlowErrors(result.flows[0]);
  assert(AnyErrorContains(errors, "Dependency ghost of job end not found"));
  assert(result.flows[0].edges(0).error() == errors[0]);
}

void TestCycleInsideFlow() {
  TempDir dir("loader_cycle");
  WriteJob(dir.path(), "end", "a");
  WriteJob(dir.path(), "a", "b");
  WriteJob(dir.path(), "b", "a");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.flows.size() == 1);
  assert(AnyErrorContains(FlowErrors(result.flows[0]), "Cycle found: a -> b -> a"));
}

void TestClosedCycleBelongsToNoFlow() {
  TempDir dir("loader_closed_cycle");
  WriteJob(dir.path(), "solo");
  WriteJob(dir.path(), "x", "y");
  WriteJob(dir.path(), "y", "x");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.flows.size() == 1);
  assert(result.flows[0].id() == "solo");
  assert(AnyErrorContains(result.errors, "Job x belongs to no flow"));
  assert(AnyErrorContains(result.errors, "Job y belongs to no flow"));
}

void TestJobWithoutType() {
  TempDir dir("loader_no_type");
  WriteText(dir.path() / "untyped.job", "command=echo hi\n");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.flows.size() == 1);
  assert(AnyErrorContains(FlowErrors(result.flows[0]), "Job untyped has no type"));
}

void TestEmptyDirectoryHasNoFlows() {
  TempDir dir("loader_empty");
  WriteText(dir.path() / "notes.txt", "nothing here");

  const auto result = DirectoryFlowLoader().Load(dir.path());
  assert(result.flows.empty());
  assert(result.errors.size() == 1);
  assert(AnyErrorContains(result.errors, "No flows found"));
}

} // namespace

int main() {
  TestFlowsAreJobsNobodyDependsOn();
  TestNodeCarriesTypeSourceAndProperties();
  TestDuplicateJobName();
  TestUnknownDependency();
  TestCycleInsideFlow();
  TestClosedCycleBelongsToNoFlow();
  TestJobWithoutType();
  TestEmptyDirectoryHasNoFlows();

  std::cout << "flowstore_unit_directory_flow_loader: pass\n";
  return 0;
}
