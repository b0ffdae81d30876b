#include "directory_flow_loader.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/props/properties_parser.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::flow {

namespace fs = std::filesystem;

using flowstore::observability::StringField;
using flowstore::v1::Flow;
using flowstore::v1::FlowNode;

namespace {

struct Job {
  FlowNode                 node;
  std::vector<std::string> dependencies;
  std::vector<std::string> errors;
};

std::vector<std::string> SplitDependencies(const std::string& value) {
  std::vector<std::string> deps;
  std::stringstream        in(value);
  std::string              item;
  while (std::getline(in, item, ',')) {
    const auto begin = item.find_first_not_of(" \t");
    if (begin == std::string::npos) continue;
    const auto end = item.find_last_not_of(" \t");
    deps.push_back(item.substr(begin, end - begin + 1));
  }
  return deps;
}

bool HasExtension(const fs::path& path, const std::string& extension) {
  const auto name = path.filename().string();
  return name.size() > extension.size() && name.front() != '.' &&
         name.compare(name.size() - extension.size(), extension.size(), extension) == 0;
}

/*
  Walks dependencies depth first from the flow's root job, adding nodes
  and edges. A dependency that leads back onto the current path is a cycle.
*/
class FlowBuilder {
 public:
  FlowBuilder(const std::map<std::string, Job>& jobs, Flow* flow) : jobs_(jobs), flow_(flow) {
  }

  void Visit(const std::string& job_id) {
    visiting_.insert(job_id);
    path_.push_back(job_id);

    const auto& job = jobs_.at(job_id);
    *flow_->add_nodes() = job.node;
    added_.insert(job_id);
    for (const auto& error : job.errors) flow_->add_errors(error);

    for (const auto& dep : job.dependencies) {
      auto* edge = flow_->add_edges();
      edge->set_source_id(dep);
      edge->set_target_id(job_id);

      if (jobs_.count(dep) == 0) {
        edge->set_error("Dependency " + dep + " of job " + job_id + " not found");
        flow_->add_errors(edge->error());
        continue;
      }
      if (visiting_.count(dep) > 0) {
        edge->set_error("Cycle found: " + CyclePath(dep));
        flow_->add_errors(edge->error());
        continue;
      }
      if (added_.count(dep) == 0) {
        Visit(dep);
      }
    }

    path_.pop_back();
    visiting_.erase(job_id);
  }

  const std::unordered_set<std::string>& Added() const {
    return added_;
  }

 private:
  std::string CyclePath(const std::string& dep) const {
    auto        start = std::find(path_.begin(), path_.end(), dep);
    std::string cycle;
    for (auto it = start; it != path_.end(); ++it) cycle += *it + " -> ";
    return cycle + dep;
  }

  const std::map<std::string, Job>& jobs_;
  Flow*                             flow_;
  std::unordered_set<std::string>   visiting_;
  std::unordered_set<std::string>   added_;
  std::vector<std::string>          path_;
};

} // namespace

FlowLoadResult DirectoryFlowLoader::Load(const fs::path& directory) const {
  FlowLoadResult result;

  std::vector<fs::path> job_files;
  for (const auto& entry : fs::recursive_directory_iterator(directory)) {
    std::error_code ec;
    if (entry.is_regular_file(ec) && HasExtension(entry.path(), kJobExtension)) {
      job_files.push_back(entry.path());
    }
  }
  std::sort(job_files.begin(), job_files.end());

  // ------------------------------------------------------------
  // Jobs
  // ------------------------------------------------------------
  std::map<std::string, Job> jobs;
  std::vector<std::string>   discovery_order;
  for (const auto& path : job_files) {
    const auto name     = path.stem().string();
    const auto relative = path.lexically_relative(directory).generic_string();

    if (jobs.count(name) > 0) {
      result.errors.push_back("Duplicate job name " + name + " in " + relative + ", already defined in " + jobs.at(name).node.source());
      continue;
    }

    flowstore::v1::Properties props;
    try {
      props = props::ParsePropertiesFile(path);
    } catch (const util::PersistenceError& e) {
      FLOWSTORE_LOG_ERROR("Error loading job file", {StringField("path", path.string()), StringField("error", e.what())});
      result.errors.push_back("Error loading job file " + relative + ": " + e.what());
      continue;
    } catch (const util::InvalidFormat& e) {
      FLOWSTORE_LOG_ERROR("Malformed job file", {StringField("path", path.string()), StringField("error", e.what())});
      result.errors.push_back("Error loading job file " + relative + ": " + e.what());
      continue;
    }

    Job job;
    job.node.set_id(name);
    job.node.set_source(relative);
    for (const auto& [key, value] : props.entries()) {
      (*job.node.mutable_properties())[key] = value;
    }

    const auto& entries = props.entries();
    if (auto type = entries.find(kTypeProperty); type != entries.end() && !type->second.empty()) {
      job.node.set_type(type->second);
    } else {
      job.errors.push_back("Job " + name + " has no type");
    }
    if (auto deps = entries.find(kDependencyProperty); deps != entries.end()) {
      job.dependencies = SplitDependencies(deps->second);
    }

    discovery_order.push_back(name);
    jobs.emplace(name, std::move(job));
  }

  if (jobs.empty()) {
    result.errors.push_back("No flows found in " + directory.string());
    return result;
  }

  // ------------------------------------------------------------
  // Flows: jobs no other job depends on
  // ------------------------------------------------------------
  std::unordered_set<std::string> depended_on;
  for (const auto& [name, job] : jobs) {
    for (const auto& dep : job.dependencies) depended_on.insert(dep);
  }

  std::unordered_set<std::string> in_some_flow;
  for (const auto& name : discovery_order) {
    if (depended_on.count(name) > 0) continue;

    Flow flow;
    flow.set_id(name);
    FlowBuilder builder(jobs, &flow);
    builder.Visit(name);
    in_some_flow.insert(builder.Added().begin(), builder.Added().end());

    FLOWSTORE_LOG_DEBUG("Loaded flow", {StringField("flow", name), StringField("directory", directory.string())});
    result.flows.push_back(std::move(flow));
  }

  for (const auto& name : discovery_order) {
    if (in_some_flow.count(name) == 0) {
      result.errors.push_back("Job " + name + " belongs to no flow (dependency cycle)");
    }
  }

  return result;
}

} // namespace flowstore::flow
