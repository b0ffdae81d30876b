#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "flowstore/v1.hpp"

namespace flowstore::flow {

using FlowPtr = std::shared_ptr<const flowstore::v1::Flow>;

/*
  Flow id -> flow, iterated in insertion order.
  Re-inserting an id replaces the flow in place.
*/
class FlowMap {
 public:
  void Insert(FlowPtr flow) {
    const auto& id = flow->id();
    auto        it = index_.find(id);
    if (it != index_.end()) {
      flows_[it->second] = std::move(flow);
      return;
    }
    index_.emplace(id, flows_.size());
    flows_.push_back(std::move(flow));
  }

  FlowPtr Find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : flows_[it->second];
  }

  bool Contains(const std::string& id) const {
    return index_.count(id) > 0;
  }

  std::size_t Size() const {
    return flows_.size();
  }

  bool Empty() const {
    return flows_.empty();
  }

  std::vector<std::string> Ids() const {
    std::vector<std::string> ids;
    ids.reserve(flows_.size());
    for (const auto& flow : flows_) ids.push_back(flow->id());
    return ids;
  }

  std::vector<FlowPtr>::const_iterator begin() const {
    return flows_.begin();
  }

  std::vector<FlowPtr>::const_iterator end() const {
    return flows_.end();
  }

 private:
  std::vector<FlowPtr>                         flows_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace flowstore::flow
