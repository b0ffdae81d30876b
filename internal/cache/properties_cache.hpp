#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "flowstore/v1.hpp"
#include "internal/util/time.hpp"

namespace flowstore::cache {

/*
  Bounded LRU + idle-TTL cache of parsed properties files.

  Key: <project>/<version>/src/<relative source>. The version is part
  of the key, so an upload naturally stops hitting old entries; there
  is no other invalidation.

  Values are stored once and every Get() returns an independent copy.
  Safe for concurrent use; does not rely on any project lock.
*/
class PropertiesCache {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  static constexpr std::size_t          kDefaultMaxEntries = 2000;
  static constexpr std::chrono::seconds kDefaultIdle{120};

  explicit PropertiesCache(std::size_t max_entries = kDefaultMaxEntries, std::chrono::seconds idle = kDefaultIdle, ClockFn clock = util::Now);

  std::optional<flowstore::v1::Properties> Get(const std::string& key);

  void Put(const std::string& key, const flowstore::v1::Properties& props);

  std::size_t Size() const;

  static std::string Key(const std::string& project, const std::string& version, const std::string& source);

 private:
  struct Entry {
    std::shared_ptr<const flowstore::v1::Properties> value;
    util::TimePoint                                  last_access;
    std::list<std::string>::iterator                 lru_it;
  };

  bool        IsExpired(const Entry& entry, util::TimePoint now) const;
  void        EraseLocked(std::unordered_map<std::string, Entry>::iterator it);
  std::size_t PurgeExpiredLocked(util::TimePoint now);
  void        EvictLocked(util::TimePoint now);

  const std::size_t          max_entries_;
  const std::chrono::seconds idle_;
  ClockFn                    clock_;

  mutable std::mutex mutex_;

  // front = most recently used
  std::list<std::string>                 lru_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace flowstore::cache
