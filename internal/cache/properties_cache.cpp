#include "properties_cache.hpp"

namespace flowstore::cache {

using flowstore::v1::Properties;

PropertiesCache::PropertiesCache(std::size_t max_entries, std::chrono::seconds idle, ClockFn clock)
    : max_entries_(max_entries == 0 ? kDefaultMaxEntries : max_entries), idle_(idle), clock_(std::move(clock)) {
}

std::string PropertiesCache::Key(const std::string& project, const std::string& version, const std::string& source) {
  return project + "/" + version + "/src/" + source;
}

bool PropertiesCache::IsExpired(const Entry& entry, util::TimePoint now) const {
  return now - entry.last_access >= idle_;
}

void PropertiesCache::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  lru_.erase(it->second.lru_it);
  entries_.erase(it);
}

std::size_t PropertiesCache::PurgeExpiredLocked(util::TimePoint now) {
  const auto before = entries_.size();
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (IsExpired(it->second, now)) {
      lru_.erase(it->second.lru_it);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return before - entries_.size();
}

// Expired entries go first, then least recently used ones while over capacity.
void PropertiesCache::EvictLocked(util::TimePoint now) {
  PurgeExpiredLocked(now);

  while (entries_.size() > max_entries_ && !lru_.empty()) {
    auto it = entries_.find(lru_.back());
    if (it == entries_.end()) {
      lru_.pop_back();
      continue;
    }
    EraseLocked(it);
  }
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<Properties> PropertiesCache::Get(const std::string& key) {
  std::shared_ptr<const Properties> value;
  {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    const auto now = clock_();
    if (IsExpired(it->second, now)) {
      EraseLocked(it);
      return std::nullopt;
    }

    it->second.last_access = now;
    lru_.splice(lru_.begin(), lru_, it->second.lru_it);
    value = it->second.value;
  }

  // copy outside the lock; the stored value is never mutated
  return *value;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void PropertiesCache::Put(const std::string& key, const Properties& props) {
  auto value = std::make_shared<const Properties>(props);

  std::lock_guard lock(mutex_);
  const auto      now = clock_();

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second.value       = std::move(value);
    it->second.last_access = now;
    lru_.splice(lru_.begin(), lru_, it->second.lru_it);
  } else {
    lru_.push_front(key);
    entries_.emplace(key, Entry{std::move(value), now, lru_.begin()});
  }

  EvictLocked(now);
}

std::size_t PropertiesCache::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

} // namespace flowstore::cache
