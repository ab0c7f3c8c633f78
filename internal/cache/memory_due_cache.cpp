#include "memory_due_cache.hpp"

#include <mutex>
#include <stdexcept>

namespace caretask::cache {

MemoryDueCache::MemoryDueCache(std::shared_ptr<const util::TimeSource> clock) : clock_(std::move(clock)) {
  if (!clock_) throw std::invalid_argument("MemoryDueCache requires a clock");
}

void MemoryDueCache::Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
  const auto now = clock_->Now();

  std::unique_lock lock(mutex_);
  entries_[key] = Entry{value, now + ttl};
  if (++writes_since_purge_ >= kPurgeInterval) {
    PurgeLocked(now);
  }
}

std::optional<std::string> MemoryDueCache::Get(const std::string& key) {
  const auto now = clock_->Now();
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.expires_at > now) return it->second.value;
  }

  std::unique_lock lock(mutex_);
  auto             it = entries_.find(key);
  // re-check, a writer may have renewed it
  if (it != entries_.end() && it->second.expires_at <= now) {
    entries_.erase(it);
    return std::nullopt;
  }
  if (it == entries_.end()) return std::nullopt;
  return it->second.value;
}

void MemoryDueCache::Delete(const std::string& key) {
  std::unique_lock lock(mutex_);
  entries_.erase(key);
}

void MemoryDueCache::DeleteMany(const std::vector<std::string>& keys) {
  std::unique_lock lock(mutex_);
  for (const auto& key : keys) {
    entries_.erase(key);
  }
}

std::size_t MemoryDueCache::PurgeExpired() {
  const auto now = clock_->Now();

  std::unique_lock lock(mutex_);
  return PurgeLocked(now);
}

std::size_t MemoryDueCache::PurgeLocked(util::TimePoint now) {
  writes_since_purge_ = 0;
  return std::erase_if(entries_, [&](const auto& item) { return item.second.expires_at <= now; });
}

std::size_t MemoryDueCache::Size() const {
  const auto now = clock_->Now();

  std::shared_lock lock(mutex_);
  std::size_t      live = 0;
  for (const auto& [_, entry] : entries_) {
    if (entry.expires_at > now) ++live;
  }
  return live;
}

} // namespace caretask::cache
