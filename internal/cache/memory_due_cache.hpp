#pragma once

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "internal/cache/due_cache.hpp"
#include "internal/util/time.hpp"

namespace caretask::cache {

/*
  In-process DueCache.

  Expiry is absolute per key and checked against the injected clock.
  Expired entries are dropped when read, and every kPurgeInterval writes a
  full sweep drops the ones nobody reads again.
*/
class MemoryDueCache final : public DueCache {
 public:
  static constexpr std::size_t kPurgeInterval = 64;

  explicit MemoryDueCache(std::shared_ptr<const util::TimeSource> clock);

  void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;

  std::optional<std::string> Get(const std::string& key) override;

  void Delete(const std::string& key) override;

  void DeleteMany(const std::vector<std::string>& keys) override;

  // Live (unexpired) entry count.
  std::size_t Size() const;

  // Drops every expired entry. Returns how many were dropped.
  std::size_t PurgeExpired();

 private:
  struct Entry {
    std::string     value;
    util::TimePoint expires_at;
  };

  // caller holds mutex_ exclusively
  std::size_t PurgeLocked(util::TimePoint now);

  std::shared_ptr<const util::TimeSource> clock_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::size_t                            writes_since_purge_ = 0;
};

} // namespace caretask::cache
