#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace caretask::cache {

/*
  Ephemeral key-value store with per-key expiry.

  Values are opaque strings (JSON). Implementations throw
  util::CacheUnavailable when the backing store cannot be reached.
  An absent key is never an error.
*/
class DueCache {
 public:
  virtual ~DueCache() = default;

  virtual void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual void Delete(const std::string& key) = 0;

  virtual void DeleteMany(const std::vector<std::string>& keys) = 0;
};

// Fixed lifetime of every entry written by the scheduler.
inline constexpr std::chrono::seconds kDueEntryTtl{86400};

// "schedule:{note_id}:{patient_id}"
inline std::string DueEntryKey(const std::string& note_id, const std::string& patient_id) {
  return "schedule:" + note_id + ":" + patient_id;
}

// "schedule:{note_id}:keys", the list of entry keys written for a note.
inline std::string NoteKeysKey(const std::string& note_id) {
  return "schedule:" + note_id + ":keys";
}

} // namespace caretask::cache
