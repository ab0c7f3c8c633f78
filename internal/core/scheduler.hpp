#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "caretask/v1/schedule.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace caretask::cache {
class DueCache;
}

namespace caretask::core {

/*
  Schedule lifecycle and store/cache orchestration.

  The repository is the source of truth; the due cache holds, per
  (note, patient), the earliest next occurrence across that pair's active
  schedules. Cache writes follow the store commit and are never part of the
  store transaction.
*/
class Scheduler {
 public:
  Scheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::DueCache> cache,
            std::shared_ptr<const util::TimeSource> clock);

  // Replace-upserts a fresh state for (note_id, step_id) and seeds the due
  // cache. A cache failure is logged and does not fail the call.
  void StoreScheduleState(const std::string& note_id, const std::string& step_id, const std::string& patient_id,
                          const std::string& description, const caretask::v1::ScheduleDefinition& schedule);

  // Records one completion and recomputes that state's next occurrence.
  // Throws util::NotFound when no active schedule matches. Returns the
  // post-completion state.
  caretask::v1::ScheduleState MarkCompleted(const std::string& note_id, const std::string& patient_id, const std::string& step_id);

  // Empty unless the cached next occurrence is at or before now.
  std::vector<caretask::v1::DueNotification> GetDueNotifications(const std::string& note_id, const std::string& patient_id);

  // Idempotent. Returns the number of schedules that were active.
  std::size_t CancelNoteSchedules(const std::string& note_id);

  // Rebuilds the cache entry of every (note, patient) pair with an active
  // schedule from the stored next occurrences. States with nothing owed are
  // re-evaluated against now first; unreadable definitions are skipped with a
  // warning. Returns the number of entries written.
  std::size_t HydrateDueCache();

  std::vector<caretask::v1::ScheduleState> ListScheduleStates(const std::string& note_id);

 private:
  struct DueCandidate {
    util::TimePoint next;
    std::string     description;
  };

  // Earliest stored next occurrence among the pair's active states.
  static std::optional<DueCandidate> EarliestOccurrence(const std::vector<db::model::ScheduleStateRecord>& states,
                                                        const std::string& patient_id);

  // Writes or clears the pair's entry. Returns true when an entry was written.
  bool RefreshDueEntry(const std::string& note_id, const std::string& patient_id, const std::optional<DueCandidate>& candidate);

  void TrackKey(const std::string& note_id, const std::string& key);
  std::vector<std::string> TrackedKeys(const std::string& note_id);

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<cache::DueCache>        cache_;
  std::shared_ptr<const util::TimeSource> clock_;
};

} // namespace caretask::core
