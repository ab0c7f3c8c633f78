#include "internal/core/scheduler.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

#include "internal/cache/due_cache.hpp"
#include "internal/core/record_mapping.hpp"
#include "internal/core/store_ops.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/schedule/recurrence.hpp"
#include "internal/util/errors.hpp"

namespace caretask::core {

using namespace caretask::v1;
using observability::IntField;
using observability::StringField;

namespace {

template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize cache value: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
bool FromJson(const std::string& json, Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(json, message, options).ok();
}

std::optional<util::TimePoint> LastCompletion(const db::model::ScheduleStateRecord& record) {
  if (record.last_completion_ms == 0) return std::nullopt;
  return util::FromUnixMillis(record.last_completion_ms);
}

uint64_t ToStoredMillis(const std::optional<util::TimePoint>& next) {
  return next ? util::ToUnixMillis(*next) : 0;
}

// Recomputes from the stored definition. Rows whose definition cannot be
// read or evaluated yield nothing and are logged.
std::optional<util::TimePoint> TryNextOccurrence(const db::model::ScheduleStateRecord& record, util::TimePoint now) {
  std::string error;
  try {
    return schedule::NextOccurrence(ScheduleFromJson(record.schedule_json), LastCompletion(record), now);
  } catch (const util::ValidationError& e) {
    error = e.what();
  } catch (const util::StoreUnavailable& e) {
    error = e.what();
  }
  CARETASK_LOG_WARN("skipping schedule with unreadable definition",
                    {StringField("note_id", record.note_id), StringField("step_id", record.step_id), StringField("error", error)});
  return std::nullopt;
}

// Cache calls surface every backend failure as CacheUnavailable.
template <typename Fn>
auto CacheCall(std::string_view operation, Fn&& fn) {
  try {
    return fn();
  } catch (const util::CacheUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::CacheUnavailable(std::string(operation) + ": " + e.what());
  }
}

} // namespace

Scheduler::Scheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::DueCache> cache,
                     std::shared_ptr<const util::TimeSource> clock)
    : repository_(std::move(repository)), cache_(std::move(cache)), clock_(std::move(clock)) {
  if (!repository_ || !cache_ || !clock_) {
    throw std::invalid_argument("Scheduler requires a repository, a due cache and a clock");
  }
}

std::optional<Scheduler::DueCandidate> Scheduler::EarliestOccurrence(const std::vector<db::model::ScheduleStateRecord>& states,
                                                                    const std::string& patient_id) {
  std::optional<DueCandidate> earliest;
  for (const auto& record : states) {
    if (!record.is_active || record.patient_id != patient_id || record.next_occurrence_ms == 0) continue;

    const auto next = util::FromUnixMillis(record.next_occurrence_ms);
    if (!earliest || next < earliest->next) earliest = DueCandidate{next, record.description};
  }
  return earliest;
}

bool Scheduler::RefreshDueEntry(const std::string& note_id, const std::string& patient_id, const std::optional<DueCandidate>& candidate) {
  const auto key = cache::DueEntryKey(note_id, patient_id);
  if (!candidate) {
    CacheCall("clear due entry", [&] { cache_->Delete(key); });
    return false;
  }

  DueCacheEntry entry;
  *entry.mutable_next_occurrence() = util::ToProto(candidate->next);
  entry.set_description(candidate->description);
  CacheCall("write due entry", [&] { cache_->Set(key, ToJson(entry), cache::kDueEntryTtl); });
  TrackKey(note_id, key);
  return true;
}

std::vector<std::string> Scheduler::TrackedKeys(const std::string& note_id) {
  const auto raw = CacheCall("read note keys", [&] { return cache_->Get(cache::NoteKeysKey(note_id)); });
  if (!raw) return {};

  DueCacheKeyList list;
  if (!FromJson(*raw, &list)) {
    CARETASK_LOG_WARN("discarding unreadable note key list", {StringField("note_id", note_id)});
    return {};
  }
  return {list.keys().begin(), list.keys().end()};
}

void Scheduler::TrackKey(const std::string& note_id, const std::string& key) {
  auto keys = TrackedKeys(note_id);
  if (std::find(keys.begin(), keys.end(), key) == keys.end()) keys.push_back(key);

  DueCacheKeyList list;
  for (const auto& k : keys) list.add_keys(k);
  CacheCall("write note keys", [&] { cache_->Set(cache::NoteKeysKey(note_id), ToJson(list), cache::kDueEntryTtl); });
}

// ------------------------------------------------------------------
// StoreScheduleState
// ------------------------------------------------------------------

void Scheduler::StoreScheduleState(const std::string& note_id, const std::string& step_id, const std::string& patient_id,
                                   const std::string& description, const ScheduleDefinition& schedule) {
  const auto now = clock_->Now();

  db::model::ScheduleStateRecord record;
  record.note_id               = note_id;
  record.step_id               = step_id;
  record.patient_id            = patient_id;
  record.description           = description;
  record.schedule_json         = ScheduleToJson(schedule);
  record.total_occurrences     = schedule.duration();
  record.completed_occurrences = 0;
  record.last_completion_ms    = 0;
  record.next_occurrence_ms    = ToStoredMillis(schedule::NextOccurrence(schedule, std::nullopt, now));
  record.is_active             = true;
  record.created_at_ms         = util::ToUnixMillis(now);

  const auto states = RunInTransaction(*repository_, "store schedule state", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->UpsertScheduleState(tx, record), "store schedule state");
    return repository_->ListScheduleStates(tx, note_id);
  });

  const auto next = EarliestOccurrence(states, patient_id);
  try {
    RefreshDueEntry(note_id, patient_id, next);
  } catch (const util::CacheUnavailable& e) {
    CARETASK_LOG_WARN("due cache write failed after storing schedule", {StringField("note_id", note_id),
                      StringField("step_id", step_id), StringField("error", e.what())});
  }

  CARETASK_LOG_DEBUG("schedule stored", {StringField("note_id", note_id), StringField("step_id", step_id),
                     IntField("total_occurrences", record.total_occurrences), observability::BoolField("due_entry", next.has_value())});
}

// ------------------------------------------------------------------
// MarkCompleted
// ------------------------------------------------------------------

ScheduleState Scheduler::MarkCompleted(const std::string& note_id, const std::string& patient_id, const std::string& step_id) {
  const auto now = clock_->Now();

  std::optional<db::model::ScheduleStateRecord> updated;
  std::vector<db::model::ScheduleStateRecord>   states;

  RunInTransaction(*repository_, "mark completed", [&](db::Transaction& tx) {
    // the transaction holds the write lock, so this check and the update are one step
    auto current = repository_->GetScheduleState(tx, note_id, step_id);
    if (!current || !current->is_active || (!patient_id.empty() && current->patient_id != patient_id)) {
      throw util::NotFound("no active schedule for note '" + note_id + "' step '" + step_id + "'");
    }

    // only the completed state moves; sibling states keep what they already owe
    const bool     last    = current->completed_occurrences + 1 >= current->total_occurrences;
    const uint64_t next_ms = last ? 0 : ToStoredMillis(schedule::NextOccurrence(ScheduleFromJson(current->schedule_json), now, now));

    ThrowIfDbError(repository_->CompleteOccurrence(tx, note_id, step_id, util::ToUnixMillis(now), next_ms, updated), "mark completed");
    if (!updated) {
      throw util::NotFound("no active schedule for note '" + note_id + "' step '" + step_id + "'");
    }

    if (updated->completed_occurrences >= updated->total_occurrences) {
      ThrowIfDbError(repository_->DeactivateScheduleState(tx, note_id, step_id), "exhaust schedule");
      updated->is_active = false;

      // schedules stored without a plan step have nothing to close
      const auto step_result = repository_->UpdateStepStatus(tx, step_id, STEP_STATUS_COMPLETED);
      if (!step_result && step_result.code != db::ErrorCode::NotFound) {
        ThrowIfDbError(step_result, "complete plan step");
      }
    }
    states = repository_->ListScheduleStates(tx, note_id);
  });

  const bool exhausted = !updated->is_active;
  observability::Metrics::Instance().RecordCompletion(exhausted);

  try {
    RefreshDueEntry(note_id, updated->patient_id, EarliestOccurrence(states, updated->patient_id));
  } catch (const util::CacheUnavailable& e) {
    CARETASK_LOG_ERROR("due cache update failed after completion", {StringField("note_id", note_id), StringField("step_id", step_id),
                       StringField("error", e.what())});
    throw;
  }

  CARETASK_LOG_INFO("occurrence completed", {StringField("note_id", note_id), StringField("step_id", step_id),
                    IntField("completed_occurrences", updated->completed_occurrences),
                    IntField("total_occurrences", updated->total_occurrences), observability::BoolField("exhausted", exhausted)});

  return ToScheduleState(*updated);
}

// ------------------------------------------------------------------
// GetDueNotifications
// ------------------------------------------------------------------

std::vector<DueNotification> Scheduler::GetDueNotifications(const std::string& note_id, const std::string& patient_id) {
  std::optional<std::string> raw;
  try {
    raw = CacheCall("read due entry", [&] { return cache_->Get(cache::DueEntryKey(note_id, patient_id)); });
  } catch (const util::CacheUnavailable& e) {
    CARETASK_LOG_ERROR("due cache read failed", {StringField("note_id", note_id), StringField("error", e.what())});
    throw;
  }

  std::vector<DueNotification> out;
  if (!raw) {
    observability::Metrics::Instance().RecordDueCheck(false);
    return out;
  }

  DueCacheEntry entry;
  if (!FromJson(*raw, &entry) || !entry.has_next_occurrence()) {
    CARETASK_LOG_WARN("ignoring unreadable due entry", {StringField("note_id", note_id), StringField("patient_id", patient_id)});
    observability::Metrics::Instance().RecordDueCheck(false);
    return out;
  }

  const bool due = util::FromProto(entry.next_occurrence()) <= clock_->Now();
  observability::Metrics::Instance().RecordDueCheck(due);
  if (!due) return out;

  DueNotification notification;
  notification.set_note_id(note_id);
  notification.set_patient_id(patient_id);
  notification.set_description(entry.description());
  *notification.mutable_next_occurrence() = entry.next_occurrence();
  out.push_back(std::move(notification));
  return out;
}

// ------------------------------------------------------------------
// CancelNoteSchedules
// ------------------------------------------------------------------

std::size_t Scheduler::CancelNoteSchedules(const std::string& note_id) {
  std::size_t                                 deactivated = 0;
  std::vector<db::model::ScheduleStateRecord> states;

  RunInTransaction(*repository_, "cancel note schedules", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->DeactivateNoteSchedules(tx, note_id, deactivated), "cancel note schedules");
    states = repository_->ListScheduleStates(tx, note_id);
  });

  // keys from the side list plus every pair known to the store, in case the list expired first
  try {
    auto keys = TrackedKeys(note_id);
    for (const auto& record : states) {
      auto key = cache::DueEntryKey(note_id, record.patient_id);
      if (std::find(keys.begin(), keys.end(), key) == keys.end()) keys.push_back(std::move(key));
    }
    keys.push_back(cache::NoteKeysKey(note_id));
    CacheCall("clear note entries", [&] { cache_->DeleteMany(keys); });
  } catch (const util::CacheUnavailable& e) {
    CARETASK_LOG_WARN("due cache cleanup failed after cancel", {StringField("note_id", note_id), StringField("error", e.what())});
  }

  CARETASK_LOG_INFO("note schedules cancelled", {StringField("note_id", note_id), IntField("deactivated", static_cast<std::int64_t>(deactivated))});
  return deactivated;
}

// ------------------------------------------------------------------
// HydrateDueCache
// ------------------------------------------------------------------

std::size_t Scheduler::HydrateDueCache() {
  const auto  now        = clock_->Now();
  std::size_t recomputed = 0;

  // Owed occurrences survive as stored. States with nothing owed are
  // re-evaluated, which picks up schedules whose last completion was on an
  // earlier day.
  const auto active = RunInTransaction(*repository_, "hydrate due cache", [&](db::Transaction& tx) {
    auto states = repository_->ListActiveScheduleStates(tx);
    for (auto& record : states) {
      if (record.next_occurrence_ms != 0) continue;

      const auto next = TryNextOccurrence(record, now);
      if (!next) continue;
      record.next_occurrence_ms = util::ToUnixMillis(*next);
      ThrowIfDbError(repository_->SetNextOccurrence(tx, record.note_id, record.step_id, record.next_occurrence_ms),
                     "hydrate due cache");
      ++recomputed;
    }
    return states;
  });

  std::map<std::pair<std::string, std::string>, std::vector<db::model::ScheduleStateRecord>> pairs;
  for (const auto& record : active) {
    pairs[{record.note_id, record.patient_id}].push_back(record);
  }

  std::size_t written = 0;
  try {
    for (const auto& [key, states] : pairs) {
      if (RefreshDueEntry(key.first, key.second, EarliestOccurrence(states, key.second))) ++written;
    }
  } catch (const util::CacheUnavailable& e) {
    CARETASK_LOG_ERROR("due cache hydration failed", {StringField("error", e.what()), IntField("written", static_cast<std::int64_t>(written))});
    throw;
  }

  CARETASK_LOG_INFO("due cache hydrated", {IntField("active_schedules", static_cast<std::int64_t>(active.size())),
                    IntField("recomputed", static_cast<std::int64_t>(recomputed)),
                    IntField("entries_written", static_cast<std::int64_t>(written))});
  return written;
}

// ------------------------------------------------------------------
// ListScheduleStates
// ------------------------------------------------------------------

std::vector<ScheduleState> Scheduler::ListScheduleStates(const std::string& note_id) {
  const auto records = RunInTransaction(*repository_, "list schedule states",
                                        [&](db::Transaction& tx) { return repository_->ListScheduleStates(tx, note_id); });

  std::vector<ScheduleState> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToScheduleState(record));
  }
  return out;
}

} // namespace caretask::core
