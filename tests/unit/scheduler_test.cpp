#include "internal/core/scheduler.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/cache/memory_due_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using caretask::cache::DueEntryKey;
using caretask::cache::MemoryDueCache;
using caretask::cache::NoteKeysKey;
using caretask::core::Scheduler;
using caretask::util::ManualTimeSource;
using caretask::v1::ScheduleDefinition;
using std::chrono::hours;
using std::chrono::minutes;

struct Fixture {
  std::shared_ptr<ManualTimeSource>                      clock;
  std::shared_ptr<caretask::db::memory::MemoryRepository> repository;
  std::shared_ptr<MemoryDueCache>                        cache;
  std::shared_ptr<Scheduler>                             scheduler;
};

caretask::util::TimePoint Day() {
  return caretask::util::ParseDate("2025-03-10");
}

Fixture MakeFixture(caretask::util::TimePoint start = Day() + hours(10)) {
  Fixture f;
  f.clock      = std::make_shared<ManualTimeSource>(start);
  f.repository = std::make_shared<caretask::db::memory::MemoryRepository>();
  f.cache      = std::make_shared<MemoryDueCache>(f.clock);
  f.scheduler  = std::make_shared<Scheduler>(f.repository, f.cache, f.clock);
  return f;
}

ScheduleDefinition TwiceDaily(int duration) {
  ScheduleDefinition def;
  def.set_type(caretask::v1::SCHEDULE_TYPE_FIXED_TIME);
  def.set_duration(duration);
  def.add_specific_times("08:00");
  def.add_specific_times("20:00");
  return def;
}

ScheduleDefinition EveryHours(int interval, int duration) {
  ScheduleDefinition def;
  def.set_type(caretask::v1::SCHEDULE_TYPE_INTERVAL_BASED);
  def.set_duration(duration);
  def.set_interval_hours(interval);
  return def;
}

caretask::v1::DueCacheEntry ReadEntry(MemoryDueCache& cache, const std::string& note_id, const std::string& patient_id) {
  const auto raw = cache.Get(DueEntryKey(note_id, patient_id));
  assert(raw.has_value());
  caretask::v1::DueCacheEntry entry;
  const auto status = google::protobuf::util::JsonStringToMessage(*raw, &entry);
  assert(status.ok());
  return entry;
}

// Every backend call fails, as an unreachable cache would.
class UnreachableDueCache final : public caretask::cache::DueCache {
 public:
  void Set(const std::string&, const std::string&, std::chrono::seconds) override {
    throw std::runtime_error("connection refused");
  }
  std::optional<std::string> Get(const std::string&) override {
    throw std::runtime_error("connection refused");
  }
  void Delete(const std::string&) override {
    throw std::runtime_error("connection refused");
  }
  void DeleteMany(const std::vector<std::string>&) override {
    throw std::runtime_error("connection refused");
  }
};

template <typename Fn>
bool ThrowsNotFound(Fn&& fn) {
  try {
    fn();
  } catch (const caretask::util::NotFound&) {
    return true;
  }
  return false;
}

void TestStoreSeedsCacheWithNextOccurrence() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(7));

  const auto entry = ReadEntry(*f.cache, "note-1", "patient-1");
  assert(caretask::util::FromProto(entry.next_occurrence()) == Day() + hours(20));
  assert(entry.description() == "Take amoxicillin");

  const auto states = f.scheduler->ListScheduleStates("note-1");
  assert(states.size() == 1);
  assert(states[0].total_occurrences() == 7);
  assert(states[0].completed_occurrences() == 0);
  assert(states[0].is_active());
  assert(!states[0].has_last_completion());
}

void TestDueNotificationsFollowTheClock() {
  auto f = MakeFixture();

  // absent entry
  assert(f.scheduler->GetDueNotifications("note-1", "patient-1").empty());

  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(7));

  // future entry
  assert(f.scheduler->GetDueNotifications("note-1", "patient-1").empty());

  // exactly due, then past due
  f.clock->Set(Day() + hours(20));
  auto due = f.scheduler->GetDueNotifications("note-1", "patient-1");
  assert(due.size() == 1);
  assert(due[0].note_id() == "note-1");
  assert(due[0].patient_id() == "patient-1");
  assert(due[0].description() == "Take amoxicillin");
  assert(caretask::util::FromProto(due[0].next_occurrence()) == Day() + hours(20));

  f.clock->Advance(minutes(30));
  assert(f.scheduler->GetDueNotifications("note-1", "patient-1").size() == 1);

  // other patients of the same note see nothing
  assert(f.scheduler->GetDueNotifications("note-1", "patient-2").empty());
}

void TestEntryHoldsEarliestAcrossPairStates() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Evening dose", TwiceDaily(7));
  f.scheduler->StoreScheduleState("note-1", "step-2", "patient-1", "Check blood pressure", EveryHours(2, 3));

  auto entry = ReadEntry(*f.cache, "note-1", "patient-1");
  assert(caretask::util::FromProto(entry.next_occurrence()) == Day() + hours(12));
  assert(entry.description() == "Check blood pressure");

  // completing the earlier one leaves the other state's occurrence
  f.scheduler->MarkCompleted("note-1", "patient-1", "step-2");
  entry = ReadEntry(*f.cache, "note-1", "patient-1");
  assert(caretask::util::FromProto(entry.next_occurrence()) == Day() + hours(20));
  assert(entry.description() == "Evening dose");
}

void TestExhaustionDeactivatesAndClearsEntry() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(2));

  auto state = f.scheduler->MarkCompleted("note-1", "patient-1", "step-1");
  assert(state.completed_occurrences() == 1);
  assert(state.is_active());
  assert(caretask::util::FromProto(state.last_completion()) == Day() + hours(10));

  f.clock->Advance(hours(24));
  state = f.scheduler->MarkCompleted("note-1", "patient-1", "step-1");
  assert(state.completed_occurrences() == 2);
  assert(!state.is_active());

  assert(!f.cache->Get(DueEntryKey("note-1", "patient-1")).has_value());
  assert(ThrowsNotFound([&] { f.scheduler->MarkCompleted("note-1", "patient-1", "step-1"); }));

  const auto states = f.scheduler->ListScheduleStates("note-1");
  assert(states.size() == 1);
  assert(states[0].completed_occurrences() == 2);
  assert(!states[0].is_active());

  f.clock->Advance(hours(48));
  assert(f.scheduler->HydrateDueCache() == 0);
  assert(f.scheduler->GetDueNotifications("note-1", "patient-1").empty());
}

void TestCompletionTodayClearsEntryUntilHydrate() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(7));

  f.scheduler->MarkCompleted("note-1", "", "step-1");
  assert(!f.cache->Get(DueEntryKey("note-1", "patient-1")).has_value());

  // same day: still nothing owed
  assert(f.scheduler->HydrateDueCache() == 0);

  f.clock->Set(Day() + hours(24 + 6));
  assert(f.scheduler->HydrateDueCache() == 1);
  const auto entry = ReadEntry(*f.cache, "note-1", "patient-1");
  assert(caretask::util::FromProto(entry.next_occurrence()) == Day() + hours(24 + 8));
}

void TestMarkCompletedRejectsUnknownOrMismatched() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(7));

  assert(ThrowsNotFound([&] { f.scheduler->MarkCompleted("note-1", "patient-1", "step-404"); }));
  assert(ThrowsNotFound([&] { f.scheduler->MarkCompleted("note-404", "patient-1", "step-1"); }));
  assert(ThrowsNotFound([&] { f.scheduler->MarkCompleted("note-1", "patient-2", "step-1"); }));

  const auto states = f.scheduler->ListScheduleStates("note-1");
  assert(states[0].completed_occurrences() == 0);
}

void TestCancelIsIdempotentAndClearsEntries() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(7));
  f.scheduler->StoreScheduleState("note-1", "step-2", "patient-2", "Walk", EveryHours(4, 7));
  f.scheduler->StoreScheduleState("note-2", "step-3", "patient-1", "Hydrate", EveryHours(3, 2));

  assert(f.cache->Get(NoteKeysKey("note-1")).has_value());

  assert(f.scheduler->CancelNoteSchedules("note-1") == 2);
  assert(!f.cache->Get(DueEntryKey("note-1", "patient-1")).has_value());
  assert(!f.cache->Get(DueEntryKey("note-1", "patient-2")).has_value());
  assert(!f.cache->Get(NoteKeysKey("note-1")).has_value());

  assert(f.scheduler->CancelNoteSchedules("note-1") == 0);
  assert(f.scheduler->CancelNoteSchedules("note-never") == 0);

  for (const auto& state : f.scheduler->ListScheduleStates("note-1")) {
    assert(!state.is_active());
  }
  assert(ThrowsNotFound([&] { f.scheduler->MarkCompleted("note-1", "patient-1", "step-1"); }));

  // untouched note keeps its entry
  assert(f.cache->Get(DueEntryKey("note-2", "patient-1")).has_value());
}

void TestCancelClearsEntriesWhenKeyListExpired() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Walk", EveryHours(4, 7));

  f.cache->Delete(NoteKeysKey("note-1"));
  assert(f.scheduler->CancelNoteSchedules("note-1") == 1);
  assert(!f.cache->Get(DueEntryKey("note-1", "patient-1")).has_value());
}

void TestStoreReplacesPreviousState() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(7));
  f.scheduler->MarkCompleted("note-1", "patient-1", "step-1");

  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(3));
  const auto states = f.scheduler->ListScheduleStates("note-1");
  assert(states.size() == 1);
  assert(states[0].completed_occurrences() == 0);
  assert(states[0].total_occurrences() == 3);
  assert(!states[0].has_last_completion());
  assert(f.cache->Get(DueEntryKey("note-1", "patient-1")).has_value());
}

void TestHydrateRebuildsLostEntries() {
  auto f = MakeFixture();
  f.scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Take amoxicillin", TwiceDaily(7));
  f.scheduler->StoreScheduleState("note-1", "step-2", "patient-1", "Walk", EveryHours(4, 7));
  f.scheduler->StoreScheduleState("note-2", "step-3", "patient-2", "Hydrate", EveryHours(3, 2));

  // a fresh cache, as after a restart
  auto cache     = std::make_shared<MemoryDueCache>(f.clock);
  auto scheduler = std::make_shared<Scheduler>(f.repository, cache, f.clock);

  assert(scheduler->HydrateDueCache() == 2);
  assert(caretask::util::FromProto(ReadEntry(*cache, "note-1", "patient-1").next_occurrence()) == Day() + hours(14));
  assert(caretask::util::FromProto(ReadEntry(*cache, "note-2", "patient-2").next_occurrence()) == Day() + hours(13));
}

ScheduleDefinition DailyAt(const std::string& time, int duration) {
  ScheduleDefinition def;
  def.set_type(caretask::v1::SCHEDULE_TYPE_FIXED_TIME);
  def.set_duration(duration);
  def.add_specific_times(time);
  return def;
}

void TestOverdueSiblingSurvivesCompletion() {
  auto f = MakeFixture(Day() + hours(8));
  f.scheduler->StoreScheduleState("note-1", "step-a", "patient-1", "Morning dose", DailyAt("09:00", 5));
  f.scheduler->StoreScheduleState("note-1", "step-b", "patient-1", "Change dressing", EveryHours(4, 5));

  // both owed by 13:00; step-b since 12:00
  f.clock->Set(Day() + hours(13));
  auto due = f.scheduler->GetDueNotifications("note-1", "patient-1");
  assert(due.size() == 1);
  assert(due[0].description() == "Morning dose");

  f.scheduler->MarkCompleted("note-1", "patient-1", "step-a");

  due = f.scheduler->GetDueNotifications("note-1", "patient-1");
  assert(due.size() == 1);
  assert(due[0].description() == "Change dressing");
  assert(caretask::util::FromProto(due[0].next_occurrence()) == Day() + hours(12));

  const auto states = f.scheduler->ListScheduleStates("note-1");
  assert(states.size() == 2);
  assert(states[0].step_id() == "step-a");
  assert(!states[0].has_next_occurrence());
  assert(caretask::util::FromProto(states[1].next_occurrence()) == Day() + hours(12));

  // a restart keeps the owed occurrence too
  auto cache     = std::make_shared<MemoryDueCache>(f.clock);
  auto scheduler = std::make_shared<Scheduler>(f.repository, cache, f.clock);
  assert(scheduler->HydrateDueCache() == 1);
  assert(caretask::util::FromProto(ReadEntry(*cache, "note-1", "patient-1").next_occurrence()) == Day() + hours(12));
}

void TestHydrateSkipsUnreadableDefinitions() {
  auto f = MakeFixture();

  caretask::db::model::ScheduleStateRecord broken;
  broken.note_id               = "note-bad";
  broken.step_id               = "step-1";
  broken.patient_id            = "patient-1";
  broken.description           = "Migrated row";
  broken.schedule_json         = "{not json";
  broken.total_occurrences     = 3;
  broken.is_active             = true;
  broken.created_at_ms         = caretask::util::ToUnixMillis(Day());
  {
    auto tx = f.repository->Begin();
    assert(f.repository->UpsertScheduleState(*tx, broken));
    tx->Commit();
  }
  f.scheduler->StoreScheduleState("note-good", "step-1", "patient-1", "Walk", EveryHours(4, 7));

  auto cache     = std::make_shared<MemoryDueCache>(f.clock);
  auto scheduler = std::make_shared<Scheduler>(f.repository, cache, f.clock);
  assert(scheduler->HydrateDueCache() == 1);
  assert(caretask::util::FromProto(ReadEntry(*cache, "note-good", "patient-1").next_occurrence()) == Day() + hours(14));
  assert(!cache->Get(DueEntryKey("note-bad", "patient-1")).has_value());

  // siblings stored next to the broken row still get their entry
  f.scheduler->StoreScheduleState("note-bad", "step-2", "patient-1", "Hydrate", EveryHours(3, 2));
  assert(caretask::util::FromProto(ReadEntry(*f.cache, "note-bad", "patient-1").next_occurrence()) == Day() + hours(13));
}

void TestCacheOutageIsBestEffortForStoreAndCancel() {
  auto clock      = std::make_shared<ManualTimeSource>(Day() + hours(10));
  auto repository = std::make_shared<caretask::db::memory::MemoryRepository>();
  auto scheduler  = std::make_shared<Scheduler>(repository, std::make_shared<UnreachableDueCache>(), clock);

  scheduler->StoreScheduleState("note-1", "step-1", "patient-1", "Walk", EveryHours(4, 7));
  assert(scheduler->ListScheduleStates("note-1").size() == 1);

  // the store commit stands even though the cache update is reported
  bool cache_error = false;
  try {
    scheduler->MarkCompleted("note-1", "patient-1", "step-1");
  } catch (const caretask::util::CacheUnavailable&) {
    cache_error = true;
  }
  assert(cache_error);
  assert(scheduler->ListScheduleStates("note-1")[0].completed_occurrences() == 1);

  bool read_error = false;
  try {
    scheduler->GetDueNotifications("note-1", "patient-1");
  } catch (const caretask::util::CacheUnavailable&) {
    read_error = true;
  }
  assert(read_error);

  assert(scheduler->CancelNoteSchedules("note-1") == 1);
  assert(!scheduler->ListScheduleStates("note-1")[0].is_active());
}

} // namespace

int main() {
  TestStoreSeedsCacheWithNextOccurrence();
  TestDueNotificationsFollowTheClock();
  TestEntryHoldsEarliestAcrossPairStates();
  TestExhaustionDeactivatesAndClearsEntry();
  TestCompletionTodayClearsEntryUntilHydrate();
  TestMarkCompletedRejectsUnknownOrMismatched();
  TestCancelIsIdempotentAndClearsEntries();
  TestCancelClearsEntriesWhenKeyListExpired();
  TestStoreReplacesPreviousState();
  TestHydrateRebuildsLostEntries();
  TestOverdueSiblingSurvivesCompletion();
  TestHydrateSkipsUnreadableDefinitions();
  TestCacheOutageIsBestEffortForStoreAndCancel();

  std::cout << "caretask_unit_scheduler: pass\n";
  return 0;
}
