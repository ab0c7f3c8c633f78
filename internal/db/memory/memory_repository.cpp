#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace caretask::db::memory {

namespace {

bool ScheduleOrder(const model::ScheduleStateRecord& a, const model::ScheduleStateRecord& b) {
  if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
  return a.step_id < b.step_id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Schedule state
// ------------------------------------------------------------------

Result MemoryRepository::UpsertScheduleState(Transaction& t, const model::ScheduleStateRecord& r) {
  TX(t).Mutable().schedules[{r.note_id, r.step_id}] = r;
  return Result::Ok();
}

std::optional<model::ScheduleStateRecord> MemoryRepository::GetScheduleState(Transaction& t, const std::string& note_id,
                                                                              const std::string& step_id) {
  const auto& s  = TX(t).View();
  auto        it = s.schedules.find({note_id, step_id});
  if (it == s.schedules.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompleteOccurrence(Transaction& t, const std::string& note_id, const std::string& step_id,
                                            uint64_t completed_at_ms, uint64_t next_occurrence_ms,
                                            std::optional<model::ScheduleStateRecord>& out) {
  out.reset();
  auto& s  = TX(t).Mutable();
  auto  it = s.schedules.find({note_id, step_id});
  if (it == s.schedules.end() || !it->second.is_active) return Result::Ok();

  it->second.completed_occurrences++;
  it->second.last_completion_ms = completed_at_ms;
  it->second.next_occurrence_ms = next_occurrence_ms;
  out                           = it->second;
  return Result::Ok();
}

Result MemoryRepository::SetNextOccurrence(Transaction& t, const std::string& note_id, const std::string& step_id,
                                           uint64_t next_occurrence_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.schedules.find({note_id, step_id});
  if (it == s.schedules.end()) return Result::Err(ErrorCode::NotFound);
  it->second.next_occurrence_ms = next_occurrence_ms;
  return Result::Ok();
}

Result MemoryRepository::DeactivateScheduleState(Transaction& t, const std::string& note_id, const std::string& step_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.schedules.find({note_id, step_id});
  if (it == s.schedules.end()) return Result::Err(ErrorCode::NotFound);
  it->second.is_active = false;
  return Result::Ok();
}

Result MemoryRepository::DeactivateNoteSchedules(Transaction& t, const std::string& note_id, std::size_t& deactivated) {
  deactivated = 0;
  auto& s     = TX(t).Mutable();
  // keys are ordered by note_id first
  for (auto it = s.schedules.lower_bound({note_id, std::string()}); it != s.schedules.end() && it->first.first == note_id; ++it) {
    if (it->second.is_active) {
      it->second.is_active = false;
      ++deactivated;
    }
  }
  return Result::Ok();
}

std::vector<model::ScheduleStateRecord> MemoryRepository::ListScheduleStates(Transaction& t, const std::string& note_id) {
  const auto&                             s = TX(t).View();
  std::vector<model::ScheduleStateRecord> out;
  for (auto it = s.schedules.lower_bound({note_id, std::string()}); it != s.schedules.end() && it->first.first == note_id; ++it) {
    out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), ScheduleOrder);
  return out;
}

std::vector<model::ScheduleStateRecord> MemoryRepository::ListActiveScheduleStates(Transaction& t) {
  const auto&                             s = TX(t).View();
  std::vector<model::ScheduleStateRecord> out;
  for (const auto& [_, record] : s.schedules) {
    if (record.is_active) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Actionable steps
// ------------------------------------------------------------------

Result MemoryRepository::InsertActionableSteps(Transaction& t, const std::vector<model::ActionableStepRecord>& steps) {
  auto& s = TX(t).Mutable();
  for (const auto& step : steps) {
    if (s.steps.contains(step.id)) return Result::Err(ErrorCode::AlreadyExists, step.id);
  }
  for (const auto& step : steps) {
    s.steps[step.id] = step;
  }
  return Result::Ok();
}

std::vector<model::ActionableStepRecord> MemoryRepository::ListActionableSteps(Transaction& t, const std::string& note_id) {
  const auto&                              s = TX(t).View();
  std::vector<model::ActionableStepRecord> out;
  for (const auto& [_, step] : s.steps) {
    if (step.note_id == note_id) out.push_back(step);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.position < b.position; });
  return out;
}

Result MemoryRepository::DeleteActionableSteps(Transaction& t, const std::string& note_id, std::size_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = std::erase_if(s.steps, [&](const auto& entry) { return entry.second.note_id == note_id; });
  return Result::Ok();
}

Result MemoryRepository::UpdateStepStatus(Transaction& t, const std::string& step_id, caretask::v1::StepStatus status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.steps.find(step_id);
  if (it == s.steps.end()) return Result::Err(ErrorCode::NotFound);
  it->second.status = status;
  return Result::Ok();
}

} // namespace caretask::db::memory
