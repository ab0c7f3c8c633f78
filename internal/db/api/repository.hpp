#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/actionable_step_record.hpp"
#include "internal/db/model/schedule_state_record.hpp"

namespace caretask::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - CompleteOccurrence is an atomic find-one-and-update: two concurrent
    completions of the same (note_id, step_id) never both observe the
    pre-increment row

  The DB is the source of truth for:
    schedule state
    actionable steps
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Schedule state
  // ---------------------------------------------------------------------

  // Replace-upsert keyed by (note_id, step_id).
  virtual Result UpsertScheduleState(Transaction&, const model::ScheduleStateRecord&) = 0;

  virtual std::optional<model::ScheduleStateRecord> GetScheduleState(Transaction&, const std::string& note_id,
                                                                     const std::string& step_id) = 0;

  // Increments completed_occurrences and sets last_completion and
  // next_occurrence on the active row only. `out` receives the post-update
  // row, or stays empty when no active row matched (result is still Ok).
  virtual Result CompleteOccurrence(Transaction&, const std::string& note_id, const std::string& step_id,
                                    uint64_t completed_at_ms, uint64_t next_occurrence_ms,
                                    std::optional<model::ScheduleStateRecord>& out) = 0;

  virtual Result SetNextOccurrence(Transaction&, const std::string& note_id, const std::string& step_id,
                                   uint64_t next_occurrence_ms) = 0;

  virtual Result DeactivateScheduleState(Transaction&, const std::string& note_id, const std::string& step_id) = 0;

  virtual Result DeactivateNoteSchedules(Transaction&, const std::string& note_id, std::size_t& deactivated) = 0;

  // Ordered by created_at_ms, then step_id.
  virtual std::vector<model::ScheduleStateRecord> ListScheduleStates(Transaction&, const std::string& note_id) = 0;

  virtual std::vector<model::ScheduleStateRecord> ListActiveScheduleStates(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Actionable steps
  // ---------------------------------------------------------------------

  virtual Result InsertActionableSteps(Transaction&, const std::vector<model::ActionableStepRecord>&) = 0;

  // Insertion order (position) is preserved.
  virtual std::vector<model::ActionableStepRecord> ListActionableSteps(Transaction&, const std::string& note_id) = 0;

  virtual Result DeleteActionableSteps(Transaction&, const std::string& note_id, std::size_t& deleted) = 0;

  virtual Result UpdateStepStatus(Transaction&, const std::string& step_id, caretask::v1::StepStatus status) = 0;
};

} // namespace caretask::db
