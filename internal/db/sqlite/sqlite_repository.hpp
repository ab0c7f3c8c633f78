#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace caretask::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertScheduleState(Transaction&, const model::ScheduleStateRecord&) override;
  std::optional<model::ScheduleStateRecord> GetScheduleState(Transaction&, const std::string& note_id,
                                                             const std::string& step_id) override;
  Result CompleteOccurrence(Transaction&, const std::string& note_id, const std::string& step_id,
                            uint64_t completed_at_ms, uint64_t next_occurrence_ms,
                            std::optional<model::ScheduleStateRecord>& out) override;
  Result SetNextOccurrence(Transaction&, const std::string& note_id, const std::string& step_id,
                           uint64_t next_occurrence_ms) override;
  Result DeactivateScheduleState(Transaction&, const std::string& note_id, const std::string& step_id) override;
  Result DeactivateNoteSchedules(Transaction&, const std::string& note_id, std::size_t& deactivated) override;
  std::vector<model::ScheduleStateRecord> ListScheduleStates(Transaction&, const std::string& note_id) override;
  std::vector<model::ScheduleStateRecord> ListActiveScheduleStates(Transaction&) override;

  Result InsertActionableSteps(Transaction&, const std::vector<model::ActionableStepRecord>&) override;
  std::vector<model::ActionableStepRecord> ListActionableSteps(Transaction&, const std::string& note_id) override;
  Result DeleteActionableSteps(Transaction&, const std::string& note_id, std::size_t& deleted) override;
  Result UpdateStepStatus(Transaction&, const std::string& step_id, caretask::v1::StepStatus status) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
