#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace caretask::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction&);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

}
