#include "pg_repository.hpp"

namespace caretask::db::postgres {

namespace {

constexpr const char* kScheduleSelect =
    "SELECT note_id,step_id,patient_id,description,schedule_json::text,total_occurrences,completed_occurrences,"
    "last_completion_ms,is_active,created_at_ms,next_occurrence_ms FROM schedule_state ";

constexpr const char* kStepSelect =
    "SELECT id,note_id,patient_id,type,status,description,priority,schedule_json,start_date_ms,due_date_ms,"
    "created_at_ms,position FROM actionable_step ";

model::ScheduleStateRecord ReadSchedule(const pqxx::row& row) {
  model::ScheduleStateRecord r;
  r.note_id               = row[0].c_str();
  r.step_id               = row[1].c_str();
  r.patient_id            = row[2].c_str();
  r.description           = row[3].c_str();
  r.schedule_json         = row[4].c_str();
  r.total_occurrences     = row[5].as<int32_t>();
  r.completed_occurrences = row[6].as<int32_t>();
  r.last_completion_ms    = row[7].as<uint64_t>();
  r.is_active             = row[8].as<bool>();
  r.created_at_ms         = row[9].as<uint64_t>();
  r.next_occurrence_ms    = row[10].as<uint64_t>();
  return r;
}

model::ActionableStepRecord ReadStep(const pqxx::row& row) {
  model::ActionableStepRecord r;
  r.id            = row[0].c_str();
  r.note_id       = row[1].c_str();
  r.patient_id    = row[2].c_str();
  r.type          = static_cast<caretask::v1::StepType>(row[3].as<int>());
  r.status        = static_cast<caretask::v1::StepStatus>(row[4].as<int>());
  r.description   = row[5].c_str();
  r.priority      = static_cast<caretask::v1::Priority>(row[6].as<int>());
  r.schedule_json = row[7].c_str();
  r.start_date_ms = row[8].as<uint64_t>();
  r.due_date_ms   = row[9].as<uint64_t>();
  r.created_at_ms = row[10].as<uint64_t>();
  r.position      = row[11].as<int32_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Schedule state
// ------------------------------------------------------------------

Result PgRepository::UpsertScheduleState(Transaction& t, const model::ScheduleStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_schedule_state", r.note_id, r.step_id, r.patient_id, r.description, r.schedule_json,
                               r.total_occurrences, r.completed_occurrences, r.last_completion_ms, r.is_active, r.created_at_ms,
                               r.next_occurrence_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ScheduleStateRecord> PgRepository::GetScheduleState(Transaction& t, const std::string& note_id,
                                                                          const std::string& step_id) {
  auto res = TX(t).Work().exec_params(std::string(kScheduleSelect) + "WHERE note_id=$1 AND step_id=$2;", note_id, step_id);
  if (res.empty()) return std::nullopt;
  return ReadSchedule(res[0]);
}

Result PgRepository::CompleteOccurrence(Transaction& t, const std::string& note_id, const std::string& step_id,
                                        uint64_t completed_at_ms, uint64_t next_occurrence_ms,
                                        std::optional<model::ScheduleStateRecord>& out) {
  out.reset();
  try {
    // UPDATE takes the row lock; a concurrent completion waits and re-checks is_active
    auto res = TX(t).Work().exec_prepared("complete_occurrence", note_id, step_id, completed_at_ms, next_occurrence_ms);
    if (!res.empty()) out = ReadSchedule(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetNextOccurrence(Transaction& t, const std::string& note_id, const std::string& step_id,
                                       uint64_t next_occurrence_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("set_next_occurrence", note_id, step_id, next_occurrence_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeactivateScheduleState(Transaction& t, const std::string& note_id, const std::string& step_id) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE schedule_state SET is_active=FALSE WHERE note_id=$1 AND step_id=$2;", note_id, step_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeactivateNoteSchedules(Transaction& t, const std::string& note_id, std::size_t& deactivated) {
  deactivated = 0;
  try {
    auto res = TX(t).Work().exec_params("UPDATE schedule_state SET is_active=FALSE WHERE note_id=$1 AND is_active;", note_id);
    deactivated = static_cast<std::size_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ScheduleStateRecord> PgRepository::ListScheduleStates(Transaction& t, const std::string& note_id) {
  auto res = TX(t).Work().exec_params(std::string(kScheduleSelect) + "WHERE note_id=$1 ORDER BY created_at_ms ASC, step_id ASC;", note_id);

  std::vector<model::ScheduleStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSchedule(row));
  }
  return out;
}

std::vector<model::ScheduleStateRecord> PgRepository::ListActiveScheduleStates(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kScheduleSelect) + "WHERE is_active ORDER BY note_id ASC, step_id ASC;");

  std::vector<model::ScheduleStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSchedule(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Actionable steps
// ------------------------------------------------------------------

Result PgRepository::InsertActionableSteps(Transaction& t, const std::vector<model::ActionableStepRecord>& steps) {
  try {
    auto& work = TX(t).Work();
    for (const auto& r : steps) {
      work.exec_prepared("insert_actionable_step", r.id, r.note_id, r.patient_id, static_cast<int>(r.type), static_cast<int>(r.status),
                         r.description, static_cast<int>(r.priority), r.schedule_json, r.start_date_ms, r.due_date_ms,
                         r.created_at_ms, r.position);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ActionableStepRecord> PgRepository::ListActionableSteps(Transaction& t, const std::string& note_id) {
  auto res = TX(t).Work().exec_params(std::string(kStepSelect) + "WHERE note_id=$1 ORDER BY position ASC;", note_id);

  std::vector<model::ActionableStepRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadStep(row));
  }
  return out;
}

Result PgRepository::DeleteActionableSteps(Transaction& t, const std::string& note_id, std::size_t& deleted) {
  deleted = 0;
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM actionable_step WHERE note_id=$1;", note_id);
    deleted  = static_cast<std::size_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateStepStatus(Transaction& t, const std::string& step_id, caretask::v1::StepStatus status) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE actionable_step SET status=$1 WHERE id=$2;", static_cast<int>(status), step_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace caretask::db::postgres
