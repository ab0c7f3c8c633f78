#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace caretask::db::sqlite {

using caretask::db::ErrorCode;
using caretask::db::Result;

namespace {

constexpr const char* kScheduleColumns =
    "note_id,step_id,patient_id,description,schedule_json,total_occurrences,completed_occurrences,"
    "last_completion_ms,is_active,created_at_ms,next_occurrence_ms";

constexpr const char* kStepColumns =
    "id,note_id,patient_id,type,status,description,priority,schedule_json,start_date_ms,due_date_ms,"
    "created_at_ms,position";

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

} // namespace

// Reads have no Result channel; failures surface as exceptions.
[[noreturn]] static void ThrowQueryError(sqlite3* db) {
    throw std::runtime_error(std::string("sqlite query failed: ") + sqlite3_errmsg(db));
}

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static model::ScheduleStateRecord ReadSchedule(sqlite3_stmt* st) {
    model::ScheduleStateRecord r;
    r.note_id = ColText(st, 0);
    r.step_id = ColText(st, 1);
    r.patient_id = ColText(st, 2);
    r.description = ColText(st, 3);
    r.schedule_json = ColText(st, 4);
    r.total_occurrences = ColI32(st, 5);
    r.completed_occurrences = ColI32(st, 6);
    r.last_completion_ms = ColU64(st, 7);
    r.is_active = ColI32(st, 8) != 0;
    r.created_at_ms = ColU64(st, 9);
    r.next_occurrence_ms = ColU64(st, 10);
    return r;
}

static model::ActionableStepRecord ReadStep(sqlite3_stmt* st) {
    model::ActionableStepRecord r;
    r.id = ColText(st, 0);
    r.note_id = ColText(st, 1);
    r.patient_id = ColText(st, 2);
    r.type = static_cast<caretask::v1::StepType>(ColI32(st, 3));
    r.status = static_cast<caretask::v1::StepStatus>(ColI32(st, 4));
    r.description = ColText(st, 5);
    r.priority = static_cast<caretask::v1::Priority>(ColI32(st, 6));
    r.schedule_json = ColText(st, 7);
    r.start_date_ms = ColU64(st, 8);
    r.due_date_ms = ColU64(st, 9);
    r.created_at_ms = ColU64(st, 10);
    r.position = ColI32(st, 11);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schedule state
// ------------------------------------------------------------------

Result SqliteRepository::UpsertScheduleState(Transaction& t, const model::ScheduleStateRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO schedule_state(") + kScheduleColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?,?,?)"
        " ON CONFLICT(note_id,step_id) DO UPDATE SET"
        " patient_id=excluded.patient_id,"
        " description=excluded.description,"
        " schedule_json=excluded.schedule_json,"
        " total_occurrences=excluded.total_occurrences,"
        " completed_occurrences=excluded.completed_occurrences,"
        " last_completion_ms=excluded.last_completion_ms,"
        " is_active=excluded.is_active,"
        " created_at_ms=excluded.created_at_ms,"
        " next_occurrence_ms=excluded.next_occurrence_ms;";

    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, r.note_id);
    BindText(s.st, 2, r.step_id);
    BindText(s.st, 3, r.patient_id);
    BindText(s.st, 4, r.description);
    BindText(s.st, 5, r.schedule_json);
    BindI32(s.st, 6, r.total_occurrences);
    BindI32(s.st, 7, r.completed_occurrences);
    BindU64(s.st, 8, r.last_completion_ms);
    BindI32(s.st, 9, r.is_active ? 1 : 0);
    BindU64(s.st, 10, r.created_at_ms);
    BindU64(s.st, 11, r.next_occurrence_ms);

    return Translate(db, sqlite3_step(s.st));
}

std::optional<model::ScheduleStateRecord>
SqliteRepository::GetScheduleState(Transaction& t, const std::string& note_id, const std::string& step_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kScheduleColumns +
        " FROM schedule_state WHERE note_id=? AND step_id=?;";

    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        ThrowQueryError(db);

    BindText(s.st, 1, note_id);
    BindText(s.st, 2, step_id);

    const int rc = sqlite3_step(s.st);
    if (rc == SQLITE_ROW) return ReadSchedule(s.st);
    if (rc != SQLITE_DONE) ThrowQueryError(db);
    return std::nullopt;
}

Result SqliteRepository::CompleteOccurrence(Transaction& t, const std::string& note_id, const std::string& step_id,
                                            uint64_t completed_at_ms, uint64_t next_occurrence_ms,
                                            std::optional<model::ScheduleStateRecord>& out) {
    out.reset();
    auto* db = TX(t).Handle();

    // single statement find-one-and-update; the row is only touched while active
    const std::string sql = std::string(
        "UPDATE schedule_state SET completed_occurrences=completed_occurrences+1, last_completion_ms=?,"
        " next_occurrence_ms=? WHERE note_id=? AND step_id=? AND is_active=1 RETURNING ") + kScheduleColumns + ";";

    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(s.st, 1, completed_at_ms);
    BindU64(s.st, 2, next_occurrence_ms);
    BindText(s.st, 3, note_id);
    BindText(s.st, 4, step_id);

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_ROW) {
        out = ReadSchedule(s.st);
        rc = sqlite3_step(s.st);
    }
    return Translate(db, rc);
}

Result SqliteRepository::SetNextOccurrence(Transaction& t, const std::string& note_id, const std::string& step_id,
                                           uint64_t next_occurrence_ms) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE schedule_state SET next_occurrence_ms=? WHERE note_id=? AND step_id=?;";

    Statement s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(s.st, 1, next_occurrence_ms);
    BindText(s.st, 2, note_id);
    BindText(s.st, 3, step_id);

    auto result = Translate(db, sqlite3_step(s.st));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::DeactivateScheduleState(Transaction& t, const std::string& note_id, const std::string& step_id) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE schedule_state SET is_active=0 WHERE note_id=? AND step_id=?;";

    Statement s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, note_id);
    BindText(s.st, 2, step_id);

    auto result = Translate(db, sqlite3_step(s.st));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::DeactivateNoteSchedules(Transaction& t, const std::string& note_id, std::size_t& deactivated) {
    deactivated = 0;
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE schedule_state SET is_active=0 WHERE note_id=? AND is_active=1;";

    Statement s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, note_id);

    auto result = Translate(db, sqlite3_step(s.st));
    if (result) deactivated = static_cast<std::size_t>(sqlite3_changes(db));
    return result;
}

std::vector<model::ScheduleStateRecord> SqliteRepository::ListScheduleStates(Transaction& t, const std::string& note_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kScheduleColumns +
        " FROM schedule_state WHERE note_id=? ORDER BY created_at_ms ASC, step_id ASC;";

    std::vector<model::ScheduleStateRecord> out;
    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        ThrowQueryError(db);

    BindText(s.st, 1, note_id);
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back(ReadSchedule(s.st));
    }
    if (rc != SQLITE_DONE) ThrowQueryError(db);
    return out;
}

std::vector<model::ScheduleStateRecord> SqliteRepository::ListActiveScheduleStates(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kScheduleColumns +
        " FROM schedule_state WHERE is_active=1 ORDER BY note_id ASC, step_id ASC;";

    std::vector<model::ScheduleStateRecord> out;
    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        ThrowQueryError(db);

    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back(ReadSchedule(s.st));
    }
    if (rc != SQLITE_DONE) ThrowQueryError(db);
    return out;
}

// ------------------------------------------------------------------
// Actionable steps
// ------------------------------------------------------------------

Result SqliteRepository::InsertActionableSteps(Transaction& t, const std::vector<model::ActionableStepRecord>& steps) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO actionable_step(") + kStepColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& r : steps) {
        sqlite3_reset(s.st);
        sqlite3_clear_bindings(s.st);

        BindText(s.st, 1, r.id);
        BindText(s.st, 2, r.note_id);
        BindText(s.st, 3, r.patient_id);
        BindI32(s.st, 4, static_cast<int>(r.type));
        BindI32(s.st, 5, static_cast<int>(r.status));
        BindText(s.st, 6, r.description);
        BindI32(s.st, 7, static_cast<int>(r.priority));
        BindText(s.st, 8, r.schedule_json);
        BindU64(s.st, 9, r.start_date_ms);
        BindU64(s.st, 10, r.due_date_ms);
        BindU64(s.st, 11, r.created_at_ms);
        BindI32(s.st, 12, r.position);

        auto result = Translate(db, sqlite3_step(s.st));
        if (!result) return result;
    }
    return Result::Ok();
}

std::vector<model::ActionableStepRecord> SqliteRepository::ListActionableSteps(Transaction& t, const std::string& note_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kStepColumns +
        " FROM actionable_step WHERE note_id=? ORDER BY position ASC;";

    std::vector<model::ActionableStepRecord> out;
    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK)
        ThrowQueryError(db);

    BindText(s.st, 1, note_id);
    int rc;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
        out.push_back(ReadStep(s.st));
    }
    if (rc != SQLITE_DONE) ThrowQueryError(db);
    return out;
}

Result SqliteRepository::DeleteActionableSteps(Transaction& t, const std::string& note_id, std::size_t& deleted) {
    deleted = 0;
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM actionable_step WHERE note_id=?;";

    Statement s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(s.st, 1, note_id);

    auto result = Translate(db, sqlite3_step(s.st));
    if (result) deleted = static_cast<std::size_t>(sqlite3_changes(db));
    return result;
}

Result SqliteRepository::UpdateStepStatus(Transaction& t, const std::string& step_id, caretask::v1::StepStatus status) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE actionable_step SET status=? WHERE id=?;";

    Statement s;
    if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(s.st, 1, static_cast<int>(status));
    BindText(s.st, 2, step_id);

    auto result = Translate(db, sqlite3_step(s.st));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

} // namespace caretask::db::sqlite
