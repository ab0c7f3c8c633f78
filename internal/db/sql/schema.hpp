#pragma once

namespace caretask::db::sql {

/*
  Bootstrap DDL per backend. Statements are idempotent.
*/

static constexpr const char* kSqliteSchema[] = {
    "CREATE TABLE IF NOT EXISTS schedule_state ("
    " note_id TEXT NOT NULL, step_id TEXT NOT NULL, patient_id TEXT NOT NULL, description TEXT NOT NULL,"
    " schedule_json TEXT NOT NULL, total_occurrences INTEGER NOT NULL, completed_occurrences INTEGER NOT NULL,"
    " last_completion_ms INTEGER NOT NULL DEFAULT 0, is_active INTEGER NOT NULL, created_at_ms INTEGER NOT NULL,"
    " next_occurrence_ms INTEGER NOT NULL DEFAULT 0,"
    " PRIMARY KEY (note_id, step_id));",
    "CREATE INDEX IF NOT EXISTS schedule_state_active_idx ON schedule_state(is_active);",
    "CREATE TABLE IF NOT EXISTS actionable_step ("
    " id TEXT PRIMARY KEY, note_id TEXT NOT NULL, patient_id TEXT NOT NULL, type INTEGER NOT NULL,"
    " status INTEGER NOT NULL, description TEXT NOT NULL, priority INTEGER NOT NULL, schedule_json TEXT NOT NULL,"
    " start_date_ms INTEGER NOT NULL, due_date_ms INTEGER NOT NULL, created_at_ms INTEGER NOT NULL,"
    " position INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS actionable_step_note_idx ON actionable_step(note_id, position);",
};

static constexpr const char* kPostgresSchema[] = {
    "CREATE TABLE IF NOT EXISTS schedule_state ("
    " note_id TEXT NOT NULL, step_id TEXT NOT NULL, patient_id TEXT NOT NULL, description TEXT NOT NULL,"
    " schedule_json JSONB NOT NULL, total_occurrences INTEGER NOT NULL, completed_occurrences INTEGER NOT NULL,"
    " last_completion_ms BIGINT NOT NULL DEFAULT 0, is_active BOOLEAN NOT NULL, created_at_ms BIGINT NOT NULL,"
    " next_occurrence_ms BIGINT NOT NULL DEFAULT 0,"
    " PRIMARY KEY (note_id, step_id));",
    "CREATE INDEX IF NOT EXISTS schedule_state_active_idx ON schedule_state(is_active);",
    "CREATE TABLE IF NOT EXISTS actionable_step ("
    " id TEXT PRIMARY KEY, note_id TEXT NOT NULL, patient_id TEXT NOT NULL, type SMALLINT NOT NULL,"
    " status SMALLINT NOT NULL, description TEXT NOT NULL, priority SMALLINT NOT NULL, schedule_json TEXT NOT NULL,"
    " start_date_ms BIGINT NOT NULL, due_date_ms BIGINT NOT NULL, created_at_ms BIGINT NOT NULL,"
    " position INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS actionable_step_note_idx ON actionable_step(note_id, position);",
};

} // namespace caretask::db::sql
