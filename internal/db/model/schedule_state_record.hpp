#pragma once

#include <cstdint>
#include <string>

namespace caretask::db::model {

/*
  Persistent schedule-state row, one per (note_id, step_id).

  The embedded schedule definition is kept as protobuf JSON text so every
  backend stores it the same way.
*/

struct ScheduleStateRecord {
  std::string note_id;
  std::string step_id;
  std::string patient_id;
  std::string description;

  // caretask.v1.ScheduleDefinition as JSON
  std::string schedule_json;

  int32_t total_occurrences     = 0;
  int32_t completed_occurrences = 0;

  // 0 = never completed
  uint64_t last_completion_ms = 0;

  // Next owed occurrence as of the last store, completion or hydrate.
  // 0 = nothing owed.
  uint64_t next_occurrence_ms = 0;

  bool     is_active     = true;
  uint64_t created_at_ms = 0;
};

}
