#pragma once

#include <cstdint>
#include <string>

#include "caretask/v1/steps.pb.h"

namespace caretask::db::model {

struct ActionableStepRecord {
  std::string id;
  std::string note_id;
  std::string patient_id;

  caretask::v1::StepType   type   = caretask::v1::STEP_TYPE_UNSPECIFIED;
  caretask::v1::StepStatus status = caretask::v1::STEP_STATUS_UNSPECIFIED;

  std::string            description;
  caretask::v1::Priority priority = caretask::v1::PRIORITY_UNSPECIFIED;

  // caretask.v1.ScheduleDefinition as JSON, empty for checklist steps
  std::string schedule_json;

  // 0 = unset
  uint64_t start_date_ms = 0;
  uint64_t due_date_ms   = 0;
  uint64_t created_at_ms = 0;

  // Order within the note's step list
  int32_t position = 0;
};

}
