#pragma once

#include <string>

#include "caretask/v1/schedule.pb.h"
#include "caretask/v1/steps.pb.h"
#include "internal/db/model/actionable_step_record.hpp"
#include "internal/db/model/schedule_state_record.hpp"

namespace caretask::core {

/*
  Conversions between persisted rows and wire messages.

  Embedded schedule definitions are stored as protobuf JSON so every backend
  round-trips them byte-for-byte through the same codec.
*/

std::string                      ScheduleToJson(const caretask::v1::ScheduleDefinition& schedule);
caretask::v1::ScheduleDefinition ScheduleFromJson(const std::string& json);

caretask::v1::ScheduleState  ToScheduleState(const db::model::ScheduleStateRecord& record);
caretask::v1::ActionableStep ToActionableStep(const db::model::ActionableStepRecord& record);

} // namespace caretask::core
