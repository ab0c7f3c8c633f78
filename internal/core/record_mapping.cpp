#include "internal/core/record_mapping.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace caretask::core {

using namespace caretask::v1;

std::string ScheduleToJson(const ScheduleDefinition& schedule) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  const auto                               status = google::protobuf::util::MessageToJsonString(schedule, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("serialize schedule definition: " + std::string(status.message()));
  }
  return json;
}

ScheduleDefinition ScheduleFromJson(const std::string& json) {
  ScheduleDefinition schedule;
  if (json.empty()) return schedule;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &schedule, options);
  if (!status.ok()) {
    throw util::StoreUnavailable("stored schedule definition is unreadable: " + std::string(status.message()));
  }
  return schedule;
}

ScheduleState ToScheduleState(const db::model::ScheduleStateRecord& record) {
  ScheduleState state;
  state.set_note_id(record.note_id);
  state.set_step_id(record.step_id);
  state.set_patient_id(record.patient_id);
  state.set_description(record.description);
  *state.mutable_schedule() = ScheduleFromJson(record.schedule_json);
  state.set_total_occurrences(record.total_occurrences);
  state.set_completed_occurrences(record.completed_occurrences);
  if (record.last_completion_ms != 0) {
    *state.mutable_last_completion() = util::ToProto(util::FromUnixMillis(record.last_completion_ms));
  }
  state.set_is_active(record.is_active);
  *state.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  if (record.next_occurrence_ms != 0) {
    *state.mutable_next_occurrence() = util::ToProto(util::FromUnixMillis(record.next_occurrence_ms));
  }
  return state;
}

ActionableStep ToActionableStep(const db::model::ActionableStepRecord& record) {
  ActionableStep step;
  step.set_id(record.id);
  step.set_note_id(record.note_id);
  step.set_patient_id(record.patient_id);
  step.set_type(record.type);
  step.set_status(record.status);
  step.set_description(record.description);
  step.set_priority(record.priority);
  if (!record.schedule_json.empty()) {
    *step.mutable_schedule() = ScheduleFromJson(record.schedule_json);
  }
  if (record.start_date_ms != 0) *step.mutable_start_date() = util::ToProto(util::FromUnixMillis(record.start_date_ms));
  if (record.due_date_ms != 0) *step.mutable_due_date() = util::ToProto(util::FromUnixMillis(record.due_date_ms));
  *step.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return step;
}

} // namespace caretask::core
