#include "internal/core/extracted_payload_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>

#include "caretask/v1/extraction.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace caretask::core {

using namespace caretask::v1;

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

void RequireList(const google::protobuf::Struct& root, const std::string& key) {
  const auto it = root.fields().find(key);
  if (it == root.fields().end()) {
    throw util::ValidationError("extracted payload is missing '" + key + "'");
  }
  if (it->second.kind_case() != google::protobuf::Value::kListValue) {
    throw util::ValidationError("extracted payload '" + key + "' must be a list");
  }
}

} // namespace

Priority ParsePriority(const std::string& text) {
  const auto value = Lower(text);
  if (value.empty() || value == "normal") return PRIORITY_UNSPECIFIED;
  if (value == "low") return PRIORITY_LOW;
  if (value == "medium") return PRIORITY_MEDIUM;
  if (value == "high") return PRIORITY_HIGH;
  throw util::ValidationError("unknown priority '" + text + "'");
}

ScheduleType ParseScheduleType(const std::string& text) {
  const auto value = Lower(text);
  if (value == "fixed_time") return SCHEDULE_TYPE_FIXED_TIME;
  if (value == "interval_based") return SCHEDULE_TYPE_INTERVAL_BASED;
  if (value == "frequency_based") return SCHEDULE_TYPE_FREQUENCY_BASED;
  throw util::ValidationError("unknown frequency '" + text + "'");
}

ParsedPayload ParseExtractedPayload(const std::string& json, const std::string& patient_id) {
  // shape check first; JsonStringToMessage would accept a payload missing either list
  google::protobuf::Struct root;
  if (!google::protobuf::util::JsonStringToMessage(json, &root).ok()) {
    throw util::ValidationError("extracted payload is not a JSON object");
  }
  RequireList(root, "checklist");
  RequireList(root, "plan");

  ExtractedPayload extracted;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &extracted, options);
  if (!status.ok()) {
    throw util::ValidationError("extracted payload is malformed: " + std::string(status.message()));
  }

  ParsedPayload out;
  out.checklist.reserve(extracted.checklist_size());
  for (const auto& item : extracted.checklist()) {
    if (item.description().empty()) throw util::ValidationError("checklist item has no description");

    ChecklistItem parsed;
    parsed.set_description(item.description());
    parsed.set_priority(ParsePriority(item.priority()));
    out.checklist.push_back(std::move(parsed));
  }

  out.plan.reserve(extracted.plan_size());
  for (const auto& item : extracted.plan()) {
    if (item.description().empty()) throw util::ValidationError("plan item has no description");

    PlanItem parsed;
    parsed.set_description(item.description());
    parsed.set_patient_id(item.patient_id().empty() ? patient_id : item.patient_id());
    if (!item.start_date().empty()) {
      *parsed.mutable_start_date() = util::ToProto(util::ParseDate(item.start_date()));
    }

    auto* schedule = parsed.mutable_schedule();
    schedule->set_type(ParseScheduleType(item.frequency()));
    schedule->set_duration(item.duration());
    for (const auto& time : item.specific_times()) {
      schedule->add_specific_times(time);
    }
    if (item.has_interval_hours()) schedule->set_interval_hours(item.interval_hours());
    if (item.has_times_per_day()) schedule->set_times_per_day(item.times_per_day());

    out.plan.push_back(std::move(parsed));
  }
  return out;
}

} // namespace caretask::core
