#pragma once

#include <string>
#include <vector>

#include "caretask/v1/steps.pb.h"

namespace caretask::core {

struct ParsedPayload {
  std::vector<caretask::v1::ChecklistItem> checklist;
  std::vector<caretask::v1::PlanItem>      plan;
};

/*
  Parses the text-extraction JSON:

    {"checklist": [{"description", "priority"}],
     "plan": [{"description", "start_date": "YYYY-MM-DD", "duration",
               "frequency", "specific_times", "interval_hours", "times_per_day"}]}

  Both top-level keys are required. Plan items without a patient_id take
  the one given here. Throws util::ValidationError.
*/
ParsedPayload ParseExtractedPayload(const std::string& json, const std::string& patient_id);

caretask::v1::Priority     ParsePriority(const std::string& text);
caretask::v1::ScheduleType ParseScheduleType(const std::string& text);

} // namespace caretask::core
