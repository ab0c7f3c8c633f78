#include "internal/core/extracted_payload_parser.hpp"

#include <cassert>
#include <functional>
#include <iostream>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using caretask::core::ParseExtractedPayload;
using caretask::core::ParsePriority;
using caretask::core::ParseScheduleType;

bool ThrowsValidation(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const caretask::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestParsesChecklistAndPlan() {
  const auto parsed = ParseExtractedPayload(R"({
    "checklist": [
      {"description": "Buy a thermometer", "priority": "High"},
      {"description": "Book a follow-up"}
    ],
    "plan": [
      {"description": "Take amoxicillin", "start_date": "2025-03-10", "duration": 7,
       "frequency": "fixed_time", "specific_times": ["08:00", "20:00"]},
      {"description": "Check temperature", "duration": 3, "frequency": "interval_based",
       "interval_hours": 6, "patient_id": "patient-2"},
      {"description": "Drink water", "duration": 2, "frequency": "FREQUENCY_BASED", "times_per_day": 4,
       "notes": "ignored"}
    ]
  })",
                                            "patient-1");

  assert(parsed.checklist.size() == 2);
  assert(parsed.checklist[0].description() == "Buy a thermometer");
  assert(parsed.checklist[0].priority() == caretask::v1::PRIORITY_HIGH);
  assert(parsed.checklist[1].priority() == caretask::v1::PRIORITY_UNSPECIFIED);

  assert(parsed.plan.size() == 3);

  const auto& fixed = parsed.plan[0];
  assert(fixed.patient_id() == "patient-1");
  assert(caretask::util::FromProto(fixed.start_date()) == caretask::util::ParseDate("2025-03-10"));
  assert(fixed.schedule().type() == caretask::v1::SCHEDULE_TYPE_FIXED_TIME);
  assert(fixed.schedule().duration() == 7);
  assert(fixed.schedule().specific_times_size() == 2);
  assert(fixed.schedule().specific_times(1) == "20:00");
  assert(!fixed.schedule().has_interval_hours());

  const auto& interval = parsed.plan[1];
  assert(interval.patient_id() == "patient-2");
  assert(!interval.has_start_date());
  assert(interval.schedule().type() == caretask::v1::SCHEDULE_TYPE_INTERVAL_BASED);
  assert(interval.schedule().interval_hours() == 6);

  const auto& frequency = parsed.plan[2];
  assert(frequency.schedule().type() == caretask::v1::SCHEDULE_TYPE_FREQUENCY_BASED);
  assert(frequency.schedule().times_per_day() == 4);
}

void TestEmptyListsAreAccepted() {
  const auto parsed = ParseExtractedPayload(R"({"checklist": [], "plan": []})", "patient-1");
  assert(parsed.checklist.empty());
  assert(parsed.plan.empty());
}

void TestRejectsMalformedPayloads() {
  assert(ThrowsValidation([] { ParseExtractedPayload("not json", "p"); }));
  assert(ThrowsValidation([] { ParseExtractedPayload(R"({"checklist": []})", "p"); }));
  assert(ThrowsValidation([] { ParseExtractedPayload(R"({"plan": []})", "p"); }));
  assert(ThrowsValidation([] { ParseExtractedPayload(R"({"checklist": {}, "plan": []})", "p"); }));
  assert(ThrowsValidation([] { ParseExtractedPayload(R"({"checklist": [{"priority": "low"}], "plan": []})", "p"); }));
  assert(ThrowsValidation(
      [] { ParseExtractedPayload(R"({"checklist": [], "plan": [{"description": "x", "duration": 1, "frequency": "weekly"}]})", "p"); }));
  assert(ThrowsValidation([] {
    ParseExtractedPayload(
        R"({"checklist": [], "plan": [{"description": "x", "duration": 1, "frequency": "interval_based", "start_date": "03/10/2025"}]})",
        "p");
  }));
}

void TestPriorityAndTypeNames() {
  assert(ParsePriority("") == caretask::v1::PRIORITY_UNSPECIFIED);
  assert(ParsePriority("normal") == caretask::v1::PRIORITY_UNSPECIFIED);
  assert(ParsePriority("LOW") == caretask::v1::PRIORITY_LOW);
  assert(ParsePriority("medium") == caretask::v1::PRIORITY_MEDIUM);
  assert(ThrowsValidation([] { ParsePriority("urgent"); }));

  assert(ParseScheduleType("fixed_time") == caretask::v1::SCHEDULE_TYPE_FIXED_TIME);
  assert(ParseScheduleType("Interval_Based") == caretask::v1::SCHEDULE_TYPE_INTERVAL_BASED);
  assert(ThrowsValidation([] { ParseScheduleType("daily"); }));
}

} // namespace

int main() {
  TestParsesChecklistAndPlan();
  TestEmptyListsAreAccepted();
  TestRejectsMalformedPayloads();
  TestPriorityAndTypeNames();

  std::cout << "caretask_unit_extracted_payload_parser: pass\n";
  return 0;
}
