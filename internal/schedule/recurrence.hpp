#pragma once

#include <optional>
#include <string_view>

#include "caretask/v1/schedule.pb.h"
#include "internal/util/time.hpp"

namespace caretask::schedule {

struct ClockTime {
  int hour   = 0;
  int minute = 0;
};

// "H:MM" or "HH:MM", 24-hour. Throws util::ValidationError.
ClockTime ParseClockTime(std::string_view text);

/*
  Next instant at which the schedule is owed, or nullopt.

  At most one decision per calendar day: when last_completion falls on
  now's day (or later) nothing more is owed today. Missing or non-positive
  policy fields yield nullopt; a malformed fixed time throws
  util::ValidationError.
*/
std::optional<util::TimePoint> NextOccurrence(const caretask::v1::ScheduleDefinition& schedule,
                                              std::optional<util::TimePoint> last_completion,
                                              util::TimePoint now);

// Creation-time check that the definition carries its policy's fields.
// Throws util::ValidationError.
void ValidateScheduleDefinition(const caretask::v1::ScheduleDefinition& schedule);

} // namespace caretask::schedule
