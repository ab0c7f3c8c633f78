#include "internal/schedule/recurrence.hpp"

#include <charconv>
#include <string>

#include "internal/util/errors.hpp"

namespace caretask::schedule {

using caretask::v1::ScheduleDefinition;

namespace {

// 8am-8pm window spread over times_per_day
constexpr std::chrono::milliseconds kActiveWindow = std::chrono::hours(12);

bool ParseDigits(std::string_view text, std::size_t min_len, std::size_t max_len, int& out) {
  if (text.size() < min_len || text.size() > max_len) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::optional<util::TimePoint> NextFixedTime(const ScheduleDefinition& schedule, util::TimePoint now) {
  if (schedule.specific_times().empty()) return std::nullopt;

  const auto today = util::StartOfDay(now);

  std::optional<util::TimePoint> first;
  for (const auto& text : schedule.specific_times()) {
    const auto at        = ParseClockTime(text);
    const auto candidate = today + std::chrono::hours(at.hour) + std::chrono::minutes(at.minute);
    if (!first) first = candidate;
    if (candidate > now) return candidate;
  }

  // every listed time has passed today
  return *first + util::Days(1);
}

} // namespace

ClockTime ParseClockTime(std::string_view text) {
  const auto colon = text.find(':');
  ClockTime  out;
  if (colon == std::string_view::npos || !ParseDigits(text.substr(0, colon), 1, 2, out.hour) ||
      !ParseDigits(text.substr(colon + 1), 2, 2, out.minute) || out.hour > 23 || out.minute > 59) {
    throw util::ValidationError("invalid time of day '" + std::string(text) + "', expected HH:MM");
  }
  return out;
}

std::optional<util::TimePoint> NextOccurrence(const ScheduleDefinition& schedule, std::optional<util::TimePoint> last_completion,
                                              util::TimePoint now) {
  if (last_completion && util::StartOfDay(*last_completion) >= util::StartOfDay(now)) {
    return std::nullopt;
  }

  switch (schedule.type()) {
    case caretask::v1::SCHEDULE_TYPE_FIXED_TIME:
      return NextFixedTime(schedule, now);

    case caretask::v1::SCHEDULE_TYPE_INTERVAL_BASED:
      if (!schedule.has_interval_hours() || schedule.interval_hours() <= 0) return std::nullopt;
      return now + std::chrono::hours(schedule.interval_hours());

    case caretask::v1::SCHEDULE_TYPE_FREQUENCY_BASED:
      if (!schedule.has_times_per_day() || schedule.times_per_day() <= 0) return std::nullopt;
      return now + kActiveWindow / schedule.times_per_day();

    default:
      return std::nullopt;
  }
}

void ValidateScheduleDefinition(const ScheduleDefinition& schedule) {
  if (schedule.duration() <= 0) {
    throw util::ValidationError("schedule duration must be a positive number of days");
  }

  switch (schedule.type()) {
    case caretask::v1::SCHEDULE_TYPE_FIXED_TIME:
      if (schedule.specific_times().empty()) {
        throw util::ValidationError("fixed_time schedule requires specific_times");
      }
      for (const auto& text : schedule.specific_times()) {
        ParseClockTime(text);
      }
      return;

    case caretask::v1::SCHEDULE_TYPE_INTERVAL_BASED:
      if (!schedule.has_interval_hours() || schedule.interval_hours() <= 0) {
        throw util::ValidationError("interval_based schedule requires a positive interval_hours");
      }
      return;

    case caretask::v1::SCHEDULE_TYPE_FREQUENCY_BASED:
      if (!schedule.has_times_per_day() || schedule.times_per_day() <= 0) {
        throw util::ValidationError("frequency_based schedule requires a positive times_per_day");
      }
      return;

    default:
      throw util::ValidationError("schedule type is required");
  }
}

} // namespace caretask::schedule
