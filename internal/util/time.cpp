#include "time.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace caretask::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

TimePoint StartOfDay(TimePoint tp) {
  return std::chrono::floor<Days>(tp);
}

namespace {

// Digits only; no sign, no padding.
int ParseDigits(const std::string& text, std::size_t pos, std::size_t len) {
  int value = 0;
  for (std::size_t i = pos; i < pos + len; ++i) {
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

bool IsDateShape(const std::string& date) {
  if (date.size() != 10) return false;
  for (std::size_t i = 0; i < date.size(); ++i) {
    const bool separator = i == 4 || i == 7;
    if (separator ? date[i] != '-' : !std::isdigit(static_cast<unsigned char>(date[i]))) return false;
  }
  return true;
}

} // namespace

TimePoint ParseDate(const std::string& date) {
  if (!IsDateShape(date)) {
    throw ValidationError("invalid date '" + date + "': expected YYYY-MM-DD");
  }
  const int year  = ParseDigits(date, 0, 4);
  const int month = ParseDigits(date, 5, 2);
  const int day   = ParseDigits(date, 8, 2);

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    throw ValidationError("invalid date '" + date + "': no such calendar day");
  }
  return std::chrono::sys_days{ymd};
}

TimePoint SystemTimeSource::Now() const {
  return util::Now();
}

TimePoint ManualTimeSource::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualTimeSource::Set(TimePoint tp) {
  std::lock_guard lock(mutex_);
  now_ = tp;
}

void ManualTimeSource::Advance(Clock::duration delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

} // namespace caretask::util
