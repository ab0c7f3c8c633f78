#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace caretask::util {

/*
  Time utilities. Single place to control clock source.

  All schedule arithmetic happens on one clock (UTC wall time);
  calendar dates are whole days since the epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Days      = std::chrono::days;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Midnight of the calendar day containing tp.
TimePoint StartOfDay(TimePoint tp);

// "YYYY-MM-DD" -> midnight of that day. Throws ValidationError.
TimePoint ParseDate(const std::string& date);

/*
  Injectable source of "now".

  Production code uses SystemTimeSource; tests drive a ManualTimeSource.
*/
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override;
};

class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(TimePoint start) : now_(start) {
  }

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(Clock::duration delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

} // namespace caretask::util
