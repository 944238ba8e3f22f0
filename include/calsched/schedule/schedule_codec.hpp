#pragma once

#include "calsched/common/result.hpp"
#include "calsched/schedule/calendar_interval_schedule_builder.hpp"

#include <optional>
#include <string>

namespace calsched::schedule {

/// Text form of a calendar-interval schedule:
///
///   interval=3;unit=month;misfire=2
///
/// decode() is the trusted path that restores persisted schedules, so it
/// applies the misfire code through the builder's raw setter and keeps codes
/// outside the documented set.
///
/// decode() and from_fields() are public: any caller can set a raw code such
/// as "misfire=99" through them. Nothing enforces that only persisted text
/// reaches this class. Code that takes policies from users goes through the
/// builder's named setters instead (see the CLI encode command), and
/// config::validate_config() warns about undocumented codes.
class ScheduleCodec {
public:
  [[nodiscard]] static std::string encode(const CalendarIntervalTrigger &trigger);

  [[nodiscard]] static common::Result<CalendarIntervalScheduleBuilder>
  decode(const std::string &text);

  /// Same rules as decode() for fields that were already split apart, e.g.
  /// the keys of a config table. Absent interval is 1, absent unit is Day.
  [[nodiscard]] static common::Result<CalendarIntervalScheduleBuilder>
  from_fields(const std::optional<std::string> &interval_text,
              const std::optional<std::string> &unit_text,
              const std::optional<std::string> &misfire_text);
};

} // namespace calsched::schedule
