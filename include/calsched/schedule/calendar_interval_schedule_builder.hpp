#pragma once

#include "calsched/schedule/calendar_interval_trigger.hpp"
#include "calsched/schedule/interval_unit.hpp"

namespace calsched::schedule {

class ScheduleCodec;

/// Fluent builder for calendar-interval schedules (every N seconds, minutes,
/// ..., years).
///
///   auto trigger = CalendarIntervalScheduleBuilder::create()
///                      .with_interval_in_months(3)
///                      .with_misfire_handling_instruction_do_nothing()
///                      .build();
///
/// Configuration calls mutate this builder and return it. build() takes a
/// snapshot and leaves the builder as it was, so one builder can produce
/// several triggers. Copies of a builder are independent.
///
/// Every interval setter throws std::invalid_argument for values <= 0 and
/// leaves both interval and unit unchanged in that case.
class CalendarIntervalScheduleBuilder {
public:
  /// Starts from interval 1, unit Day, SmartPolicy.
  [[nodiscard]] static CalendarIntervalScheduleBuilder create();

  [[nodiscard]] CalendarIntervalTrigger build() const;

  CalendarIntervalScheduleBuilder &with_interval(int interval, IntervalUnit unit);
  CalendarIntervalScheduleBuilder &with_interval_in_seconds(int interval_in_seconds);
  CalendarIntervalScheduleBuilder &with_interval_in_minutes(int interval_in_minutes);
  CalendarIntervalScheduleBuilder &with_interval_in_hours(int interval_in_hours);
  CalendarIntervalScheduleBuilder &with_interval_in_days(int interval_in_days);
  CalendarIntervalScheduleBuilder &with_interval_in_weeks(int interval_in_weeks);
  CalendarIntervalScheduleBuilder &with_interval_in_months(int interval_in_months);
  CalendarIntervalScheduleBuilder &with_interval_in_years(int interval_in_years);

  CalendarIntervalScheduleBuilder &with_misfire_handling_instruction_ignore_misfires();
  CalendarIntervalScheduleBuilder &with_misfire_handling_instruction_do_nothing();
  CalendarIntervalScheduleBuilder &with_misfire_handling_instruction_fire_and_proceed();

private:
  friend class ScheduleCodec;

  CalendarIntervalScheduleBuilder() = default;

  // Restores a previously persisted code verbatim. Whether the code is legal
  // for this trigger kind is decided by the firing engine.
  CalendarIntervalScheduleBuilder &with_misfire_handling_instruction(int misfire_instruction);

  static void validate_interval(int interval);

  int interval_ = 1;
  IntervalUnit interval_unit_ = IntervalUnit::Day;
  int misfire_instruction_ = misfire::kSmartPolicy;
};

} // namespace calsched::schedule
