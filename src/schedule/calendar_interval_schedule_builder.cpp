#include "calsched/schedule/calendar_interval_schedule_builder.hpp"

#include <stdexcept>

namespace calsched::schedule {

CalendarIntervalScheduleBuilder CalendarIntervalScheduleBuilder::create() {
  return CalendarIntervalScheduleBuilder();
}

CalendarIntervalTrigger CalendarIntervalScheduleBuilder::build() const {
  CalendarIntervalTrigger trigger;
  trigger.repeat_interval = interval_;
  trigger.repeat_interval_unit = interval_unit_;
  trigger.misfire_instruction = misfire_instruction_;
  return trigger;
}

CalendarIntervalScheduleBuilder &CalendarIntervalScheduleBuilder::with_interval(const int interval,
                                                                              const IntervalUnit unit) {
  validate_interval(interval);
  interval_ = interval;
  interval_unit_ = unit;
  return *this;
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_interval_in_seconds(const int interval_in_seconds) {
  return with_interval(interval_in_seconds, IntervalUnit::Second);
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_interval_in_minutes(const int interval_in_minutes) {
  return with_interval(interval_in_minutes, IntervalUnit::Minute);
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_interval_in_hours(const int interval_in_hours) {
  return with_interval(interval_in_hours, IntervalUnit::Hour);
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_interval_in_days(const int interval_in_days) {
  return with_interval(interval_in_days, IntervalUnit::Day);
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_interval_in_weeks(const int interval_in_weeks) {
  return with_interval(interval_in_weeks, IntervalUnit::Week);
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_interval_in_months(const int interval_in_months) {
  return with_interval(interval_in_months, IntervalUnit::Month);
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_interval_in_years(const int interval_in_years) {
  return with_interval(interval_in_years, IntervalUnit::Year);
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_misfire_handling_instruction_ignore_misfires() {
  misfire_instruction_ = misfire::kIgnoreMisfirePolicy;
  return *this;
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_misfire_handling_instruction_do_nothing() {
  misfire_instruction_ = misfire::kDoNothing;
  return *this;
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_misfire_handling_instruction_fire_and_proceed() {
  misfire_instruction_ = misfire::kFireOnceNow;
  return *this;
}

CalendarIntervalScheduleBuilder &
CalendarIntervalScheduleBuilder::with_misfire_handling_instruction(const int misfire_instruction) {
  misfire_instruction_ = misfire_instruction;
  return *this;
}

void CalendarIntervalScheduleBuilder::validate_interval(const int interval) {
  if (interval <= 0) {
    throw std::invalid_argument("Interval must be a positive value.");
  }
}

} // namespace calsched::schedule
