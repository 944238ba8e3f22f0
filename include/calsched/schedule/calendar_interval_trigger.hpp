#pragma once

#include "calsched/schedule/interval_unit.hpp"
#include "calsched/schedule/misfire_instruction.hpp"

namespace calsched::schedule {

/// Schedule half of a calendar-interval trigger. The trigger assembly layer
/// adds identity, job binding and start/end bounds on top of these fields.
struct CalendarIntervalTrigger {
  int repeat_interval = 1;
  IntervalUnit repeat_interval_unit = IntervalUnit::Day;
  int misfire_instruction = misfire::kSmartPolicy;

  bool operator==(const CalendarIntervalTrigger &) const = default;
};

} // namespace calsched::schedule
