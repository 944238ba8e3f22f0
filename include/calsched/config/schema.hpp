#pragma once

#include "calsched/schedule/calendar_interval_trigger.hpp"

#include <string>
#include <vector>

namespace calsched::config {

struct ObservabilityConfig {
  std::string backend = "none";
};

struct ScheduleDefinition {
  std::string name;
  schedule::CalendarIntervalTrigger trigger;
};

struct Config {
  ObservabilityConfig observability;
  // Sorted by name.
  std::vector<ScheduleDefinition> schedules;
};

} // namespace calsched::config
