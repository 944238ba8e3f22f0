#pragma once

#include "calsched/schedule/calendar_interval_trigger.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace calsched::observability {

struct ScheduleLoadedEvent {
  std::string name;
  schedule::CalendarIntervalTrigger schedule;
};

struct ScheduleRejectedEvent {
  std::string source;
  std::string reason;
};

struct ConfigLoadedEvent {
  std::string path;
  std::size_t schedule_count = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ScheduleLoadedEvent, ScheduleRejectedEvent, ConfigLoadedEvent, ErrorEvent>;

struct SchedulesLoadedMetric {
  std::uint64_t count = 0;
};

struct ConfigWarningsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<SchedulesLoadedMetric, ConfigWarningsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace calsched::observability
