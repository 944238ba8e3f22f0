#include "calsched/observability/log_observer.hpp"

#include "calsched/schedule/misfire_instruction.hpp"

#include <type_traits>

namespace calsched::observability {

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScheduleLoadedEvent>) {
          log_line("INFO", "schedule.loaded name=" + evt.name +
                               " interval=" + std::to_string(evt.schedule.repeat_interval) +
                               " unit=" +
                               std::string(schedule::to_string(evt.schedule.repeat_interval_unit)) +
                               " misfire=" +
                               schedule::misfire::instruction_name(
                                   evt.schedule.misfire_instruction));
        } else if constexpr (std::is_same_v<T, ScheduleRejectedEvent>) {
          log_line("WARN", "schedule.rejected source=" + evt.source + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ConfigLoadedEvent>) {
          log_line("INFO", "config.loaded path=" + evt.path +
                               " schedules=" + std::to_string(evt.schedule_count));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SchedulesLoadedMetric>) {
          log_line("DEBUG", "metric.schedules_loaded=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ConfigWarningsMetric>) {
          log_line("DEBUG", "metric.config_warnings=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace calsched::observability
