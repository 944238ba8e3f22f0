#include "calsched/observability/global.hpp"

#include <mutex>

namespace calsched::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_schedule_loaded(const std::string &name,
                            const schedule::CalendarIntervalTrigger &trigger) {
  record_event(ScheduleLoadedEvent{.name = name, .schedule = trigger});
}

void record_schedule_rejected(const std::string &source, const std::string &reason) {
  record_event(ScheduleRejectedEvent{.source = source, .reason = reason});
}

void record_config_loaded(const std::string &path, const std::size_t schedule_count) {
  record_event(ConfigLoadedEvent{.path = path, .schedule_count = schedule_count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace calsched::observability
