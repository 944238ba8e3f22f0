#pragma once

#include "calsched/observability/observer.hpp"

#include <memory>

namespace calsched::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_schedule_loaded(const std::string &name,
                            const schedule::CalendarIntervalTrigger &trigger);
void record_schedule_rejected(const std::string &source, const std::string &reason);
void record_config_loaded(const std::string &path, std::size_t schedule_count);
void record_error(const std::string &component, const std::string &message);

} // namespace calsched::observability
