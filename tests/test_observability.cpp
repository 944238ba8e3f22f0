#include "test_framework.hpp"

#include "calsched/config/schema.hpp"
#include "calsched/observability/factory.hpp"
#include "calsched/observability/global.hpp"
#include "calsched/observability/log_observer.hpp"
#include "helpers/test_helpers.hpp"

#include <memory>
#include <sstream>

void register_observability_tests(std::vector<calsched::tests::TestCase> &tests) {
  using calsched::tests::require;
  namespace obs = calsched::observability;

  tests.push_back({"observer_factory_backends", [] {
                     calsched::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.observability.backend = "";
                     require(obs::create_observer(config)->name() == "noop", "empty -> noop");
                     config.observability.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log -> log");
                     config.observability.backend = "log,noop";
                     require(obs::create_observer(config)->name() == "multi", "list -> multi");
                     config.observability.backend = "statsd";
                     require(obs::create_observer(config)->name() == "log", "unknown -> log");
                   }});

  tests.push_back({"observer_known_backends", [] {
                     require(obs::is_known_backend("log"), "log");
                     require(obs::is_known_backend("noop, log"), "list");
                     require(!obs::is_known_backend("log,statsd"), "list with unknown");
                     require(!obs::is_known_backend("prometheus"), "unknown");
                   }});

  tests.push_back({"log_observer_formats_lines", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out);
                     calsched::schedule::CalendarIntervalTrigger trigger;
                     trigger.repeat_interval = 3;
                     trigger.repeat_interval_unit = calsched::schedule::IntervalUnit::Month;
                     trigger.misfire_instruction = calsched::schedule::misfire::kDoNothing;
                     observer.record_event(obs::ScheduleLoadedEvent{.name = "report",
                                                                    .schedule = trigger});
                     observer.record_event(obs::ErrorEvent{.component = "config",
                                                           .message = "broken"});
                     observer.record_metric(obs::SchedulesLoadedMetric{.count = 4});
                     const std::string text = out.str();
                     require(text.find("[INFO] schedule.loaded name=report interval=3 unit=month "
                                       "misfire=DoNothing") != std::string::npos,
                             "missing schedule line: " + text);
                     require(text.find("[ERROR] config: broken") != std::string::npos,
                             "missing error line: " + text);
                     require(text.find("[DEBUG] metric.schedules_loaded=4") != std::string::npos,
                             "missing metric line: " + text);
                   }});

  tests.push_back({"observer_backend_list_fans_out", [] {
                     std::ostringstream out;
                     calsched::config::Config config;
                     config.observability.backend = "log, noop, log";
                     auto observer = obs::create_observer(config, out);
                     require(observer->name() == "multi", "list -> multi");
                     observer->record_event(obs::ConfigLoadedEvent{.path = "a.toml",
                                                                   .schedule_count = 2});
                     observer->record_metric(obs::ConfigWarningsMetric{.count = 1});
                     observer->flush();
                     const std::string text = out.str();
                     const std::string line = "[INFO] config.loaded path=a.toml schedules=2\n";
                     require(text.find(line + line) != std::string::npos,
                             "each log entry should write the event: " + text);
                     require(text.find("[DEBUG] metric.config_warnings=1\n"
                                       "[DEBUG] metric.config_warnings=1\n") != std::string::npos,
                             "each log entry should write the metric: " + text);
                   }});

  tests.push_back({"observer_factory_writes_to_given_stream", [] {
                     std::ostringstream out;
                     calsched::config::Config config;
                     config.observability.backend = "log";
                     auto observer = obs::create_observer(config, out);
                     observer->record_event(obs::ErrorEvent{.component = "cli", .message = "x"});
                     require(out.str() == "[ERROR] cli: x\n", "unexpected log: " + out.str());

                     std::ostringstream quiet;
                     config.observability.backend = "none";
                     auto noop = obs::create_observer(config, quiet);
                     noop->record_event(obs::ErrorEvent{.component = "cli", .message = "x"});
                     noop->flush();
                     require(quiet.str().empty(), "noop backend should write nothing");
                   }});

  tests.push_back({"global_observer_helpers", [] {
                     {
                       calsched::testing::GlobalObserverGuard guard;
                       obs::record_schedule_rejected("codec", "bad");
                       obs::record_config_loaded("memory", 2);
                       obs::record_error("cli", "oops");
                       require(guard.log().events.size() == 3, "three events expected");
                       require(guard.count_events<obs::ConfigLoadedEvent>() == 1,
                               "config loaded event");
                     }
                     require(obs::get_global_observer() == nullptr,
                             "guard should uninstall the observer");
                     obs::record_error("cli", "dropped without an observer");
                   }});
}
