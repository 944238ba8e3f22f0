#include "calsched/observability/factory.hpp"

#include "calsched/common/text.hpp"
#include "calsched/observability/log_observer.hpp"

#include <vector>

namespace calsched::observability {

namespace {

bool is_noop_name(const std::string &name) {
  return name.empty() || name == "none" || name == "noop";
}

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

// Fan-out for backend lists such as "log,noop". Noop entries are not stored.
class BackendListObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer) { observers_.push_back(std::move(observer)); }

  void record_event(const ObserverEvent &event) override {
    for (auto &observer : observers_) {
      observer->record_event(event);
    }
  }

  void record_metric(const ObserverMetric &metric) override {
    for (auto &observer : observers_) {
      observer->record_metric(metric);
    }
  }

  void flush() override {
    for (auto &observer : observers_) {
      observer->flush();
    }
  }

  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config, std::ostream &log_out) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (is_noop_name(backend)) {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(log_out);
  }

  if (backend.find(',') != std::string::npos) {
    auto list = std::make_unique<BackendListObserver>();
    for (const auto &part : common::split_trimmed(backend, ',')) {
      if (part == "log") {
        list->add(std::make_unique<LogObserver>(log_out));
      }
    }
    return list;
  }

  return std::make_unique<LogObserver>(log_out);
}

bool is_known_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (is_noop_name(normalized) || normalized == "log") {
    return true;
  }
  if (normalized.find(',') == std::string::npos) {
    return false;
  }
  for (const auto &part : common::split_trimmed(normalized, ',')) {
    if (part != "log" && part != "noop" && part != "none") {
      return false;
    }
  }
  return true;
}

} // namespace calsched::observability
