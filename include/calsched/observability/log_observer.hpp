#pragma once

#include "calsched/observability/observer.hpp"

#include <iostream>
#include <ostream>

namespace calsched::observability {

/// Writes "[LEVEL] message" lines, to stderr unless another stream is given.
class LogObserver final : public IObserver {
public:
  LogObserver() = default;
  explicit LogObserver(std::ostream &out) : out_(&out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override { out_->flush(); }
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream *out_ = &std::cerr;
};

} // namespace calsched::observability
