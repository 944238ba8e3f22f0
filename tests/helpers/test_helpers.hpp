#pragma once

#include "calsched/observability/observer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace calsched::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

  std::string key;
  std::optional<std::string> old_value;
};

/// Points config loading at `next` for the guard's lifetime.
struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next);
  ~ConfigOverrideGuard();

  ConfigOverrideGuard(const ConfigOverrideGuard &) = delete;
  ConfigOverrideGuard &operator=(const ConfigOverrideGuard &) = delete;

  std::optional<std::filesystem::path> old_override;
};

/// Appends everything it receives to a log owned by the caller, so the log
/// stays readable after the observer is handed to the global registry.
class RecordingObserver final : public observability::IObserver {
public:
  struct Log {
    std::vector<observability::ObserverEvent> events;
    std::vector<observability::ObserverMetric> metrics;
    std::size_t flushes = 0;
  };

  explicit RecordingObserver(Log &log) : log_(log) {}

  void record_event(const observability::ObserverEvent &event) override {
    log_.events.push_back(event);
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    log_.metrics.push_back(metric);
  }
  void flush() override { ++log_.flushes; }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  Log &log_;
};

/// Installs a RecordingObserver globally and removes it on destruction.
class GlobalObserverGuard {
public:
  GlobalObserverGuard();
  ~GlobalObserverGuard();

  GlobalObserverGuard(const GlobalObserverGuard &) = delete;
  GlobalObserverGuard &operator=(const GlobalObserverGuard &) = delete;

  [[nodiscard]] const RecordingObserver::Log &log() const { return log_; }

  template <typename Event> [[nodiscard]] std::size_t count_events() const {
    std::size_t count = 0;
    for (const auto &event : log_.events) {
      if (std::holds_alternative<Event>(event)) {
        ++count;
      }
    }
    return count;
  }

private:
  RecordingObserver::Log log_;
};

} // namespace calsched::testing
