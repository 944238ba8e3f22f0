#include "calsched/config/config.hpp"

#include "calsched/common/fs.hpp"
#include "calsched/common/text.hpp"
#include "calsched/common/toml.hpp"
#include "calsched/observability/factory.hpp"
#include "calsched/observability/global.hpp"
#include "calsched/schedule/schedule_codec.hpp"

#include <cstdlib>

namespace calsched::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".calsched";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *SCHEDULES_TABLE = "schedules";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("CALSCHED_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> optional_field(const common::TomlDocument &doc, const std::string &key) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  return doc.get_string(key);
}

common::Result<std::vector<ScheduleDefinition>> load_schedules(const common::TomlDocument &doc) {
  std::vector<ScheduleDefinition> schedules;

  for (const auto &name : doc.child_names(SCHEDULES_TABLE)) {
    const std::string section = std::string(SCHEDULES_TABLE) + "." + name;
    for (const auto &key : doc.keys_in(section)) {
      if (key != "interval" && key != "unit" && key != "misfire") {
        return common::Result<std::vector<ScheduleDefinition>>::failure(
            section + ": unknown key '" + key + "'");
      }
    }

    auto builder = schedule::ScheduleCodec::from_fields(optional_field(doc, section + ".interval"),
                                                        optional_field(doc, section + ".unit"),
                                                        optional_field(doc, section + ".misfire"));
    if (!builder.ok()) {
      return common::Result<std::vector<ScheduleDefinition>>::failure(section + ": " +
                                                                      builder.error());
    }
    schedules.push_back(ScheduleDefinition{.name = name, .trigger = builder.value().build()});
  }

  return common::Result<std::vector<ScheduleDefinition>>::success(std::move(schedules));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("CALSCHED_OBSERVABILITY_BACKEND");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config_from_string(const std::string &content,
                                               const std::string &origin) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    observability::record_error("config", origin + ": " + parsed.error());
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  auto schedules = load_schedules(doc);
  if (!schedules.ok()) {
    observability::record_error("config", origin + ": " + schedules.error());
    return common::Result<Config>::failure(schedules.error());
  }
  config.schedules = std::move(schedules.value());

  apply_env_overrides(config);

  observability::record_config_loaded(origin, config.schedules.size());
  for (const auto &definition : config.schedules) {
    observability::record_schedule_loaded(definition.name, definition.trigger);
  }
  observability::record_metric(observability::SchedulesLoadedMetric{
      .count = static_cast<std::uint64_t>(config.schedules.size())});

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    observability::record_error("config", content.error());
    return common::Result<Config>::failure(content.error());
  }
  return load_config_from_string(content.value(), path.string());
}

common::Result<ObservabilityConfig> load_observability_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<ObservabilityConfig>::failure(cfg_path_result.error());
  }

  Config config;
  const auto path = cfg_path_result.value();
  if (std::filesystem::exists(path)) {
    auto content = common::read_file(path);
    if (!content.ok()) {
      return common::Result<ObservabilityConfig>::failure(content.error());
    }
    const auto parsed = common::parse_toml(content.value());
    if (!parsed.ok()) {
      return common::Result<ObservabilityConfig>::failure(parsed.error());
    }
    config.observability.backend =
        parsed.value().get_string("observability.backend", config.observability.backend);
  }
  apply_env_overrides(config);
  return common::Result<ObservabilityConfig>::success(config.observability);
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!observability::is_known_backend(config.observability.backend)) {
    warnings.push_back("Unrecognized observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  for (const auto &definition : config.schedules) {
    const int code = definition.trigger.misfire_instruction;
    if (!schedule::misfire::is_documented(code)) {
      warnings.push_back("schedules." + definition.name + ": misfire instruction " +
                         std::to_string(code) +
                         " is not a documented calendar-interval instruction");
    }
  }

  observability::record_metric(
      observability::ConfigWarningsMetric{.count = static_cast<std::uint64_t>(warnings.size())});
  return warnings;
}

} // namespace calsched::config
