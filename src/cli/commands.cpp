#include "calsched/cli/commands.hpp"

#include "calsched/common/text.hpp"
#include "calsched/config/config.hpp"
#include "calsched/observability/factory.hpp"
#include "calsched/observability/global.hpp"
#include "calsched/schedule/calendar_interval_schedule_builder.hpp"
#include "calsched/schedule/schedule_codec.hpp"

#include <iostream>
#include <stdexcept>

namespace calsched::cli {

namespace {

std::string version_string() {
#ifdef CALSCHED_VERSION
  return std::string("calsched ") + CALSCHED_VERSION;
#else
  return "calsched 0.1.0";
#endif
}

void print_help(std::ostream &out) {
  out << "Usage: calsched [--config <path>] <command>\n\n"
      << "Commands:\n"
      << "  check                      Load the config and list its schedules\n"
      << "  encode --interval <n> --unit <unit> [--misfire <policy>]\n"
      << "                             Build a schedule and print its text form\n"
      << "  decode <text>              Parse a schedule text form\n"
      << "  config-path                Print the resolved config file path\n"
      << "  version                    Print the version\n"
      << "  help                       Show this message\n";
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string describe(const schedule::CalendarIntervalTrigger &trigger) {
  return schedule::ScheduleCodec::encode(trigger) + " (" +
         schedule::misfire::instruction_name(trigger.misfire_instruction) + ")";
}

void flush_global_observer() {
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
}

int run_check(std::ostream &out, std::ostream &err) {
  // The observer goes in before the full load so its events are logged.
  config::Config bootstrap;
  if (auto settings = config::load_observability_config(); settings.ok()) {
    bootstrap.observability = settings.value();
  } else {
    // load_config() below fails the same way and reports it.
    config::apply_env_overrides(bootstrap);
  }
  observability::set_global_observer(observability::create_observer(bootstrap, err));

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    err << "config error: " << cfg.error() << "\n";
    flush_global_observer();
    return 1;
  }

  for (const auto &definition : cfg.value().schedules) {
    out << definition.name << ": " << describe(definition.trigger) << "\n";
  }
  if (cfg.value().schedules.empty()) {
    out << "no schedules configured\n";
  }
  for (const auto &warning : config::validate_config(cfg.value())) {
    out << "warning: " << warning << "\n";
  }

  flush_global_observer();
  return 0;
}

common::Status apply_misfire_policy(schedule::CalendarIntervalScheduleBuilder &builder,
                                    const std::string &policy) {
  auto code = schedule::misfire::parse_instruction(policy);
  if (!code.ok()) {
    return common::Status::error(code.error());
  }
  switch (code.value()) {
  case schedule::misfire::kSmartPolicy:
    break;
  case schedule::misfire::kIgnoreMisfirePolicy:
    builder.with_misfire_handling_instruction_ignore_misfires();
    break;
  case schedule::misfire::kDoNothing:
    builder.with_misfire_handling_instruction_do_nothing();
    break;
  case schedule::misfire::kFireOnceNow:
    builder.with_misfire_handling_instruction_fire_and_proceed();
    break;
  default:
    return common::Status::error("misfire policy must be one of: smart, ignore_misfires, "
                                 "do_nothing, fire_and_proceed");
  }
  return common::Status::success();
}

int run_encode(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string interval_text;
  std::string unit_text;
  std::string misfire_text;
  if (!take_option(args, "--interval", interval_text) || !take_option(args, "--unit", unit_text)) {
    err << "usage: calsched encode --interval <n> --unit <unit> [--misfire <policy>]\n";
    return 1;
  }
  const bool has_misfire = take_option(args, "--misfire", misfire_text);
  if (!args.empty()) {
    err << "unexpected argument: " << args.front() << "\n";
    return 1;
  }

  auto interval = common::parse_int(interval_text);
  if (!interval.ok()) {
    err << interval.error() << "\n";
    return 1;
  }
  auto unit = schedule::parse_interval_unit(unit_text);
  if (!unit.ok()) {
    err << unit.error() << "\n";
    return 1;
  }

  auto builder = schedule::CalendarIntervalScheduleBuilder::create();
  try {
    builder.with_interval(interval.value(), unit.value());
  } catch (const std::invalid_argument &ex) {
    err << ex.what() << "\n";
    return 1;
  }
  if (has_misfire) {
    if (auto status = apply_misfire_policy(builder, misfire_text); !status.ok()) {
      err << status.error() << "\n";
      return 1;
    }
  }

  out << schedule::ScheduleCodec::encode(builder.build()) << "\n";
  return 0;
}

int run_decode(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
  if (args.size() != 1) {
    err << "usage: calsched decode <text>\n";
    return 1;
  }
  auto builder = schedule::ScheduleCodec::decode(args[0]);
  if (!builder.ok()) {
    err << builder.error() << "\n";
    return 1;
  }
  const auto trigger = builder.value().build();
  out << "interval=" << trigger.repeat_interval
      << " unit=" << schedule::to_string(trigger.repeat_interval_unit)
      << " misfire=" << schedule::misfire::instruction_name(trigger.misfire_instruction) << "\n";
  return 0;
}

} // namespace

int run_cli(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    err << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help(out);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      err << path_result.error() << "\n";
      return 1;
    }
    out << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "check") {
    return run_check(out, err);
  }
  if (subcommand == "encode") {
    return run_encode(std::move(args), out, err);
  }
  if (subcommand == "decode") {
    return run_decode(args, out, err);
  }

  err << "unknown command: " << subcommand << "\n";
  print_help(err);
  return 1;
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help(std::cout);
    return 0;
  }
  return run_cli(collect_args(argc - 1, argv + 1), std::cout, std::cerr);
}

} // namespace calsched::cli
