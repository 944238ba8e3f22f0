#include "test_framework.hpp"

#include "calsched/cli/commands.hpp"
#include "calsched/observability/global.hpp"
#include "helpers/test_helpers.hpp"

#include <sstream>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

CliRun run(std::vector<std::string> args) {
  std::ostringstream out;
  std::ostringstream err;
  CliRun result;
  result.code = calsched::cli::run_cli(std::move(args), out, err);
  result.out = out.str();
  result.err = err.str();
  return result;
}

} // namespace

void register_cli_tests(std::vector<calsched::tests::TestCase> &tests) {
  using calsched::tests::require;
  using calsched::testing::EnvGuard;

  tests.push_back({"cli_help_and_version", [] {
                     const auto help = run({"help"});
                     require(help.code == 0, "help should succeed");
                     require(help.out.find("Usage: calsched") != std::string::npos, "help text");
                     const auto version = run({"--version"});
                     require(version.code == 0 && version.out.rfind("calsched ", 0) == 0,
                             "version text");
                     const auto unknown = run({"frobnicate"});
                     require(unknown.code == 1, "unknown command should fail");
                     require(unknown.err.find("unknown command: frobnicate") != std::string::npos,
                             "unknown command message");
                   }});

  tests.push_back({"cli_encode_builds_through_public_setters", [] {
                     const auto encoded = run({"encode", "--interval", "3", "--unit", "months",
                                               "--misfire", "do_nothing"});
                     require(encoded.code == 0, encoded.err);
                     require(encoded.out == "interval=3;unit=month;misfire=2\n",
                             "unexpected output: " + encoded.out);

                     const auto defaults = run({"encode", "--interval=15", "--unit=minute"});
                     require(defaults.code == 0, defaults.err);
                     require(defaults.out == "interval=15;unit=minute;misfire=0\n",
                             "unexpected output: " + defaults.out);
                   }});

  tests.push_back({"cli_encode_rejects_bad_values", [] {
                     const auto zero = run({"encode", "--interval", "0", "--unit", "day"});
                     require(zero.code == 1, "zero interval should fail");
                     require(zero.err.find("Interval must be a positive value.") != std::string::npos,
                             "error should carry the builder message");
                     const auto raw = run({"encode", "--interval", "1", "--unit", "day",
                                           "--misfire", "7"});
                     require(raw.code == 1, "raw misfire codes are not accepted from the command line");
                     const auto missing = run({"encode", "--unit", "day"});
                     require(missing.code == 1, "missing interval should fail");
                   }});

  tests.push_back({"cli_decode", [] {
                     const auto decoded = run({"decode", "interval=2;unit=week;misfire=-1"});
                     require(decoded.code == 0, decoded.err);
                     require(decoded.out == "interval=2 unit=week misfire=IgnoreMisfirePolicy\n",
                             "unexpected output: " + decoded.out);
                     const auto bad = run({"decode", "interval=-2"});
                     require(bad.code == 1, "negative interval should fail");
                     require(run({"decode"}).code == 1, "missing argument should fail");
                   }});

  tests.push_back({"cli_check_lists_config_schedules", [] {
                     const EnvGuard backend_env("CALSCHED_OBSERVABILITY_BACKEND", "none");
                     calsched::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml", "[schedules.weekly]\ninterval = 1\nunit = \"week\"\n"
                                        "misfire = \"fire_once_now\"\n"
                                        "[schedules.odd]\nmisfire = 12\n");
                     const calsched::testing::ConfigOverrideGuard override_guard(std::nullopt);
                     const auto checked = run({"--config", path.string(), "check"});
                     calsched::observability::set_global_observer(nullptr);
                     require(checked.code == 0, checked.err);
                     require(checked.out.find("weekly: interval=1;unit=week;misfire=1 (FireOnceNow)") !=
                                 std::string::npos,
                             "missing weekly line: " + checked.out);
                     require(checked.out.find("odd: interval=1;unit=day;misfire=12 (unknown(12))") !=
                                 std::string::npos,
                             "missing odd line: " + checked.out);
                     require(checked.out.find("warning: schedules.odd") != std::string::npos,
                             "raw code should be flagged: " + checked.out);
                   }});

  tests.push_back({"cli_check_logs_load_events", [] {
                     const EnvGuard backend_env("CALSCHED_OBSERVABILITY_BACKEND", std::nullopt);
                     calsched::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml", "[observability]\nbackend = \"log\"\n"
                                        "[schedules.a]\ninterval = 2\n");
                     const calsched::testing::ConfigOverrideGuard override_guard(std::nullopt);
                     const auto checked = run({"--config", path.string(), "check"});
                     calsched::observability::set_global_observer(nullptr);
                     require(checked.code == 0, checked.err);
                     require(checked.err.find("[INFO] config.loaded path=") != std::string::npos &&
                                 checked.err.find(" schedules=1\n") != std::string::npos,
                             "config load should be logged: " + checked.err);
                     require(checked.err.find("[INFO] schedule.loaded name=a interval=2 unit=day "
                                              "misfire=SmartPolicy") != std::string::npos,
                             "schedule load should be logged: " + checked.err);
                     require(checked.err.find("[DEBUG] metric.schedules_loaded=1") !=
                                 std::string::npos,
                             "schedules metric should be logged: " + checked.err);
                     require(checked.err.find("[DEBUG] metric.config_warnings=0") !=
                                 std::string::npos,
                             "warnings metric should be logged: " + checked.err);
                   }});

  tests.push_back({"cli_check_logs_load_failures", [] {
                     const EnvGuard backend_env("CALSCHED_OBSERVABILITY_BACKEND", std::nullopt);
                     calsched::testing::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml", "[observability]\nbackend = \"log\"\n"
                                        "[schedules.bad]\ninterval = 0\n");
                     const calsched::testing::ConfigOverrideGuard override_guard(std::nullopt);
                     const auto checked = run({"--config", path.string(), "check"});
                     calsched::observability::set_global_observer(nullptr);
                     require(checked.code == 1, "invalid schedule should fail check");
                     require(checked.err.find("[WARN] schedule.rejected source=codec reason="
                                              "Interval must be a positive value.") !=
                                 std::string::npos,
                             "rejection should be logged: " + checked.err);
                     require(checked.err.find("[ERROR] config: ") != std::string::npos,
                             "load failure should be logged: " + checked.err);
                     require(checked.err.find("config error: schedules.bad: ") != std::string::npos,
                             "check should still print the error: " + checked.err);
                   }});

  tests.push_back({"cli_check_reports_config_errors", [] {
                     calsched::testing::TempWorkspace workspace;
                     const auto path =
                         workspace.create_file("config.toml", "[schedules.bad]\ninterval = -4\n");
                     const calsched::testing::ConfigOverrideGuard override_guard(std::nullopt);
                     const auto checked = run({"--config=" + path.string(), "check"});
                     calsched::observability::set_global_observer(nullptr);
                     require(checked.code == 1, "invalid schedule should fail check");
                     require(checked.err.find("schedules.bad: Interval must be a positive value.") !=
                                 std::string::npos,
                             "unexpected error: " + checked.err);
                   }});

  tests.push_back({"cli_config_path_option", [] {
                     const calsched::testing::ConfigOverrideGuard override_guard(std::nullopt);
                     const auto missing = run({"--config"});
                     require(missing.code == 1, "--config without value should fail");
                     const auto shown = run({"--config", "/tmp/calsched-cli.toml", "config-path"});
                     require(shown.code == 0 && shown.out == "/tmp/calsched-cli.toml\n",
                             "unexpected path: " + shown.out);
                   }});
}
