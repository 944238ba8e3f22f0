#include "calsched/schedule/schedule_codec.hpp"

#include "calsched/common/text.hpp"
#include "calsched/observability/global.hpp"

#include <sstream>
#include <stdexcept>

namespace calsched::schedule {

namespace {

constexpr const char *kComponent = "codec";

common::Result<CalendarIntervalScheduleBuilder> reject(const std::string &reason) {
  observability::record_schedule_rejected(kComponent, reason);
  return common::Result<CalendarIntervalScheduleBuilder>::failure(reason);
}

} // namespace

std::string ScheduleCodec::encode(const CalendarIntervalTrigger &trigger) {
  std::ostringstream out;
  out << "interval=" << trigger.repeat_interval << ";unit=" << to_string(trigger.repeat_interval_unit)
      << ";misfire=" << trigger.misfire_instruction;
  return out.str();
}

common::Result<CalendarIntervalScheduleBuilder> ScheduleCodec::decode(const std::string &text) {
  std::optional<std::string> interval;
  std::optional<std::string> unit;
  std::optional<std::string> misfire;

  for (const auto &pair : common::split_trimmed(text, ';')) {
    if (pair.empty()) {
      continue;
    }
    const auto equals = pair.find('=');
    if (equals == std::string::npos) {
      return reject("expected key=value, got '" + pair + "'");
    }
    const std::string key = common::to_lower(common::trim(pair.substr(0, equals)));
    const std::string value = common::trim(pair.substr(equals + 1));

    std::optional<std::string> *slot = nullptr;
    if (key == "interval") {
      slot = &interval;
    } else if (key == "unit") {
      slot = &unit;
    } else if (key == "misfire") {
      slot = &misfire;
    } else if (key.empty()) {
      return reject("missing key in '" + pair + "'");
    } else {
      return reject("unknown schedule key: " + key);
    }
    if (slot->has_value()) {
      return reject("duplicate schedule key: " + key);
    }
    *slot = value;
  }

  return from_fields(interval, unit, misfire);
}

common::Result<CalendarIntervalScheduleBuilder>
ScheduleCodec::from_fields(const std::optional<std::string> &interval_text,
                           const std::optional<std::string> &unit_text,
                           const std::optional<std::string> &misfire_text) {
  auto builder = CalendarIntervalScheduleBuilder::create();

  if (interval_text.has_value() || unit_text.has_value()) {
    int interval_value = 1;
    if (interval_text.has_value()) {
      auto parsed = common::parse_int(*interval_text);
      if (!parsed.ok()) {
        return reject("interval: " + parsed.error());
      }
      interval_value = parsed.value();
    }

    IntervalUnit unit_value = IntervalUnit::Day;
    if (unit_text.has_value()) {
      auto parsed = parse_interval_unit(*unit_text);
      if (!parsed.ok()) {
        return reject(parsed.error());
      }
      unit_value = parsed.value();
    }

    try {
      builder.with_interval(interval_value, unit_value);
    } catch (const std::invalid_argument &ex) {
      return reject(ex.what());
    }
  }

  if (misfire_text.has_value()) {
    auto code = misfire::parse_instruction(*misfire_text);
    if (!code.ok()) {
      return reject(code.error());
    }
    builder.with_misfire_handling_instruction(code.value());
  }

  return common::Result<CalendarIntervalScheduleBuilder>::success(builder);
}

} // namespace calsched::schedule
