#include "calsched/schedule/interval_unit.hpp"

#include "calsched/common/text.hpp"

namespace calsched::schedule {

std::string_view to_string(const IntervalUnit unit) {
  switch (unit) {
  case IntervalUnit::Second:
    return "second";
  case IntervalUnit::Minute:
    return "minute";
  case IntervalUnit::Hour:
    return "hour";
  case IntervalUnit::Day:
    return "day";
  case IntervalUnit::Week:
    return "week";
  case IntervalUnit::Month:
    return "month";
  case IntervalUnit::Year:
    return "year";
  }
  return "unknown";
}

common::Result<IntervalUnit> parse_interval_unit(const std::string &text) {
  std::string name = common::to_lower(common::trim(text));
  if (name.size() > 1 && name.back() == 's') {
    name.pop_back();
  }
  for (const auto unit : kAllIntervalUnits) {
    if (name == to_string(unit)) {
      return common::Result<IntervalUnit>::success(unit);
    }
  }
  return common::Result<IntervalUnit>::failure("unknown interval unit: " + text);
}

} // namespace calsched::schedule
