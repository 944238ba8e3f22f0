#pragma once

#include "calsched/common/result.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace calsched::schedule {

/// Calendar granularity of a repeat interval. How many seconds "one month"
/// spans is decided by the firing engine, not here.
enum class IntervalUnit : std::uint8_t { Second, Minute, Hour, Day, Week, Month, Year };

inline constexpr std::array<IntervalUnit, 7> kAllIntervalUnits = {
    IntervalUnit::Second, IntervalUnit::Minute, IntervalUnit::Hour, IntervalUnit::Day,
    IntervalUnit::Week,   IntervalUnit::Month,  IntervalUnit::Year};

[[nodiscard]] std::string_view to_string(IntervalUnit unit);

/// Singular or plural unit name, case-insensitive.
[[nodiscard]] common::Result<IntervalUnit> parse_interval_unit(const std::string &text);

} // namespace calsched::schedule
