#pragma once

#include "calsched/common/result.hpp"

#include <string>

namespace calsched::schedule::misfire {

// Shared by every trigger kind.
inline constexpr int kIgnoreMisfirePolicy = -1;
inline constexpr int kSmartPolicy = 0;

// Calendar-interval triggers only.
inline constexpr int kFireOnceNow = 1;
inline constexpr int kDoNothing = 2;

/// Canonical name of a documented code, "unknown(<code>)" for anything else.
[[nodiscard]] std::string instruction_name(int code);

[[nodiscard]] bool is_documented(int code);

/// Accepts canonical names and aliases (case, '_' and '-' ignored) or a raw
/// integer literal. Raw integers are returned as-is, without checking them
/// against the documented codes.
[[nodiscard]] common::Result<int> parse_instruction(const std::string &text);

} // namespace calsched::schedule::misfire
