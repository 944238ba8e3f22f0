#pragma once

#include "calsched/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace calsched::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Lowercases and drops every character listed in `ignored`.
[[nodiscard]] std::string fold_identifier(const std::string &value,
                                          std::string_view ignored = "_- ");

/// Splits on `separator`, trimming each piece. Empty pieces are kept.
[[nodiscard]] std::vector<std::string> split_trimmed(const std::string &value, char separator);

/// Strict decimal integer: optional sign, digits only, no surrounding text.
[[nodiscard]] Result<int> parse_int(const std::string &value);

} // namespace calsched::common
