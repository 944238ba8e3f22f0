#pragma once

#include "calsched/common/result.hpp"

#include <map>
#include <string>
#include <vector>

namespace calsched::common {

/// Flat view of a TOML document. Keys under a `[section]` header are stored
/// as `section.key`; values keep their raw text (quotes included).
struct TomlDocument {
  std::map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;

  /// Names directly below `prefix`, e.g. "schedules" yields "nightly" for
  /// the key "schedules.nightly.interval". Sorted, without duplicates.
  [[nodiscard]] std::vector<std::string> child_names(const std::string &prefix) const;

  /// Every key below `section`, relative to it. Keys of nested tables keep
  /// their dots, so `[a.b]` with `x = 1` lists "b.x" for keys_in("a").
  [[nodiscard]] std::vector<std::string> keys_in(const std::string &section) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string unquote_toml_string(const std::string &raw);

} // namespace calsched::common
