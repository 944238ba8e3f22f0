#pragma once

#include "calsched/common/result.hpp"

#include <filesystem>
#include <string>

namespace calsched::common {

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace calsched::common
