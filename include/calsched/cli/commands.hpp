#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace calsched::cli {

int run_cli(int argc, char **argv);

/// `args` excludes the program name.
int run_cli(std::vector<std::string> args, std::ostream &out, std::ostream &err);

} // namespace calsched::cli
