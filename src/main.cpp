#include "calsched/cli/commands.hpp"

int main(int argc, char **argv) { return calsched::cli::run_cli(argc, argv); }
