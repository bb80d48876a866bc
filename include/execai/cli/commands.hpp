#pragma once

namespace execai::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace execai::cli
