#include "execai/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // Closed output pipes surface as write errors rather than killing the process.
  std::signal(SIGPIPE, SIG_IGN);
  return execai::cli::run_cli(argc, argv);
}
