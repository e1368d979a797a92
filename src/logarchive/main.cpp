#include "logarchive/cli/router.hpp"

int main(int argc, char** argv) {
  // Argument parsing and the exit-code contract live in the CLI router.
  return logarchive::cli::Dispatch(argc, argv);
}
