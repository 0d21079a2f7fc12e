#include "cli/registry.hpp"

int main(int argc, char **argv) {
  lfly::cli::register_all_commands();
  return lfly::cli::dispatch(argc, argv);
}
