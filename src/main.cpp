#include "conductor/cli/commands.hpp"

int main(int argc, char **argv) { return conductor::cli::run_cli(argc, argv); }
