#include "calx/cli/commands.hpp"

int main(int argc, char **argv) { return calx::cli::run_cli(argc, argv); }
