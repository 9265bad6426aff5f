#pragma once

namespace calx::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace calx::cli
