#pragma once

namespace hostgate::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace hostgate::cli
