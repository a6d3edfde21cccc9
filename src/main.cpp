#include "hostgate/cli/commands.hpp"

int main(int argc, char **argv) { return hostgate::cli::run_cli(argc, argv); }
