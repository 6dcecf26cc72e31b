#include "paneguard/cli/commands.hpp"

int main(int argc, char **argv) { return paneguard::cli::run_cli(argc, argv); }
