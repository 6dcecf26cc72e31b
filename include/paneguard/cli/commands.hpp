#pragma once

namespace paneguard::cli {

int run_cli(int argc, char **argv);

} // namespace paneguard::cli
