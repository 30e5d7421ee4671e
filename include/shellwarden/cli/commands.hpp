#pragma once

namespace shellwarden::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace shellwarden::cli
