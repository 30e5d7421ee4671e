#include "shellwarden/cli/commands.hpp"

int main(int argc, char **argv) { return shellwarden::cli::run_cli(argc, argv); }
