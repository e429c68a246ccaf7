#include "ollacode/cli/commands.hpp"

int main(int argc, char **argv) { return ollacode::cli::run_cli(argc, argv); }
