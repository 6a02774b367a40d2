#include "cli/dispatch.hpp"

int main(int argc, char **argv) { return gitusr::cli::run(argc, argv); }
