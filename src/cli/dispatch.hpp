#pragma once

namespace gitusr::cli {

// Full command-line entry point: registers the commands, picks the command
// word (the first argument other than --global) and runs its handler. Words
// that are not commands name a profile to switch to. Returns the exit code.
int run(int argc, char **argv);

} // namespace gitusr::cli
