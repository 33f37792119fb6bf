#pragma once

namespace gitpeek::cli {

// A subcommand receives argv starting at its own name (argv[0] == "cat-file").
using command_fn = int (*)(int argc, char **argv);

} // namespace gitpeek::cli
