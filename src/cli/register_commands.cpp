#include "cli/registry.hpp"

int cmd_cat_file(int argc, char **argv);
int cmd_show_index(int argc, char **argv);
int cmd_verify_pack(int argc, char **argv);
int cmd_dump(int argc, char **argv);

namespace gitpeek::cli {

void register_all_commands() {
  register_command("cat-file", {.fn = ::cmd_cat_file,
                                .synopsis = "(-t|-s|-p|-e) <object>",
                                .help = "Print the type, size or content of one object"});
  register_command("show-index", {.fn = ::cmd_show_index,
                                  .synopsis = "[--sha256] <file.idx>",
                                  .help = "List the entries of a pack index"});
  register_command("verify-pack", {.fn = ::cmd_verify_pack,
                                   .synopsis = "[-v] [--check] <file.pack>",
                                   .help = "Resolve every object of a pack"});
  register_command("dump", {.fn = ::cmd_dump,
                            .synopsis = "",
                            .help = "List every loose and packed object with type and size"});
}

} // namespace gitpeek::cli
