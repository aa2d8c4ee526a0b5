#include "register_all.hpp"

namespace lazy::tcl {
void register_all_commands(Console& c) {
    register_cmd_help(c);
    register_cmd_designs(c);
    register_cmd_elab(c);
    register_cmd_dump(c);
    register_cmd_export(c);
    // Hook for user-provided commands (see src/tcl/cmd/user/)
    register_user_commands(c);
}
} // namespace lazy::tcl
