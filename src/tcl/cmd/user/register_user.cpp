#include "register_user.hpp"

namespace lazy::tcl {

void register_user_commands(Console& /*c*/) {
    // Add calls to your own register_cmd_* functions here.
}

} // namespace lazy::tcl
