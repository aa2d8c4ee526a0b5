#pragma once
#include "lazy/tcl/console.hpp"

// User command registration hook.
//
// Put extra commands under src/tcl/cmd/user/, e.g. cmd_stats.cpp, each with a
// registration function:
//     void register_cmd_stats(lazy::tcl::Console& c) {
//         c.registerCommand("stats", "Print net statistics: stats", &cmd_stats);
//     }
// and call it from register_user_commands. CMakeLists.txt globs every *.cpp
// in this directory into lazyelab_tcl.
//
// Handlers have the signature
//     int (Console&, Tcl_Interp*, const Console::Args&)
// and may throw; Console turns exceptions into TCL_ERROR results.

namespace lazy::tcl {
void register_user_commands(Console& c);
}
