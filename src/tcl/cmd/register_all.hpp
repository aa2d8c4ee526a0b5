#pragma once
#include "lazy/tcl/console.hpp"
#include "user/register_user.hpp"

// Declarations of per-file registration
namespace lazy::tcl {
void register_cmd_help(Console& c);    // help/commands
void register_cmd_designs(Console& c); // designs
void register_cmd_elab(Console& c);    // elab/policy
void register_cmd_dump(Console& c);    // hierarchy/boundary/netlist
void register_cmd_export(Console& c);  // export-json/export-graphml

void register_all_commands(Console& c);
// external user commands (empty by default; see src/tcl/cmd/user/)
void register_user_commands(Console& c);
} // namespace lazy::tcl
