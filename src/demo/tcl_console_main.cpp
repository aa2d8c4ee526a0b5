#include <iostream>

#include "designs.hpp"
#include "lazy/tcl/console.hpp"

int main(int argc, char** argv) {
    Tcl_FindExecutable(argv[0]);
    const lazy::elab::DesignLib lib = lazy::demo::builtinDesigns();

    lazy::tcl::Console console(lib, std::cerr);
    if (!console.init()) {
        std::cerr << "Failed to init Tcl console\n";
        return 1;
    }

    // Optional first argument: design to elaborate before the prompt.
    if (argc > 1) {
        if (console.evalLine(std::string("elab ") + argv[1]) != 0) return 1;
    }
    return console.repl();
}
