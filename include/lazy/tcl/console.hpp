#pragma once
// Interactive Tcl shell over the elaboration core. Every console command is a
// top-level Tcl command, so scripts can loop, branch and `source` files.

#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <tcl.h>

#include "lazy/elab/context.hpp"
#include "lazy/elab/elaborate.hpp"

namespace lazy::tcl {

// One elaborated design: its context owns the whole tree and netlist.
struct Session {
    std::string mDesign;
    std::unique_ptr<elab::ElabContext> mCtx;
    elab::Container* mTop = nullptr;
    elab::ElabResult mResult;
};

class Console {
  public:
    using Args = std::vector<std::string>;

    // Plain function pointers; command state lives on the Console.
    using Handler = int (*)(Console&, Tcl_Interp*, const Args&);
    // Receives the whole tokenized line, command name first.
    using Completer = std::vector<std::string> (*)(Console&, const Args&);

    struct Command {
        std::string mHelp; // one line, usage included
        Handler mHandler = nullptr;
        Completer mCompleter = nullptr;
    };

    Console(const elab::DesignLib& lib, std::ostream& diag);
    ~Console();

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    // Creates the interpreter and registers the built-in commands.
    bool init();
    int repl();
    // Returns the Tcl completion code; the result is echoed to diag.
    int evalLine(const std::string& line);

    void registerCommand(const std::string& name, const std::string& help,
                         Handler handler, Completer completer = nullptr);
    bool hasCommand(const std::string& name) const {
        return mCommands.count(name) != 0;
    }
    // (name, help), sorted by name.
    std::vector<std::pair<std::string, std::string>> listCommands() const;
    bool getCommandHelp(const std::string& name, std::string& outHelp) const;

    std::vector<std::string> complete(const std::string& line);
    std::vector<std::string> completeDesigns(const std::string& prefix) const;
    std::vector<std::string> completePaths(const std::string& prefix) const;

    // Build `name` in a fresh context and elaborate it with the current
    // options. Replaces the previous session only on success.
    void elaborateDesign(const std::string& name);

    Tcl_Interp* interp() const { return mInterp; }
    const elab::DesignLib& designs() const { return mLib; }
    elab::ElabOptions& options() { return mOptions; }
    Session* session() { return mSession.get(); }
    std::ostream& diag() { return mDiag; }

  private:
    static int TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                      Tcl_Obj* const objv[]);
    int dispatchCommand(Tcl_Interp* interp, const std::string& cmdName,
                        const Args& args);
    bool readCommand(std::string& out);

    Tcl_Interp* mInterp = nullptr;
    std::map<std::string, Command> mCommands;

    const elab::DesignLib& mLib;
    elab::ElabOptions mOptions;
    std::unique_ptr<Session> mSession;
    std::ostream& mDiag;
};

// Set `msg` as the interpreter result.
void setResult(Tcl_Interp* ip, const std::string& msg);

} // namespace lazy::tcl
