#include "lazy/tcl/console.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#ifdef LAZY_HAVE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

#include "lazy/errors.hpp"

#include "cmd/register_all.hpp"

namespace lazy::tcl {

namespace {

bool hasPrefix(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string trimLeft(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
        ++i;
    return s.substr(i);
}

// Whitespace tokens; a trailing blank adds an empty token so the
// completer knows a new word is starting.
Console::Args tokenize(const std::string& line) {
    Console::Args toks;
    std::istringstream iss(line);
    for (std::string t; iss >> t;)
        toks.push_back(t);
    if (!line.empty() &&
        std::isspace(static_cast<unsigned char>(line.back())))
        toks.emplace_back();
    return toks;
}

std::string objString(Tcl_Obj* obj) {
    int len = 0;
    const char* s = Tcl_GetStringFromObj(obj, &len);
    return std::string(s, static_cast<size_t>(len));
}

#ifdef LAZY_HAVE_READLINE
// readline callbacks carry no user pointer.
Console* gActive = nullptr;
std::vector<std::string> gMatches;
size_t gNextMatch = 0;

char* matchGenerator(const char* text, int state) {
    if (state == 0) {
        gNextMatch = 0;
        gMatches.clear();
        if (gActive) {
            std::string word(text ? text : "");
            for (auto& m : gActive->complete(rl_line_buffer ? rl_line_buffer
                                                            : ""))
                if (hasPrefix(m, word)) gMatches.push_back(m);
        }
    }
    if (gNextMatch >= gMatches.size()) return nullptr;
    return ::strdup(gMatches[gNextMatch++].c_str());
}

char** completeHook(const char* text, int, int) {
    rl_attempted_completion_over = 1; // no filename fallback
    return rl_completion_matches(text, &matchGenerator);
}
#endif

} // namespace

void setResult(Tcl_Interp* ip, const std::string& msg) {
    Tcl_SetObjResult(
      ip, Tcl_NewStringObj(msg.c_str(), static_cast<int>(msg.size())));
}

Console::Console(const elab::DesignLib& lib, std::ostream& diag)
    : mLib(lib)
    , mDiag(diag) {}

Console::~Console() {
    if (mInterp) Tcl_DeleteInterp(mInterp);
}

bool Console::init() {
    if (mInterp) return true;
    mInterp = Tcl_CreateInterp();
    if (!mInterp) {
        error(&mDiag, "Tcl_CreateInterp failed");
        return false;
    }
    if (Tcl_Init(mInterp) != TCL_OK) {
        // The core language still works without init.tcl.
        warn(&mDiag, std::string("Tcl_Init: ") + Tcl_GetStringResult(mInterp));
    }
    register_all_commands(*this);
    return true;
}

void Console::registerCommand(const std::string& name, const std::string& help,
                              Handler handler, Completer completer) {
    mCommands[name] = Command{help, handler, completer};
    if (mInterp)
        Tcl_CreateObjCommand(
          mInterp, name.c_str(), &Console::TclCmd, this, nullptr);
}

std::vector<std::pair<std::string, std::string>>
Console::listCommands() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [name, cmd] : mCommands)
        out.emplace_back(name, cmd.mHelp);
    return out;
}

bool Console::getCommandHelp(const std::string& name,
                             std::string& outHelp) const {
    auto it = mCommands.find(name);
    if (it == mCommands.end()) return false;
    outHelp = it->second.mHelp;
    return true;
}

int Console::evalLine(const std::string& line) {
    const std::string cmd = trimLeft(line);
    if (cmd.empty()) return TCL_OK;
    if (!mInterp) {
        error(&mDiag, "console not initialised");
        return TCL_ERROR;
    }
    const int code = Tcl_EvalEx(
      mInterp, cmd.c_str(), static_cast<int>(cmd.size()), TCL_EVAL_GLOBAL);
    const std::string result = objString(Tcl_GetObjResult(mInterp));
    if (code == TCL_OK) {
        if (!result.empty()) mDiag << result << "\n";
    } else {
        mDiag << "Tcl error: " << result << "\n";
    }
    return code;
}

bool Console::readCommand(std::string& out) {
#ifdef LAZY_HAVE_READLINE
    char* raw = readline("lazyelab> ");
    if (!raw) return false;
    out = raw;
    std::free(raw);
    if (!trimLeft(out).empty()) add_history(out.c_str());
    return true;
#else
    mDiag << "lazyelab> " << std::flush;
    return static_cast<bool>(std::getline(std::cin, out));
#endif
}

int Console::repl() {
#ifdef LAZY_HAVE_READLINE
    gActive = this;
    rl_attempted_completion_function = &completeHook;
#endif
    mDiag << "lazyelab Tcl console. Type: help (Ctrl+D to exit)\n";
    for (std::string line; readCommand(line);) {
        // Errors are already reported; keep reading.
        (void)evalLine(line);
    }
    mDiag << "Bye.\n";
#ifdef LAZY_HAVE_READLINE
    gActive = nullptr;
#endif
    return 0;
}

int Console::TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                    Tcl_Obj* const objv[]) {
    auto* self = static_cast<Console*>(cd);
    if (!self || objc < 1) return TCL_ERROR;
    Args args;
    for (int i = 1; i < objc; ++i)
        args.push_back(objString(objv[i]));
    return self->dispatchCommand(interp, objString(objv[0]), args);
}

int Console::dispatchCommand(Tcl_Interp* interp, const std::string& cmdName,
                             const Args& args) {
    auto it = mCommands.find(cmdName);
    if (it == mCommands.end() || !it->second.mHandler) {
        setResult(interp, "unknown command: " + cmdName);
        return TCL_ERROR;
    }
    // Elaboration errors are fatal for the run, not for the shell.
    try {
        return it->second.mHandler(*this, interp, args);
    } catch (const ElabError& e) {
        setResult(interp, cmdName + ": elaboration failed: " + e.what());
    } catch (const std::exception& e) {
        setResult(interp, cmdName + ": " + e.what());
    }
    return TCL_ERROR;
}

std::vector<std::string> Console::complete(const std::string& line) {
    const Args toks = tokenize(line);
    if (toks.size() <= 1) {
        const std::string prefix = toks.empty() ? "" : toks[0];
        std::vector<std::string> names;
        for (const auto& [name, cmd] : mCommands)
            if (hasPrefix(name, prefix)) names.push_back(name);
        return names;
    }
    auto it = mCommands.find(toks[0]);
    if (it == mCommands.end() || !it->second.mCompleter) return {};
    return it->second.mCompleter(*this, toks);
}

std::vector<std::string>
Console::completeDesigns(const std::string& prefix) const {
    std::vector<std::string> out;
    for (const auto& [name, factory] : mLib)
        if (hasPrefix(name, prefix)) out.push_back(name);
    return out;
}

std::vector<std::string>
Console::completePaths(const std::string& prefix) const {
    std::vector<std::string> out;
    if (!mSession) return out;
    mSession->mTop->forEach([&](const elab::Container& c) {
        std::string p = c.pathName();
        if (hasPrefix(p, prefix)) out.push_back(std::move(p));
    });
    return out;
}

void Console::elaborateDesign(const std::string& name) {
    auto it = mLib.find(name);
    if (it == mLib.end()) throw ElabError("unknown design '" + name + "'");

    auto s = std::make_unique<Session>();
    s->mDesign = name;
    s->mCtx = std::make_unique<elab::ElabContext>(&mDiag);
    s->mTop = &it->second(*s->mCtx);
    s->mResult = elab::elaborate(*s->mCtx, *s->mTop, mOptions);
    info(&mDiag, "current design: " + name);
    mSession = std::move(s);
}

} // namespace lazy::tcl
