#include "lazy/elab/elaborate.hpp"

#include "lazy/errors.hpp"

namespace lazy::elab {

const char* to_string(UnresolvedPolicy p) {
    switch (p) {
    case UnresolvedPolicy::Keep: return "keep";
    case UnresolvedPolicy::Warn: return "warn";
    case UnresolvedPolicy::Error: return "error";
    }
    return "?";
}

bool parsePolicy(std::string_view text, UnresolvedPolicy& out) {
    if (text == "keep") {
        out = UnresolvedPolicy::Keep;
    } else if (text == "warn") {
        out = UnresolvedPolicy::Warn;
    } else if (text == "error") {
        out = UnresolvedPolicy::Error;
    } else {
        return false;
    }
    return true;
}

ElabResult elaborate(ElabContext& ctx, Container& top,
                     const ElabOptions& opts) {
    std::ostream* diag = ctx.diag();
    if (auto cur = ctx.scope().current()) {
        throw ScopeViolation("elaborate(" + top.name() + ") while " +
                             ctx.container(*cur).name() +
                             " is still being declared");
    }
    if (top.parent()) {
        warn(diag, "elaborating " + top.name() + " which is not a root");
    }
    info(diag, "elaborating " + top.name());

    ModuleImp& imp = top.instantiate();
    top.finishInstantiate();
    top.forEach([](const Container& c) { c.validate(); });

    ElabResult res;
    res.mTop = &top;
    res.mImp = &imp;
    res.mUnresolved = imp.mDangles;
    top.forEach([&](const Container& c) {
        ++res.mContainers;
        res.mLinks += c.module().mLinks.size();
        if (opts.mVerbose) {
            info(diag,
                 c.name() + ": " + std::to_string(c.boundary().size()) +
                   " boundary ports, " +
                   std::to_string(c.module().mLinks.size()) +
                   " internal links",
                 2);
        }
    });

    if (!res.mUnresolved.empty()) {
        switch (opts.mUnresolvedRoot) {
        case UnresolvedPolicy::Keep: break;
        case UnresolvedPolicy::Warn:
            for (const auto& d : res.mUnresolved) {
                warn(diag, "unresolved root dangle " + d.mName + " source=" +
                             d.mSource.toString());
            }
            break;
        case UnresolvedPolicy::Error: {
            std::string msg = top.name() + " has " +
                              std::to_string(res.mUnresolved.size()) +
                              " unresolved dangles:";
            for (const auto& d : res.mUnresolved)
                msg += " " + d.mName;
            error(diag, msg);
            throw UnresolvedBoundaryError(msg);
        }
        }
    }

    info(diag, "elaborated " + top.name() + ": " +
                 std::to_string(res.mContainers) + " containers, " +
                 std::to_string(res.mLinks) + " internal links, " +
                 std::to_string(imp.mAuto.size()) + " top ports");
    return res;
}

Container* findByPath(const ElabContext& ctx, Container& top,
                      std::string_view path) {
    if (path.empty()) return &top;
    Container* cur = &top;
    size_t pos = 0;
    // Leading component may name the top itself.
    size_t dot = path.find('.');
    if (path.substr(0, dot) == top.name()) {
        if (dot == std::string_view::npos) return &top;
        pos = dot + 1;
    }
    while (pos <= path.size()) {
        size_t next = path.find('.', pos);
        std::string_view part = path.substr(pos, next - pos);
        Container* found = nullptr;
        for (ContainerId cid : cur->children()) {
            Container& child = ctx.container(cid);
            if (child.name() == part) {
                found = &child;
                break;
            }
        }
        if (!found) return nullptr;
        cur = found;
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return cur;
}

void dumpBoundary(const Container& c, std::ostream& os, int indent) {
    const auto& b = c.boundary();
    os << Indent(indent) << "Boundary of '" << c.name() << "' (" << b.size()
       << "):\n";
    for (size_t i = 0; i < b.size(); ++i) {
        const auto& p = b[i];
        os << Indent(indent + 2) << "[" << i << "] " << p.mName.str()
           << " dir=" << to_string(p.direction())
           << " width=" << p.mSignal.width() << "\n";
    }
}

static void dumpRecur(const ElabContext& ctx, const Container& c,
                      std::ostream& os, int indent) {
    os << Indent(indent) << "Container '" << c.name() << "' id=" << c.id()
       << " class=" << c.className() << " state=" << to_string(c.state());
    if (c.info().known()) os << " at " << c.line();
    os << "\n";

    if (!c.nodes().empty()) {
        os << Indent(indent + 2) << "Nodes (" << c.nodes().size() << "):\n";
        for (const auto& n : c.nodes()) {
            os << Indent(indent + 4) << "[" << n->index() << "] "
               << n->describe() << "\n";
        }
    }
    if (c.state() == ElabState::Done) {
        dumpBoundary(c, os, indent + 2);
        const auto& links = c.module().mLinks;
        if (!links.empty()) {
            os << Indent(indent + 2) << "Links (" << links.size() << "):\n";
            for (const auto& l : links) {
                os << Indent(indent + 4) << l.mSink.mName << " <= "
                   << l.mSource.mName << " key=" << l.mKey.toString()
                   << "\n";
            }
        }
    }
    if (!c.children().empty()) {
        os << Indent(indent + 2) << "Children (" << c.children().size()
           << "):\n";
        for (ContainerId cid : c.children())
            dumpRecur(ctx, ctx.container(cid), os, indent + 4);
    }
}

void dumpHierarchy(const ElabContext& ctx, const Container& top,
                   std::ostream& os) {
    dumpRecur(ctx, top, os, 0);
}

} // namespace lazy::elab
