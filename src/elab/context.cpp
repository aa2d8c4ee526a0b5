#include "lazy/elab/context.hpp"

namespace lazy::elab {

ElabContext::ElabContext(std::ostream* diag)
    : mScope([this](ContainerId id) { return describe(id); })
    , mDiag(diag) {}

ElabContext::~ElabContext() {
    // Owned containers unregister themselves from the arena on destruction.
    mOwned.clear();
}

Container& ElabContext::container(ContainerId id) const {
    if (id >= mArena.size() || mArena[id] == nullptr) {
        throw ElabError("no container with id " + std::to_string(id));
    }
    return *mArena[id];
}

std::vector<ContainerId> ElabContext::roots() const {
    std::vector<ContainerId> out;
    for (ContainerId id = 0; id < mArena.size(); ++id) {
        if (mArena[id] && !mArena[id]->parent()) out.push_back(id);
    }
    return out;
}

Container& ElabContext::currentContainer() const {
    auto cur = mScope.current();
    if (!cur) throw ScopeViolation("no container scope is open");
    return container(*cur);
}

void ElabContext::finalize(Container& c, std::string_view valName,
                           SourceInfo info) {
    std::string where = info.known() ? " at " + info.toString() : "";
    if (c.mFinalized) {
        throw DoubleApplicationError("container " + c.name() +
                                     " finalized twice" + where);
    }
    auto cur = mScope.current();
    if (!cur) {
        throw ScopeViolation("container " + c.name() +
                             " finalized with no open scope" + where);
    }
    if (*cur != c.id()) {
        throw ScopeViolation("container " + c.name() +
                             " finalized before " + describe(*cur) +
                             " was closed" + where);
    }
    mScope.exit(c.id());
    c.mInfo = info;
    c.mFinalized = true;
    if (!c.hasSuggestedName() && !valName.empty()) c.suggestName(valName);
}

void ElabContext::adopt(std::unique_ptr<Container> c) {
    if (!c) return;
    if (&c->context() != this) {
        throw ElabError("container " + c->name() +
                        " belongs to a different context");
    }
    mOwned.push_back(std::move(c));
}

void ElabContext::defer(std::function<void()> action) {
    if (!mScope.current()) {
        throw ScopeViolation("deferred action registered outside a container");
    }
    currentContainer().defer(std::move(action));
}

ContainerId ElabContext::registerContainer(Container* c) {
    ContainerId id = static_cast<ContainerId>(mArena.size());
    mArena.push_back(c);
    return id;
}

void ElabContext::releaseContainer(ContainerId id) {
    if (id < mArena.size()) mArena[id] = nullptr;
}

std::string ElabContext::describe(ContainerId id) const {
    if (id >= mArena.size() || mArena[id] == nullptr) {
        return "#" + std::to_string(id);
    }
    return mArena[id]->name();
}

} // namespace lazy::elab
