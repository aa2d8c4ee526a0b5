#include "lazy/elab/scope.hpp"

#include "lazy/errors.hpp"

namespace lazy::elab {

void ScopeStack::enter(ContainerId c) { mStack.push_back(c); }

void ScopeStack::exit(ContainerId c) {
    if (mStack.empty()) {
        throw ScopeViolation("scope " + nameOf(c) +
                             " tried to exit, but scope was empty");
    }
    if (mStack.back() != c) {
        throw ScopeViolation("scope " + nameOf(c) + " exited before " +
                             nameOf(mStack.back()) + " was closed");
    }
    mStack.pop_back();
}

std::optional<ContainerId> ScopeStack::current() const {
    if (mStack.empty()) return std::nullopt;
    return mStack.back();
}

void ScopeStack::truncate(size_t depth) {
    if (depth < mStack.size()) mStack.resize(depth);
}

std::string ScopeStack::nameOf(ContainerId c) const {
    if (mNamer) return mNamer(c);
    return "#" + std::to_string(c);
}

ScopeStack::Guard::Guard(ScopeStack& stack, ContainerId c)
    : mStack(stack)
    , mScope(c)
    , mSavedDepth(stack.depth()) {
    mStack.enter(c);
}

ScopeStack::Guard::~Guard() {
    if (!mClosed) mStack.truncate(mSavedDepth);
}

void ScopeStack::Guard::close() {
    mStack.exit(mScope);
    mClosed = true;
}

} // namespace lazy::elab
