#pragma once
// Stack of open declaration scopes. Every enter must be matched by an exit
// of the same container; mismatches throw ScopeViolation.

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "lazy/common.hpp"

namespace lazy::elab {

class ScopeStack {
  public:
    // Renders a container id for error messages.
    using Namer = std::function<std::string(ContainerId)>;

    ScopeStack() = default;
    explicit ScopeStack(Namer namer)
        : mNamer(std::move(namer)) {}

    void enter(ContainerId c);
    // Pops iff `c` is on top. The stack is untouched on failure.
    void exit(ContainerId c);

    std::optional<ContainerId> current() const;
    bool empty() const { return mStack.empty(); }
    size_t depth() const { return mStack.size(); }
    const std::vector<ContainerId>& frames() const { return mStack; }

    // Drop frames above `depth`. Used by Guard on unwinding.
    void truncate(size_t depth);

    // Enters on construction; close() exits with the identity check.
    // Whatever happens, the destructor puts the stack back to the depth it
    // had before the enter.
    class Guard {
      public:
        Guard(ScopeStack& stack, ContainerId c);
        ~Guard();
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        void close();

      private:
        ScopeStack& mStack;
        ContainerId mScope;
        size_t mSavedDepth;
        bool mClosed = false;
    };

  private:
    std::string nameOf(ContainerId c) const;

    std::vector<ContainerId> mStack;
    Namer mNamer;
};

} // namespace lazy::elab
