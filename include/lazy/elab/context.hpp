#pragma once
// ElabContext: owns the container arena, the declaration scope stack, the
// netlist and the connection-point serial counter. One context per
// elaboration run; nothing here is process-global.

#include <functional>
#include <memory>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "lazy/common.hpp"
#include "lazy/elab/container.hpp"
#include "lazy/elab/module_value.hpp"
#include "lazy/elab/node.hpp"
#include "lazy/elab/scope.hpp"
#include "lazy/errors.hpp"
#include "lazy/net/netlist.hpp"

namespace lazy::elab {

class ElabContext {
  public:
    explicit ElabContext(std::ostream* diag = nullptr);
    ~ElabContext();

    ElabContext(const ElabContext&) = delete;
    ElabContext& operator=(const ElabContext&) = delete;

    ScopeStack& scope() { return mScope; }
    const ScopeStack& scope() const { return mScope; }
    net::Netlist& netlist() { return mNetlist; }
    const net::Netlist& netlist() const { return mNetlist; }
    std::ostream* diag() const { return mDiag; }
    void setDiag(std::ostream* diag) { mDiag = diag; }

    Container& container(ContainerId id) const;
    size_t size() const { return mArena.size(); }
    std::vector<ContainerId> roots() const;
    Container& currentContainer() const;

    // Construct T(*this, args...), take ownership and finalize it.
    template <typename T, typename... Args>
    T& make(std::string_view valName, Args&&... args) {
        return makeAt<T>(SourceInfo{}, valName, std::forward<Args>(args)...);
    }

    template <typename T, typename... Args>
    T& makeAt(SourceInfo info, std::string_view valName, Args&&... args) {
        static_assert(std::is_base_of_v<Container, T>,
                      "make<T>: T must derive from Container");
        auto owned = std::make_unique<T>(*this, std::forward<Args>(args)...);
        T& ref = *owned;
        adopt(std::move(owned));
        finalize(ref, valName, info);
        return ref;
    }

    // Closes the declaration of `c`: `c` must be the open scope and not yet
    // finalized. `valName` becomes the suggested name unless one is set.
    void finalize(Container& c, std::string_view valName,
                  SourceInfo info = SourceInfo{});

    // Take ownership of a container built outside make().
    void adopt(std::unique_ptr<Container> c);

    // Construct a connection point and register it with the open scope.
    template <typename T, typename... Args>
    T& makeNode(Args&&... args) {
        static_assert(std::is_base_of_v<ConnectionPoint, T>,
                      "makeNode<T>: T must derive from ConnectionPoint");
        Container& owner = currentContainer();
        auto node = std::make_unique<T>(*this, std::forward<Args>(args)...);
        return static_cast<T&>(owner.registerNode(std::move(node)));
    }

    // Run `body` with `c` as the open scope. The body must close every scope
    // it opens; the previous stack depth is restored on every exit path.
    template <typename F>
    decltype(auto) withScope(Container& c, F&& body) {
        ScopeStack::Guard guard(mScope, c.id());
        if constexpr (std::is_void_v<std::invoke_result_t<F&>>) {
            body();
            guard.close();
        } else {
            auto out = body();
            guard.close();
            return out;
        }
    }

    // Declare a fresh grouping container named `name` and run `body` in it.
    template <typename F>
    decltype(auto) lazyScope(std::string_view name, F&& body) {
        auto& scope = make<SimpleContainer>(name);
        return withScope(scope, std::forward<F>(body));
    }

    // Queue `action` on the open scope's container.
    void defer(std::function<void()> action);

    // Like defer, but keeps the body's result for later reads.
    template <typename F>
    auto inModuleBody(F&& body) {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        if (!mScope.current()) {
            throw ScopeViolation("inModuleBody invoked outside a container");
        }
        ModuleValue<R> out;
        if constexpr (std::is_void_v<R>) {
            defer([out, fn = std::forward<F>(body)]() mutable {
                fn();
                out.set();
            });
        } else {
            defer([out, fn = std::forward<F>(body)]() mutable {
                out.set(fn());
            });
        }
        return out;
    }

  private:
    friend class Container;
    friend class ConnectionPoint;

    ContainerId registerContainer(Container* c);
    void releaseContainer(ContainerId id);
    uint32_t nextSerial() { return mNextSerial++; }
    std::string describe(ContainerId id) const;

    std::vector<Container*> mArena;
    std::vector<std::unique_ptr<Container>> mOwned;
    ScopeStack mScope;
    net::Netlist mNetlist;
    uint32_t mNextSerial = 0;
    std::ostream* mDiag = nullptr;
};

} // namespace lazy::elab
