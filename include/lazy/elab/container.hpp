#pragma once
// Container: a node of the declaration tree. Owns its connection points and
// deferred actions; children live in the ElabContext arena and are referred
// to by id.

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

#include "lazy/common.hpp"
#include "lazy/elab/bundle.hpp"
#include "lazy/elab/dangle.hpp"
#include "lazy/elab/node.hpp"
#include "lazy/elab/resolve.hpp"

namespace lazy::elab {

class ElabContext;

enum class ElabState { Declared, Instantiating, Done };

const char* to_string(ElabState s);

// Result of instantiating one container.
struct ModuleImp {
    std::string mName; // final module name
    BoundaryBundle mAuto;
    std::vector<Dangle> mDangles; // still unresolved, for the parent
    std::vector<InternalLink> mLinks;
};

class Container {
  public:
    // Registers with the context, attaches to the open scope (if any) as a
    // child and opens its own scope. ElabContext::finalize closes it.
    explicit Container(ElabContext& ctx);
    virtual ~Container();

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    ContainerId id() const { return mId; }
    std::optional<ContainerId> parent() const;
    // Nearest ancestor first.
    std::vector<ContainerId> parents() const;
    const std::vector<ContainerId>& children() const { return mChildren; }
    const std::vector<std::unique_ptr<ConnectionPoint>>& nodes() const {
        return mNodes;
    }
    ElabContext& context() const { return mCtx; }
    bool finalized() const { return mFinalized; }
    const SourceInfo& info() const { return mInfo; }

    // Naming. The last non-empty suggestion wins.
    Container& suggestName(std::string_view n);
    Container& suggestName(const std::optional<std::string>& n);
    Container& suggestName(const char* n) {
        return suggestName(std::string_view(n));
    }
    Container& suggestName(const std::string& n) {
        return suggestName(std::string_view(n));
    }
    bool hasSuggestedName() const { return mSuggestedName.has_value(); }
    virtual std::string className() const;
    std::string name() const;
    std::string desiredName() const { return className(); }
    std::string line() const;

    // Declaration hooks; the open scope must be this container.
    void registerChild(ContainerId child);
    ConnectionPoint& registerNode(std::unique_ptr<ConnectionPoint> node);
    void defer(std::function<void()> action);
    size_t pendingActions() const { return mDeferred.size(); }

    // Instantiation. Declared -> Instantiating -> Done, once.
    ModuleImp& instantiate();
    void finishInstantiate();
    void validate() const;
    ElabState state() const { return mState; }

    // Available once the boundary is final, deferred actions included.
    const ModuleImp& module() const;
    const BoundaryBundle& boundary() const { return module().mAuto; }
    const std::string& moduleName() const { return module().mName; }
    std::string pathName() const;
    std::string instanceName() const;

    virtual bool omitGraph() const;
    // Pre-order walk of this subtree.
    void forEach(const std::function<void(const Container&)>& fn) const;

  private:
    friend class ElabContext;

    void requireOpenScope(const char* what) const;

    ElabContext& mCtx;
    ContainerId mId;
    ContainerId mParent = kNoContainer;
    std::vector<ContainerId> mChildren;
    std::vector<std::unique_ptr<ConnectionPoint>> mNodes;
    std::vector<std::function<void()>> mDeferred;
    std::optional<std::string> mSuggestedName;
    SourceInfo mInfo;
    bool mFinalized = false;

    ElabState mState = ElabState::Declared;
    std::unique_ptr<ModuleImp> mImp;
};

// Container with no body of its own; used for scopes and plain grouping.
class SimpleContainer : public Container {
  public:
    using Container::Container;
};

// Demangled type name with namespaces and template arguments stripped.
std::string readableTypeName(const std::type_info& ti);

} // namespace lazy::elab
