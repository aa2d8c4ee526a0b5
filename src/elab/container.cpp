#include "lazy/elab/container.hpp"

#include <cstdlib>
#include <cxxabi.h>

#include "lazy/elab/context.hpp"
#include "lazy/errors.hpp"

namespace lazy::elab {

const char* to_string(ElabState s) {
    switch (s) {
    case ElabState::Declared: return "Declared";
    case ElabState::Instantiating: return "Instantiating";
    case ElabState::Done: return "Done";
    }
    return "?";
}

std::string readableTypeName(const std::type_info& ti) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(ti.name(), nullptr, nullptr, &status), std::free);
    std::string full = (status == 0 && demangled) ? demangled.get() : ti.name();
    if (auto lt = full.find('<'); lt != std::string::npos) full.erase(lt);
    if (auto sep = full.rfind("::"); sep != std::string::npos) {
        full = full.substr(sep + 2);
    }
    return full;
}

Container::Container(ElabContext& ctx)
    : mCtx(ctx)
    , mId(ctx.registerContainer(this)) {
    // The destructor does not run if this throws.
    try {
        if (auto cur = ctx.scope().current()) {
            mParent = *cur;
            ctx.container(*cur).registerChild(mId);
        }
    } catch (...) {
        ctx.releaseContainer(mId);
        throw;
    }
    ctx.scope().enter(mId);
}

Container::~Container() { mCtx.releaseContainer(mId); }

std::optional<ContainerId> Container::parent() const {
    if (mParent == kNoContainer) return std::nullopt;
    return mParent;
}

std::vector<ContainerId> Container::parents() const {
    std::vector<ContainerId> out;
    for (auto p = parent(); p; p = mCtx.container(*p).parent())
        out.push_back(*p);
    return out;
}

Container& Container::suggestName(std::string_view n) {
    if (!n.empty()) mSuggestedName = std::string(n);
    return *this;
}

Container& Container::suggestName(const std::optional<std::string>& n) {
    if (n) suggestName(std::string_view(*n));
    return *this;
}

std::string Container::className() const {
    return readableTypeName(typeid(*this));
}

std::string Container::name() const {
    return mSuggestedName ? *mSuggestedName : className();
}

std::string Container::line() const { return mInfo.toString(); }

void Container::requireOpenScope(const char* what) const {
    if (mState != ElabState::Declared) {
        throw ScopeViolation(std::string(what) + " on " + name() +
                             " after its instantiation started");
    }
    auto cur = mCtx.scope().current();
    if (!cur) {
        throw ScopeViolation(std::string(what) + " on " + name() +
                             " with no open scope");
    }
    if (*cur != mId) {
        throw ScopeViolation(std::string(what) + " on " + name() + " while " +
                             mCtx.describe(*cur) + " is the open scope");
    }
}

void Container::registerChild(ContainerId child) {
    requireOpenScope("registerChild");
    mChildren.push_back(child);
}

ConnectionPoint& Container::registerNode(
  std::unique_ptr<ConnectionPoint> node) {
    requireOpenScope("registerNode");
    if (&node->context() != &mCtx) {
        throw ElabError("node " + node->describe() +
                        " belongs to a different context than " + name());
    }
    node->mOwner = mId;
    node->mIndex = static_cast<uint32_t>(mNodes.size());
    mNodes.push_back(std::move(node));
    return *mNodes.back();
}

void Container::defer(std::function<void()> action) {
    requireOpenScope("defer");
    mDeferred.push_back(std::move(action));
}

ModuleImp& Container::instantiate() {
    if (mState == ElabState::Instantiating) {
        throw DoubleApplicationError("container " + name() +
                                     " instantiated while already "
                                     "instantiating (declaration cycle)");
    }
    if (mState == ElabState::Done) {
        throw DoubleApplicationError("container " + name() +
                                     " instantiated twice");
    }
    if (auto cur = mCtx.scope().current()) {
        throw ScopeViolation(name() + ".module was constructed before " +
                             mCtx.describe(*cur) + " was finalized");
    }
    mState = ElabState::Instantiating;

    std::vector<Dangle> childDangles;
    for (ContainerId cid : mChildren) {
        Container& child = mCtx.container(cid);
        const ModuleImp& imp = child.instantiate();
        child.finishInstantiate();
        childDangles.insert(
          childDangles.end(), imp.mDangles.begin(), imp.mDangles.end());
    }

    std::vector<Dangle> allDangles;
    for (auto& node : mNodes) {
        auto ds = node->instantiate();
        allDangles.insert(allDangles.end(),
                          std::make_move_iterator(ds.begin()),
                          std::make_move_iterator(ds.end()));
    }
    allDangles.insert(allDangles.end(),
                      std::make_move_iterator(childDangles.begin()),
                      std::make_move_iterator(childDangles.end()));

    auto imp = std::make_unique<ModuleImp>();
    imp->mName = desiredName();
    std::vector<Dangle> forward =
      resolveDangles(std::move(allDangles), name(), &imp->mLinks);

    std::vector<BundleEntry> elts;
    elts.reserve(forward.size());
    for (const auto& d : forward)
        elts.push_back(BundleEntry{d.mName, d.mData, d.mFlipped});
    imp->mAuto = BoundaryBundle::build(elts, mCtx.netlist(), mId);

    // Hook each leftover to its port and hand it to the parent under the
    // port's signal.
    const std::string prefix = name();
    imp->mDangles.reserve(forward.size());
    for (size_t i = 0; i < forward.size(); ++i) {
        Dangle d = std::move(forward[i]);
        const BundlePort& port = imp->mAuto[i];
        if (d.mFlipped) {
            connect(d.mData, port.mSignal);
        } else {
            connect(port.mSignal, d.mData);
        }
        d.mData = port.mSignal;
        d.mName = prefix + "_" + d.mName;
        imp->mDangles.push_back(std::move(d));
    }
    mImp = std::move(imp);

    auto actions = std::move(mDeferred);
    mDeferred.clear();
    for (auto& action : actions)
        action();

    mState = ElabState::Done;
    return *mImp;
}

void Container::finishInstantiate() {
    if (mState != ElabState::Done) {
        throw PrematureAccessError("finishInstantiate on " + name() +
                                   " in state " + to_string(mState));
    }
    for (auto& node : mNodes)
        node->finishInstantiate();
}

void Container::validate() const {
    for (const auto& node : mNodes)
        node->validate();
}

const ModuleImp& Container::module() const {
    if (!mImp) {
        throw PrematureAccessError(name() +
                                   ".module accessed before instantiation "
                                   "(state " +
                                   std::string(to_string(mState)) + ")");
    }
    return *mImp;
}

std::string Container::pathName() const {
    (void)module();
    std::string path = name();
    for (ContainerId pid : parents()) {
        const Container& p = mCtx.container(pid);
        if (p.state() == ElabState::Declared) {
            throw PrematureAccessError("path of " + name() +
                                       " requested before ancestor " +
                                       p.name() + " was instantiated");
        }
        path = p.name() + "." + path;
    }
    return path;
}

std::string Container::instanceName() const {
    (void)module();
    return name();
}

bool Container::omitGraph() const {
    for (const auto& n : mNodes)
        if (!n->omitGraph()) return false;
    for (ContainerId cid : mChildren)
        if (!mCtx.container(cid).omitGraph()) return false;
    return true;
}

void Container::forEach(
  const std::function<void(const Container&)>& fn) const {
    fn(*this);
    for (ContainerId cid : mChildren)
        mCtx.container(cid).forEach(fn);
}

} // namespace lazy::elab
