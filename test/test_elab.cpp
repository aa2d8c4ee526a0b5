#include <sstream>

#include <gtest/gtest.h>

#include "designs.hpp"
#include "lazy/elab/context.hpp"
#include "lazy/elab/elaborate.hpp"
#include "lazy/errors.hpp"
#include "lazy/node/port_node.hpp"

using namespace lazy;
using namespace lazy::elab;
using lazy::node::PortNode;

namespace {

// Appends `tag` to a shared log when its deferred action runs.
class Recorder : public Container {
  public:
    Recorder(ElabContext& ctx, std::vector<std::string>& log, std::string tag,
             PortDirection dir)
        : Container(ctx)
        , mPort(ctx.makeNode<PortNode>("p", dir)) {
        ctx.defer([&log, tag] { log.push_back(tag); });
    }
    PortNode& mPort;
};

class Pair : public Container {
  public:
    Pair(ElabContext& ctx, std::vector<std::string>& log)
        : Container(ctx) {
        auto& a = ctx.make<Recorder>("a", log, "a", PortDirection::Out);
        auto& b = ctx.make<Recorder>("b", log, "b", PortDirection::In);
        bind(b.mPort, a.mPort);
        ctx.defer([&log] { log.push_back("root"); });
    }
};

class Holder : public Container {
  public:
    explicit Holder(ElabContext& ctx)
        : Container(ctx)
        , mLeaf(ctx.make<demo::Consumer>("leaf", 1u)) {}
    demo::Consumer& mLeaf;
};

class Chain : public Container {
  public:
    explicit Chain(ElabContext& ctx)
        : Container(ctx)
        , mSrc(ctx.make<demo::Producer>("src", 8u))
        , mStage(ctx.make<demo::Passthrough>("stage", 8u))
        , mSink(ctx.make<demo::Consumer>("sink", 8u)) {
        bind(mStage.mIn, mSrc.mOut);
        bind(mSink.mIn, mStage.mOut);
    }
    demo::Producer& mSrc;
    demo::Passthrough& mStage;
    demo::Consumer& mSink;
};

} // namespace

TEST(Elaborate, TwoChildrenResolveInternally) {
    std::vector<std::string> log;
    ElabContext ctx;
    auto& top = ctx.make<Pair>("Top", log);
    EXPECT_TRUE(log.empty());

    auto res = elaborate(ctx, top);
    EXPECT_EQ(top.boundary().size(), 0u);
    EXPECT_TRUE(res.mUnresolved.empty());
    EXPECT_EQ(res.mContainers, 3u);
    ASSERT_EQ(top.module().mLinks.size(), 1u);

    std::vector<std::string> expected{"a", "b", "root"};
    EXPECT_EQ(log, expected);
    EXPECT_EQ(top.state(), ElabState::Done);
}

TEST(Elaborate, UnpairedLeafBecomesRootPort) {
    ElabContext ctx;
    auto& top = ctx.make<Holder>("Root");
    auto res = elaborate(ctx, top);

    const auto& leafB = top.mLeaf.boundary();
    ASSERT_EQ(leafB.size(), 1u);
    EXPECT_EQ(leafB[0].mName.str(), "in");

    ASSERT_EQ(top.boundary().size(), 1u);
    EXPECT_EQ(top.boundary()[0].mName.str(), "leaf_in");
    EXPECT_EQ(top.boundary()[0].direction(), PortDirection::In);

    ASSERT_EQ(res.mUnresolved.size(), 1u);
    EXPECT_EQ(res.mUnresolved[0].mName, "Root_leaf_in");
    EXPECT_TRUE(res.mUnresolved[0].mFlipped);
    EXPECT_EQ(res.mUnresolved[0].mData, top.boundary()[0].mSignal);
}

TEST(Elaborate, InstantiateTwiceKeepsFirstResult) {
    ElabContext ctx;
    auto& top = ctx.make<demo::FanOut>("Top", 4u);
    ModuleImp& first = top.instantiate();
    top.finishInstantiate();
    auto names = first.mAuto.names();
    auto signals = ctx.netlist().size();

    EXPECT_THROW(top.instantiate(), DoubleApplicationError);
    EXPECT_EQ(&top.module(), &first);
    EXPECT_EQ(top.boundary().names(), names);
    EXPECT_EQ(ctx.netlist().size(), signals);
}

TEST(Elaborate, ModuleAccessBeforeInstantiation) {
    ElabContext ctx;
    auto& top = ctx.make<Chain>("Top");
    EXPECT_THROW(top.module(), PrematureAccessError);
    EXPECT_THROW(top.boundary(), PrematureAccessError);
    EXPECT_THROW(top.pathName(), PrematureAccessError);
    EXPECT_THROW(top.mSrc.mOut.signals(), PrematureAccessError);
    EXPECT_THROW(top.mStage.mDriven.get(), PrematureAccessError);
    EXPECT_FALSE(top.mStage.mDriven.ready());
    EXPECT_THROW(top.finishInstantiate(), PrematureAccessError);
}

TEST(Elaborate, InstantiateWhileDeclaringThrows) {
    ElabContext ctx;
    auto& done = ctx.make<SimpleContainer>("done");
    auto open = std::make_unique<SimpleContainer>(ctx);
    EXPECT_THROW(done.instantiate(), ScopeViolation);
    EXPECT_EQ(done.state(), ElabState::Declared);
    ctx.finalize(*open, "open");
    ctx.adopt(std::move(open));
    EXPECT_NO_THROW(done.instantiate());
}

TEST(Elaborate, ChainConnectsEndToEnd) {
    std::ostringstream diag;
    ElabContext ctx(&diag);
    auto& top = ctx.make<Chain>("Top");
    auto res = elaborate(ctx, top, ElabOptions{UnresolvedPolicy::Error});

    EXPECT_TRUE(res.mUnresolved.empty());
    EXPECT_EQ(res.mLinks, 2u);
    ASSERT_TRUE(top.mStage.mDriven.ready());
    EXPECT_EQ(top.mStage.mDriven.get(), 1u);

    auto& nl = ctx.netlist();
    EXPECT_TRUE(nl.sameNet(top.mSrc.mOut.signal().id(),
                           top.mSink.mIn.signal().id()));

    // Stage ports are exposed on the stage, then consumed by the chain.
    std::vector<std::string> stagePorts{"in", "out"};
    EXPECT_EQ(top.mStage.boundary().names(), stagePorts);
    EXPECT_EQ(top.mStage.pathName(), "Top.stage");
    EXPECT_EQ(top.mStage.moduleName(), "Passthrough");
    EXPECT_NE(diag.str().find("elaborated Top"), std::string::npos);
}

TEST(Elaborate, FanOutNamesAndDebugTaps) {
    ElabContext ctx;
    auto& top = ctx.make<demo::FanOut>("Top", 4u);
    auto res = elaborate(ctx, top);

    Container* src = findByPath(ctx, top, "Top.src");
    ASSERT_NE(src, nullptr);
    std::vector<std::string> srcPorts{"out_0", "out_1"};
    EXPECT_EQ(src->boundary().names(), srcPorts);

    Container* taps = findByPath(ctx, top, "taps");
    ASSERT_NE(taps, nullptr);
    EXPECT_EQ(taps->className(), "SimpleContainer");
    std::vector<std::string> tapPorts{"debug_0", "debug_1"};
    EXPECT_EQ(taps->boundary().names(), tapPorts);

    std::vector<std::string> rootPorts{"taps_debug_0", "taps_debug_1"};
    EXPECT_EQ(top.boundary().names(), rootPorts);
    for (const auto& p : top.boundary())
        EXPECT_EQ(p.direction(), PortDirection::Out);
    EXPECT_EQ(res.mUnresolved.size(), 2u);
    EXPECT_EQ(res.mContainers, 5u);
    EXPECT_EQ(findByPath(ctx, top, "Top.nope"), nullptr);
}

TEST(Elaborate, ErrorPolicyRejectsUnresolvedRoot) {
    ElabContext ctx;
    auto& top = ctx.make<demo::FanOut>("Top", 4u);
    try {
        elaborate(ctx, top, ElabOptions{UnresolvedPolicy::Error});
        FAIL() << "expected UnresolvedBoundaryError";
    } catch (const UnresolvedBoundaryError& e) {
        EXPECT_NE(std::string(e.what()).find("Top_taps_debug"),
                  std::string::npos);
    }
}

TEST(Elaborate, WarnPolicyLogsEachDangle) {
    std::ostringstream diag;
    ElabContext ctx(&diag);
    auto& top = ctx.make<demo::FanOut>("Top", 4u);
    auto res = elaborate(ctx, top, ElabOptions{UnresolvedPolicy::Warn});
    EXPECT_EQ(res.mUnresolved.size(), 2u);
    EXPECT_NE(diag.str().find("unresolved root dangle Top_taps_debug"),
              std::string::npos);
}

TEST(Elaborate, ParsePolicy) {
    UnresolvedPolicy p = UnresolvedPolicy::Keep;
    EXPECT_TRUE(parsePolicy("error", p));
    EXPECT_EQ(p, UnresolvedPolicy::Error);
    EXPECT_FALSE(parsePolicy("strict", p));
    EXPECT_EQ(p, UnresolvedPolicy::Error);
    EXPECT_STREQ(to_string(UnresolvedPolicy::Warn), "warn");
}

TEST(Elaborate, HierarchyDumpListsEveryContainer) {
    ElabContext ctx;
    auto& top = ctx.make<demo::Pipeline>("Top", 8u, 2);
    elaborate(ctx, top);
    std::ostringstream oss;
    dumpHierarchy(ctx, top, oss);
    std::string out = oss.str();
    for (const char* n : {"'Top'", "'src'", "'stage0'", "'stage1'", "'sink'"})
        EXPECT_NE(out.find(n), std::string::npos) << n;
    EXPECT_EQ(top.boundary().size(), 0u);
}

TEST(PortNode, BindingRules) {
    ElabContext ctx;
    auto& top = ctx.make<SimpleContainer>("top");
    ctx.withScope(top, [&] {
        auto& o = ctx.makeNode<PortNode>("o", PortDirection::Out, 2);
        auto& i = ctx.makeNode<PortNode>("i", PortDirection::In, 2);
        auto& j = ctx.makeNode<PortNode>("j", PortDirection::In, 2);
        auto& narrow = ctx.makeNode<PortNode>("n", PortDirection::In, 1);

        EXPECT_THROW(bind(o, i), BindingError);
        EXPECT_THROW(bind(i, i), BindingError);
        EXPECT_THROW(bind(narrow, o), BindingError);
        bind(i, o);
        bind(j, o);
        EXPECT_THROW(bind(i, o), BindingError);
        EXPECT_EQ(o.edgeCount(), 2u);
        EXPECT_TRUE(i.bound());
        EXPECT_FALSE(narrow.bound());
    });
    EXPECT_THROW(ctx.makeNode<PortNode>("late", PortDirection::Out),
                 ScopeViolation);
}

TEST(PortNode, SerialsAreUniquePerContext) {
    ElabContext ctx;
    auto& top = ctx.make<Chain>("Top");
    EXPECT_NE(top.mSrc.mOut.serial(), top.mStage.mIn.serial());
    EXPECT_NE(top.mStage.mIn.serial(), top.mStage.mOut.serial());
    EXPECT_EQ(top.mStage.mOut.owner(), top.mStage.id());
    EXPECT_EQ(top.mStage.mOut.index(), 1u);
}

TEST(PortNode, UndrivenInputIsReported) {
    std::ostringstream diag;
    ElabContext ctx(&diag);
    auto& leaf = ctx.make<demo::Consumer>("leaf", 1u);
    elaborate(ctx, leaf);

    auto& nl = ctx.netlist();
    EXPECT_FALSE(nl.driven(leaf.mIn.signal().id()));
    EXPECT_NE(diag.str().find("port in left"), std::string::npos);
    EXPECT_NE(diag.str().find("unconnected"), std::string::npos);
}

TEST(PortNode, DrivenInputsStayQuiet) {
    std::ostringstream diag;
    ElabContext ctx(&diag);
    auto& top = ctx.make<Chain>("Top");
    elaborate(ctx, top);

    auto& nl = ctx.netlist();
    EXPECT_TRUE(nl.driven(top.mStage.mIn.signal().id()));
    EXPECT_TRUE(nl.driven(top.mSink.mIn.signal().id()));
    EXPECT_EQ(diag.str().find("unconnected"), std::string::npos);
}
