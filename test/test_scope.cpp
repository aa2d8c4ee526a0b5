#include <stdexcept>

#include <gtest/gtest.h>

#include "lazy/elab/context.hpp"
#include "lazy/elab/scope.hpp"
#include "lazy/errors.hpp"

using namespace lazy;
using namespace lazy::elab;

TEST(ScopeStack, NestedEnterExitRestores) {
    ScopeStack s;
    EXPECT_FALSE(s.current().has_value());
    s.enter(1);
    s.enter(2);
    s.enter(3);
    EXPECT_EQ(s.depth(), 3u);
    EXPECT_EQ(*s.current(), 3u);
    s.exit(3);
    EXPECT_EQ(*s.current(), 2u);
    s.exit(2);
    s.exit(1);
    EXPECT_TRUE(s.empty());
    EXPECT_FALSE(s.current().has_value());
}

TEST(ScopeStack, ExitNonTopLeavesStackUnchanged) {
    ScopeStack s;
    s.enter(7);
    s.enter(8);
    EXPECT_THROW(s.exit(7), ScopeViolation);
    ASSERT_EQ(s.depth(), 2u);
    EXPECT_EQ(s.frames()[0], 7u);
    EXPECT_EQ(s.frames()[1], 8u);
}

TEST(ScopeStack, ExitEmptyThrows) {
    ScopeStack s;
    try {
        s.exit(0);
        FAIL() << "expected ScopeViolation";
    } catch (const ScopeViolation& e) {
        EXPECT_NE(std::string(e.what()).find("scope was empty"),
                  std::string::npos);
    }
    EXPECT_TRUE(s.empty());
}

TEST(ScopeStack, GuardTruncatesOnUnwind) {
    ScopeStack s;
    s.enter(1);
    try {
        ScopeStack::Guard g(s, 2);
        s.enter(3); // never closed
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    ASSERT_EQ(s.depth(), 1u);
    EXPECT_EQ(*s.current(), 1u);
}

TEST(Context, WithScopeRestoresAfterThrow) {
    ElabContext ctx;
    auto& c = ctx.make<SimpleContainer>("c");
    ASSERT_TRUE(ctx.scope().empty());
    EXPECT_THROW(ctx.withScope(c, [] { throw std::runtime_error("body"); }),
                 std::runtime_error);
    EXPECT_TRUE(ctx.scope().empty());
}

TEST(Context, WithScopeRejectsUnclosedInnerScope) {
    ElabContext ctx;
    auto& outer = ctx.make<SimpleContainer>("outer");
    auto& inner = ctx.make<SimpleContainer>("inner");
    EXPECT_THROW(ctx.withScope(outer, [&] { ctx.scope().enter(inner.id()); }),
                 ScopeViolation);
    EXPECT_TRUE(ctx.scope().empty());
}

TEST(Context, WithScopeReturnsBodyValue) {
    ElabContext ctx;
    auto& c = ctx.make<SimpleContainer>("c");
    int v = ctx.withScope(c, [&] {
        EXPECT_EQ(&ctx.currentContainer(), &c);
        return 42;
    });
    EXPECT_EQ(v, 42);
    EXPECT_TRUE(ctx.scope().empty());
}

TEST(Context, LazyScopeNestsChildren) {
    ElabContext ctx;
    auto& top = ctx.make<SimpleContainer>("top");
    ctx.withScope(top, [&] {
        ctx.lazyScope("g", [&] { ctx.make<SimpleContainer>("leaf"); });
    });
    ASSERT_EQ(top.children().size(), 1u);
    const Container& g = ctx.container(top.children()[0]);
    EXPECT_EQ(g.name(), "g");
    ASSERT_EQ(g.children().size(), 1u);
    EXPECT_EQ(ctx.container(g.children()[0]).name(), "leaf");
    EXPECT_EQ(ctx.roots(), std::vector<ContainerId>{top.id()});
}

TEST(Context, FinalizeTwiceThrows) {
    ElabContext ctx;
    auto& c = ctx.make<SimpleContainer>("c");
    EXPECT_TRUE(c.finalized());
    EXPECT_THROW(ctx.finalize(c, "c"), DoubleApplicationError);
}

TEST(Context, FinalizeWithInnerScopeOpenThrows) {
    ElabContext ctx;
    auto outer = std::make_unique<SimpleContainer>(ctx);
    auto inner = std::make_unique<SimpleContainer>(ctx);
    ASSERT_TRUE(inner->parent().has_value());
    EXPECT_EQ(*inner->parent(), outer->id());
    EXPECT_THROW(ctx.finalize(*outer, "outer"), ScopeViolation);
    EXPECT_FALSE(outer->finalized());

    ctx.finalize(*inner, "inner");
    ctx.finalize(*outer, "outer");
    EXPECT_TRUE(ctx.scope().empty());
    ctx.adopt(std::move(inner));
    ctx.adopt(std::move(outer));
}

TEST(Context, RegistrationNeedsOpenScope) {
    ElabContext ctx;
    EXPECT_THROW(ctx.defer([] {}), ScopeViolation);
    EXPECT_THROW(ctx.inModuleBody([] { return 1; }), ScopeViolation);
    EXPECT_THROW(ctx.currentContainer(), ScopeViolation);

    auto& c = ctx.make<SimpleContainer>("c");
    // Declaration of c is closed.
    EXPECT_THROW(c.defer([] {}), ScopeViolation);
    EXPECT_EQ(c.pendingActions(), 0u);
}

TEST(Context, FailedChildDeclarationLeavesNoArenaEntry) {
    ElabContext ctx;
    auto& done = ctx.make<SimpleContainer>("done");
    done.instantiate();
    const ContainerId late = done.id() + 1;

    EXPECT_THROW(ctx.withScope(done, [&] { ctx.make<SimpleContainer>("late"); }),
                 ScopeViolation);
    EXPECT_TRUE(ctx.scope().empty());
    EXPECT_TRUE(done.children().empty());
    EXPECT_EQ(ctx.roots(), std::vector<ContainerId>{done.id()});
    EXPECT_THROW(ctx.container(late), ElabError);
}
