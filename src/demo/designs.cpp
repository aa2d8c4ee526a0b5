#include "designs.hpp"

namespace lazy::demo {

using node::PortNode;

Producer::Producer(elab::ElabContext& ctx, uint32_t width)
    : elab::Container(ctx)
    , mOut(ctx.makeNode<PortNode>("out", PortDirection::Out, width)) {}

Consumer::Consumer(elab::ElabContext& ctx, uint32_t width)
    : elab::Container(ctx)
    , mIn(ctx.makeNode<PortNode>("in", PortDirection::In, width)) {}

Passthrough::Passthrough(elab::ElabContext& ctx, uint32_t width)
    : elab::Container(ctx)
    , mIn(ctx.makeNode<PortNode>("in", PortDirection::In, width))
    , mOut(ctx.makeNode<PortNode>("out", PortDirection::Out, width)) {
    mDriven = ctx.inModuleBody([this] {
        for (const auto& s : mOut.signals())
            elab::connect(s, mIn.signal());
        return mOut.signals().size();
    });
}

Pipeline::Pipeline(elab::ElabContext& ctx, uint32_t width, int stages)
    : elab::Container(ctx) {
    auto& src = ctx.make<Producer>("src", width);
    PortNode* prev = &src.mOut;
    for (int i = 0; i < stages; ++i) {
        auto& st =
          ctx.make<Passthrough>("stage" + std::to_string(i), width);
        bind(st.mIn, *prev);
        prev = &st.mOut;
    }
    auto& sink = ctx.make<Consumer>("sink", width);
    bind(sink.mIn, *prev);
}

FanOut::FanOut(elab::ElabContext& ctx, uint32_t width)
    : elab::Container(ctx) {
    auto& src = ctx.make<Producer>("src", width);
    auto& a = ctx.make<Consumer>("a", width);
    auto& b = ctx.make<Consumer>("b", width);
    bind(a.mIn, src.mOut);
    bind(b.mIn, src.mOut);
    // Grouped taps: the scope is a plain container named "taps".
    ctx.lazyScope("taps", [&] {
        ctx.makeNode<PortNode>("debug", PortDirection::Out, width);
        ctx.makeNode<PortNode>("debug_1", PortDirection::Out, width);
    });
}

elab::DesignLib builtinDesigns() {
    elab::DesignLib lib;
    lib["pipeline"] = [](elab::ElabContext& ctx) -> elab::Container& {
        return ctx.make<Pipeline>("pipeline", 8u, 2);
    };
    lib["fanout"] = [](elab::ElabContext& ctx) -> elab::Container& {
        return ctx.make<FanOut>("fanout", 4u);
    };
    lib["leaf"] = [](elab::ElabContext& ctx) -> elab::Container& {
        return ctx.make<Consumer>("leaf", 1u);
    };
    return lib;
}

} // namespace lazy::demo
