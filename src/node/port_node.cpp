#include "lazy/node/port_node.hpp"

#include <algorithm>

#include "lazy/elab/context.hpp"
#include "lazy/errors.hpp"

namespace lazy::node {

PortNode::PortNode(elab::ElabContext& ctx, std::string name,
                   PortDirection dir, uint32_t width)
    : elab::ConnectionPoint(ctx)
    , mName(std::move(name))
    , mDir(dir)
    , mWidth(width) {
    if (mWidth == 0) throw BindingError("port " + mName + " has zero width");
}

const std::vector<elab::Signal>& PortNode::signals() const {
    if (!mInstantiated) {
        throw PrematureAccessError("signals of port " + mName +
                                   " requested before instantiation");
    }
    return mSignals;
}

elab::Signal PortNode::signal(size_t i) const {
    const auto& sigs = signals();
    if (i >= sigs.size()) {
        throw ElabError("port " + mName + " has no signal " +
                        std::to_string(i) + " (has " +
                        std::to_string(sigs.size()) + ")");
    }
    return sigs[i];
}

void bind(PortNode& sink, PortNode& source) {
    auto what = [&] { return sink.mName + " := " + source.mName; };
    if (&sink == &source) {
        throw BindingError("port " + sink.mName + " bound to itself");
    }
    if (&sink.context() != &source.context()) {
        throw BindingError("binding across contexts: " + what());
    }
    if (sink.mDir != PortDirection::In || source.mDir != PortDirection::Out) {
        throw BindingError("binding " + what() + " needs an In sink and an "
                           "Out source (got " + to_string(sink.mDir) + " := " +
                           to_string(source.mDir) + ")");
    }
    if (sink.mWidth != source.mWidth) {
        throw BindingError("width mismatch binding " + what() + ": " +
                           std::to_string(sink.mWidth) + " vs " +
                           std::to_string(source.mWidth));
    }
    if (sink.mInstantiated || source.mInstantiated) {
        throw BindingError("binding " + what() + " after instantiation");
    }
    if (sink.bound()) {
        throw BindingError("input port " + sink.mName +
                           " is already driven by " +
                           sink.mEdges.front().mPeer->mName);
    }
    uint32_t srcIndex = static_cast<uint32_t>(source.mEdges.size());
    source.mEdges.push_back(PortNode::Edge{&sink, 0});
    sink.mEdges.push_back(PortNode::Edge{&source, srcIndex});
}

std::vector<elab::Dangle> PortNode::instantiate() {
    if (mInstantiated) {
        throw DoubleApplicationError("port " + mName + " instantiated twice");
    }
    auto& nl = mCtx.netlist();
    std::vector<elab::Dangle> out;

    auto makeSignal = [&](const std::string& n) {
        return elab::Signal(nl, nl.addWire(mWidth, IdString(n), owner()));
    };

    if (mEdges.empty()) {
        elab::Dangle d;
        d.mSource = elab::HalfEdge{serial(), 0};
        d.mSink = elab::HalfEdge{serial(), 0};
        d.mFlipped = (mDir == PortDirection::In);
        d.mName = mName;
        d.mData = makeSignal(mName);
        out.push_back(std::move(d));
    } else if (mDir == PortDirection::Out) {
        for (uint32_t i = 0; i < mEdges.size(); ++i) {
            elab::Dangle d;
            d.mSource = elab::HalfEdge{serial(), i};
            d.mSink = elab::HalfEdge{mEdges[i].mPeer->serial(), 0};
            d.mFlipped = false;
            d.mName = mName + "_" + std::to_string(i);
            d.mData = makeSignal(d.mName);
            out.push_back(std::move(d));
        }
    } else {
        const Edge& e = mEdges.front();
        elab::Dangle d;
        d.mSource = elab::HalfEdge{e.mPeer->serial(), e.mPeerIndex};
        d.mSink = elab::HalfEdge{serial(), 0};
        d.mFlipped = true;
        d.mName = mName;
        d.mData = makeSignal(mName);
        out.push_back(std::move(d));
    }

    mSignals.clear();
    for (const auto& d : out) {
        if (mDir == PortDirection::Out) nl.markDriver(d.mData.id());
        mSignals.push_back(d.mData);
    }
    mInstantiated = true;
    return out;
}

void PortNode::finishInstantiate() {
    if (!mInstantiated) {
        throw PrematureAccessError("finishInstantiate on port " + mName +
                                   " before instantiate");
    }
    if (mSignals.size() != std::max<size_t>(mEdges.size(), 1)) {
        throw ElabError("port " + mName + " has " +
                        std::to_string(mSignals.size()) + " signals for " +
                        std::to_string(mEdges.size()) + " bindings");
    }
}

void PortNode::validate() const {
    if (mDir != PortDirection::In || !mInstantiated) return;
    auto& nl = mCtx.netlist();
    for (const auto& s : mSignals) {
        if (!nl.driven(s.id())) {
            warn(mCtx.diag(), "port " + mName + " left " + s.toString() +
                                " unconnected (no driver)");
        }
    }
}

std::string PortNode::describe() const {
    return "PortNode " + mName + " (" + to_string(mDir) +
           ", width " + std::to_string(mWidth) + ")";
}

std::string PortNode::debugString() const {
    std::string s = "serial=" + std::to_string(serial()) +
                    " edges=" + std::to_string(mEdges.size());
    for (const auto& e : mEdges)
        s += " " + e.mPeer->mName + "#" + std::to_string(e.mPeer->serial());
    return s;
}

std::vector<elab::ConnectionPoint::Output> PortNode::outputs() const {
    std::vector<Output> out;
    if (mDir != PortDirection::Out) return out;
    for (const auto& e : mEdges) {
        RenderedEdge re;
        re.mColour = "#000000";
        re.mLabel = std::to_string(mWidth);
        re.mFlipped = false;
        out.emplace_back(e.mPeer, re);
    }
    return out;
}

} // namespace lazy::node
