#pragma once
// PortNode: a point-to-point connection point. An Out node supplies one
// signal per binding (fan-out allowed); an In node receives from at most one
// Out node. An unbound node surfaces as a boundary port of its container.

#include <string>
#include <vector>

#include "lazy/common.hpp"
#include "lazy/elab/node.hpp"
#include "lazy/elab/signal.hpp"

namespace lazy::node {

class PortNode : public elab::ConnectionPoint {
  public:
    PortNode(elab::ElabContext& ctx, std::string name, PortDirection dir,
             uint32_t width = 1);

    const std::string& name() const { return mName; }
    PortDirection direction() const { return mDir; }
    uint32_t width() const { return mWidth; }
    size_t edgeCount() const { return mEdges.size(); }
    bool bound() const { return !mEdges.empty(); }
    bool instantiated() const { return mInstantiated; }

    // One signal per emitted dangle; only after instantiation.
    const std::vector<elab::Signal>& signals() const;
    elab::Signal signal(size_t i = 0) const;

    std::vector<elab::Dangle> instantiate() override;
    void finishInstantiate() override;
    // Warns when an In port's net has no Out driver.
    void validate() const override;

    std::string describe() const override;
    std::string debugString() const override;
    std::vector<Output> outputs() const override;

    // sink := source
    friend void bind(PortNode& sink, PortNode& source);

  private:
    struct Edge {
        PortNode* mPeer = nullptr;
        uint32_t mPeerIndex = 0; // position of this edge in the peer's list
    };

    std::string mName;
    PortDirection mDir;
    uint32_t mWidth;
    std::vector<Edge> mEdges;
    std::vector<elab::Signal> mSignals;
    bool mInstantiated = false;
};

void bind(PortNode& sink, PortNode& source);

} // namespace lazy::node
