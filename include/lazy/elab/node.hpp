#pragma once
// ConnectionPoint: a typed attachment point owned by exactly one Container.
// Concrete node types decide how bindings turn into dangles.

#include <string>
#include <utility>
#include <vector>

#include "lazy/common.hpp"
#include "lazy/elab/dangle.hpp"

namespace lazy::elab {

class ElabContext;

class ConnectionPoint {
  public:
    // How an outgoing edge is drawn by the graph exporters.
    struct RenderedEdge {
        std::string mColour = "#000000";
        std::string mLabel;
        bool mFlipped = false;
    };
    using Output = std::pair<const ConnectionPoint*, RenderedEdge>;

    explicit ConnectionPoint(ElabContext& ctx);
    virtual ~ConnectionPoint() = default;

    ConnectionPoint(const ConnectionPoint&) = delete;
    ConnectionPoint& operator=(const ConnectionPoint&) = delete;

    // Dangles for this point, in a stable order.
    virtual std::vector<Dangle> instantiate() = 0;
    // Runs once the enclosing container's wiring is final.
    virtual void finishInstantiate() {}
    // Runs from the root driver once the whole design is wired.
    virtual void validate() const {}

    virtual std::string describe() const = 0;
    virtual std::string debugString() const { return {}; }
    virtual bool omitGraph() const { return false; }
    virtual std::vector<Output> outputs() const { return {}; }

    uint32_t serial() const { return mSerial; }
    ContainerId owner() const { return mOwner; }
    uint32_t index() const { return mIndex; }
    ElabContext& context() const { return mCtx; }

  protected:
    ElabContext& mCtx;

  private:
    friend class Container;

    uint32_t mSerial;
    ContainerId mOwner = kNoContainer;
    uint32_t mIndex = 0;
};

} // namespace lazy::elab
