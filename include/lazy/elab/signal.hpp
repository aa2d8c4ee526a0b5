#pragma once
// Opaque payload carried by dangles: a handle into a Netlist plus a
// direction flag. Supports clone, flip and connect.

#include <string>

#include "lazy/net/netlist.hpp"

namespace lazy::elab {

class Signal {
  public:
    Signal() = default;
    Signal(net::Netlist& nl, net::SignalId id, bool flipped = false)
        : mNetlist(&nl)
        , mId(id)
        , mFlipped(flipped) {}

    bool valid() const;
    net::SignalId id() const { return mId; }
    bool flipped() const { return mFlipped; }
    uint32_t width() const;
    IdString name() const;
    net::Netlist* netlist() const { return mNetlist; }

    // Fresh unnamed signal of the same type in the same netlist.
    Signal cloneType() const;
    Signal flip() const;

    std::string toString() const;

    bool operator==(const Signal& o) const {
        return mNetlist == o.mNetlist && mId == o.mId;
    }
    bool operator!=(const Signal& o) const { return !(*this == o); }

  private:
    net::Netlist* mNetlist = nullptr;
    net::SignalId mId = net::kInvalidSignal;
    bool mFlipped = false;
};

// sink <= source. Both must live in the same netlist.
void connect(const Signal& sink, const Signal& source);

} // namespace lazy::elab
