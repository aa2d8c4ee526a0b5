#pragma once
// Minimal circuit description behind elab::Signal: signal table, directed
// connections, and union-find net membership.

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "lazy/common.hpp"
#include "lazy/util/id_string.hpp"

namespace lazy {
namespace net {

using SignalId = uint32_t;
using NetId = uint32_t;
inline constexpr SignalId kInvalidSignal = 0xFFFFFFFFu;

enum class SignalKind { Wire, Port };

const char* to_string(SignalKind k);

struct SignalInfo {
    IdString mName;
    uint32_t mWidth = 1;
    ContainerId mOwner = kNoContainer;
    SignalKind mKind = SignalKind::Wire;
    PortDirection mDir = PortDirection::Out; // meaningful for ports only
    bool mDriver = false;
};

// sink <= source
struct Connection {
    SignalId mSink = kInvalidSignal;
    SignalId mSource = kInvalidSignal;
};

struct UnionFind {
    std::vector<uint32_t> mParent;
    std::vector<uint32_t> mRank;

    uint32_t addNode();
    uint32_t find(uint32_t x);
    void unite(uint32_t a, uint32_t b);
};

struct Netlist {
    std::vector<SignalInfo> mSignals;
    std::vector<Connection> mConnections;
    std::vector<uint32_t> mDegree; // connections touching each signal
    UnionFind mUf;

    SignalId addWire(uint32_t width, IdString name = IdString(),
                     ContainerId owner = kNoContainer);
    // Turn an allocated signal into a named boundary port of `owner`.
    void bindPort(SignalId id, ContainerId owner, IdString name,
                  PortDirection dir);
    void connect(SignalId sink, SignalId source);
    void markDriver(SignalId id);
    // True if some signal on the net of `id` is a marked driver.
    bool driven(SignalId id);

    SignalId size() const { return static_cast<SignalId>(mSignals.size()); }
    bool contains(SignalId id) const { return id < mSignals.size(); }
    const SignalInfo& info(SignalId id) const;
    uint32_t degree(SignalId id) const;

    NetId netId(SignalId id);
    bool sameNet(SignalId a, SignalId b);
    std::vector<std::vector<SignalId>> collectGroups();

    std::string renderSignal(SignalId id) const;
    void dump(std::ostream& os);
};

} // namespace net
} // namespace lazy
