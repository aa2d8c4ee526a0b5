#include "lazy/net/netlist.hpp"

#include <map>

#include "lazy/errors.hpp"

namespace lazy::net {
const char* to_string(SignalKind k) {
    switch (k) {
    case SignalKind::Wire: return "wire";
    case SignalKind::Port: return "port";
    }
    return "?";
}

// -------------------------------------------
// UnionFind
uint32_t UnionFind::addNode() {
    uint32_t idx = static_cast<uint32_t>(mParent.size());
    mParent.push_back(idx);
    mRank.push_back(0);
    return idx;
}

uint32_t UnionFind::find(uint32_t x) {
    if (mParent[x] != x) mParent[x] = find(mParent[x]);
    return mParent[x];
}

void UnionFind::unite(uint32_t a, uint32_t b) {
    a = find(a);
    b = find(b);
    if (a == b) return;
    if (mRank[a] < mRank[b]) std::swap(a, b);
    mParent[b] = a;
    if (mRank[a] == mRank[b]) mRank[a]++;
}

// End of UnionFind
// -------------------------------------------
// Netlist
SignalId Netlist::addWire(uint32_t width, IdString name, ContainerId owner) {
    if (width == 0) throw SignalError("signal width must be non-zero");
    SignalId id = static_cast<SignalId>(mSignals.size());
    SignalInfo si;
    si.mName = name;
    si.mWidth = width;
    si.mOwner = owner;
    mSignals.push_back(si);
    mDegree.push_back(0);
    mUf.addNode();
    return id;
}

void Netlist::bindPort(SignalId id, ContainerId owner, IdString name,
                       PortDirection dir) {
    if (!contains(id))
        throw SignalError("bindPort on unknown signal " + std::to_string(id));
    auto& si = mSignals[id];
    si.mName = name;
    si.mOwner = owner;
    si.mKind = SignalKind::Port;
    si.mDir = dir;
}

void Netlist::connect(SignalId sink, SignalId source) {
    if (!contains(sink) || !contains(source)) {
        throw SignalError("connect on unknown signal (sink=" +
                          std::to_string(sink) +
                          ", source=" + std::to_string(source) + ")");
    }
    if (sink == source) {
        throw SignalError("signal " + renderSignal(sink) +
                          " connected to itself");
    }
    if (mSignals[sink].mWidth != mSignals[source].mWidth) {
        throw SignalError(
          "width mismatch connecting " + renderSignal(sink) + " (" +
          std::to_string(mSignals[sink].mWidth) + ") <= " +
          renderSignal(source) + " (" +
          std::to_string(mSignals[source].mWidth) + ")");
    }
    mConnections.push_back(Connection{sink, source});
    mDegree[sink]++;
    mDegree[source]++;
    mUf.unite(sink, source);
}

void Netlist::markDriver(SignalId id) {
    if (!contains(id))
        throw SignalError("markDriver on unknown signal " +
                          std::to_string(id));
    mSignals[id].mDriver = true;
}

bool Netlist::driven(SignalId id) {
    if (!contains(id)) return false;
    const NetId net = mUf.find(id);
    for (SignalId i = 0; i < size(); ++i) {
        if (mSignals[i].mDriver && mUf.find(i) == net) return true;
    }
    return false;
}

const SignalInfo& Netlist::info(SignalId id) const {
    if (!contains(id))
        throw SignalError("unknown signal " + std::to_string(id));
    return mSignals[id];
}

uint32_t Netlist::degree(SignalId id) const {
    return contains(id) ? mDegree[id] : 0;
}

NetId Netlist::netId(SignalId id) {
    if (!contains(id)) return id;
    return mUf.find(id);
}

bool Netlist::sameNet(SignalId a, SignalId b) {
    if (!contains(a) || !contains(b)) return false;
    return mUf.find(a) == mUf.find(b);
}

std::vector<std::vector<SignalId>> Netlist::collectGroups() {
    // Ordered by root so the dump is stable.
    std::map<NetId, std::vector<SignalId>> m;
    for (SignalId i = 0; i < size(); ++i) {
        m[mUf.find(i)].push_back(i);
    }
    std::vector<std::vector<SignalId>> g;
    g.reserve(m.size());
    for (auto& kv : m)
        g.push_back(std::move(kv.second));
    return g;
}

std::string Netlist::renderSignal(SignalId id) const {
    if (!contains(id)) return "<signal " + std::to_string(id) + ">";
    const auto& si = mSignals[id];
    std::string s = std::string(to_string(si.mKind)) + " ";
    s += si.mName.valid() ? si.mName.str() : "_" + std::to_string(id);
    if (si.mOwner != kNoContainer) s += "@" + std::to_string(si.mOwner);
    return s;
}

void Netlist::dump(std::ostream& os) {
    os << "Signals (" << size() << "):\n";
    for (SignalId i = 0; i < size(); ++i) {
        const auto& si = mSignals[i];
        os << "  [" << i << "] " << renderSignal(i) << " width=" << si.mWidth;
        if (si.mKind == SignalKind::Port) os << " dir=" << to_string(si.mDir);
        if (si.mDriver) os << " driver";
        os << "\n";
    }
    os << "Connections (" << mConnections.size() << "):\n";
    for (const auto& c : mConnections) {
        os << "  " << renderSignal(c.mSink) << " <= "
           << renderSignal(c.mSource) << "\n";
    }
    auto groups = collectGroups();
    os << "Nets (" << groups.size() << "):\n";
    for (auto& grp : groups) {
        os << "  { ";
        for (size_t i = 0; i < grp.size(); ++i) {
            os << renderSignal(grp[i]);
            if (i + 1 < grp.size()) os << ", ";
        }
        os << " }\n";
    }
}
// End of Netlist
// -------------------------------------------

} // namespace lazy::net
