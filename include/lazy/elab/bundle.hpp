#pragma once
// Boundary bundle: the named, ordered, directional port set a container
// exposes after internal resolution.

#include <string>
#include <string_view>
#include <vector>

#include "lazy/common.hpp"
#include "lazy/elab/signal.hpp"
#include "lazy/net/netlist.hpp"

namespace lazy::elab {

// Remove a trailing run of "_<digits>" groups: "a_0_1" -> "a".
std::string trimIndexSuffix(std::string_view name);

// Names unique after trimming keep the trimmed key; keys shared by several
// entries become key_0, key_1, ... in input order. Output order matches
// input order.
std::vector<std::string> uniquifyPortNames(
  const std::vector<std::string>& rawNames);

struct BundleEntry {
    std::string mName;
    Signal mData;
    bool mFlipped = false;
};

struct BundlePort {
    IdString mName;
    Signal mSignal;
    bool mFlipped = false;

    PortDirection direction() const { return directionOf(mFlipped); }
};

class BoundaryBundle {
  public:
    using const_iterator = std::vector<BundlePort>::const_iterator;

    BoundaryBundle() = default;

    // Allocates one port of `owner` per entry, in entry order.
    static BoundaryBundle build(const std::vector<BundleEntry>& elts,
                                net::Netlist& nl, ContainerId owner);

    size_t size() const { return mElements.size(); }
    bool empty() const { return mElements.empty(); }
    const BundlePort& operator[](size_t i) const { return mElements[i]; }
    const_iterator begin() const { return mElements.begin(); }
    const_iterator end() const { return mElements.end(); }

    const BundlePort* find(std::string_view name) const;
    std::vector<std::string> names() const;

  private:
    std::vector<BundlePort> mElements;
};

} // namespace lazy::elab
