#pragma once
// HalfEdge ordering key and Dangle: one unresolved end of a connection.

#include <cstdint>
#include <string>
#include <tuple>

#include "lazy/elab/signal.hpp"

namespace lazy::elab {

// (serial of the producing connection point, index among its outputs).
struct HalfEdge {
    uint32_t mSerial = 0;
    uint32_t mIndex = 0;

    bool operator<(const HalfEdge& o) const {
        return std::tie(mSerial, mIndex) < std::tie(o.mSerial, o.mIndex);
    }
    bool operator==(const HalfEdge& o) const {
        return mSerial == o.mSerial && mIndex == o.mIndex;
    }
    bool operator!=(const HalfEdge& o) const { return !(*this == o); }

    std::string toString() const {
        return "(" + std::to_string(mSerial) + "," + std::to_string(mIndex) +
               ")";
    }
};

// mFlipped: true receives (sink-like), false supplies (source-like).
struct Dangle {
    HalfEdge mSource;
    HalfEdge mSink;
    bool mFlipped = false;
    std::string mName;
    Signal mData;
};

} // namespace lazy::elab
