#include "lazy/elab/signal.hpp"

#include "lazy/errors.hpp"

namespace lazy::elab {

bool Signal::valid() const {
    return mNetlist != nullptr && mNetlist->contains(mId);
}

uint32_t Signal::width() const {
    if (!valid()) throw SignalError("width() on an invalid signal");
    return mNetlist->info(mId).mWidth;
}

IdString Signal::name() const {
    if (!valid()) return IdString();
    return mNetlist->info(mId).mName;
}

Signal Signal::cloneType() const {
    if (!valid()) throw SignalError("cloneType() on an invalid signal");
    return Signal(*mNetlist, mNetlist->addWire(width()), false);
}

Signal Signal::flip() const {
    Signal s = *this;
    s.mFlipped = !mFlipped;
    return s;
}

std::string Signal::toString() const {
    if (!valid()) return "<invalid signal>";
    std::string s = mNetlist->renderSignal(mId);
    if (mFlipped) s += " (flipped)";
    return s;
}

void connect(const Signal& sink, const Signal& source) {
    if (!sink.valid() || !source.valid())
        throw SignalError("connect on an invalid signal");
    if (sink.netlist() != source.netlist())
        throw SignalError("connect across netlists: " + sink.toString() +
                          " <= " + source.toString());
    sink.netlist()->connect(sink.id(), source.id());
}

} // namespace lazy::elab
