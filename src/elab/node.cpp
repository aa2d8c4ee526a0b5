#include "lazy/elab/node.hpp"

#include "lazy/elab/context.hpp"

namespace lazy::elab {

ConnectionPoint::ConnectionPoint(ElabContext& ctx)
    : mCtx(ctx)
    , mSerial(ctx.nextSerial()) {}

} // namespace lazy::elab
