#pragma once
// Small example designs shared by the demo and the console.

#include <string>

#include "lazy/elab/context.hpp"
#include "lazy/elab/elaborate.hpp"
#include "lazy/elab/module_value.hpp"
#include "lazy/node/port_node.hpp"

namespace lazy::demo {

class Producer : public elab::Container {
  public:
    Producer(elab::ElabContext& ctx, uint32_t width);
    node::PortNode& mOut;
};

class Consumer : public elab::Container {
  public:
    Consumer(elab::ElabContext& ctx, uint32_t width);
    node::PortNode& mIn;
};

// Drives every output edge from its single input.
class Passthrough : public elab::Container {
  public:
    Passthrough(elab::ElabContext& ctx, uint32_t width);
    node::PortNode& mIn;
    node::PortNode& mOut;
    elab::ModuleValue<size_t> mDriven; // output signals driven
};

// producer -> stage0 -> ... -> consumer, fully internal.
class Pipeline : public elab::Container {
  public:
    Pipeline(elab::ElabContext& ctx, uint32_t width, int stages);
};

// One producer feeding two consumers, plus an exposed debug tap.
class FanOut : public elab::Container {
  public:
    FanOut(elab::ElabContext& ctx, uint32_t width);
};

elab::DesignLib builtinDesigns();

} // namespace lazy::demo
