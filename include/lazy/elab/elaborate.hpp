#pragma once
// Top-level elaboration driver plus hierarchy/boundary dumps.

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "lazy/elab/container.hpp"
#include "lazy/elab/context.hpp"

namespace lazy::elab {

// What to do with dangles the root could not resolve.
enum class UnresolvedPolicy { Keep, Warn, Error };

const char* to_string(UnresolvedPolicy p);
bool parsePolicy(std::string_view text, UnresolvedPolicy& out);

struct ElabOptions {
    UnresolvedPolicy mUnresolvedRoot = UnresolvedPolicy::Keep;
    bool mVerbose = false; // log every container's boundary
};

struct ElabResult {
    Container* mTop = nullptr;
    const ModuleImp* mImp = nullptr;
    std::vector<Dangle> mUnresolved;
    size_t mContainers = 0;
    size_t mLinks = 0;
};

// Named design generators: each declares one root in the given context.
using DesignFactory = std::function<Container&(ElabContext&)>;
using DesignLib = std::map<std::string, DesignFactory>;

// Force `top`, run its finish pass and apply the root policy. The
// declaration phase must be over (no open scope).
ElabResult elaborate(ElabContext& ctx, Container& top,
                     const ElabOptions& opts = {});

// Dot-separated instance path from `top`, e.g. "Top.a.b".
Container* findByPath(const ElabContext& ctx, Container& top,
                      std::string_view path);

void dumpHierarchy(const ElabContext& ctx, const Container& top,
                   std::ostream& os);
void dumpBoundary(const Container& c, std::ostream& os, int indent = 0);

} // namespace lazy::elab
