#include <iostream>

#include "designs.hpp"
#include "lazy/elab/elaborate.hpp"
#include "lazy/errors.hpp"
#include "lazy/vis/graphml.hpp"
#include "lazy/vis/json.hpp"

using namespace lazy;
using namespace lazy::elab;

int main() {
    // Pipeline: everything pairs up internally, the root has no ports.
    {
        ElabContext ctx(&std::cerr);
        auto& top = ctx.make<demo::Pipeline>("Top", 8, 2);
        ElabResult res = elaborate(ctx, top, ElabOptions{UnresolvedPolicy::Error});

        std::cout << "=== Hierarchy: pipeline ===\n";
        dumpHierarchy(ctx, top, std::cout);
        std::cout << "\n=== Netlist: pipeline ===\n";
        ctx.netlist().dump(std::cout);
        std::cout << "\nunresolved at root: " << res.mUnresolved.size() << "\n";

        vis::writeJsonFile("view_pipeline.json", vis::buildViewJson(ctx, top));
        vis::writeTextFile("pipeline.graphml", vis::buildGraphML(ctx, top));
    }

    // FanOut: the debug taps are left for the root boundary.
    {
        ElabContext ctx(&std::cerr);
        auto& top = ctx.make<demo::FanOut>("Top", 4);
        ElabResult res =
          elaborate(ctx, top, ElabOptions{UnresolvedPolicy::Warn, true});

        std::cout << "\n=== Hierarchy: fanout ===\n";
        dumpHierarchy(ctx, top, std::cout);
        std::cout << "\n=== Root boundary ===\n";
        dumpBoundary(top, std::cout);
        std::cout << "unresolved at root: " << res.mUnresolved.size() << "\n";

        // With Error the same design is rejected.
        ElabContext strict(&std::cerr);
        auto& again = strict.make<demo::FanOut>("Top", 4);
        try {
            elaborate(strict, again, ElabOptions{UnresolvedPolicy::Error});
        } catch (const UnresolvedBoundaryError& e) {
            std::cout << "\nstrict policy rejected fanout: " << e.what()
                      << "\n";
        }

        vis::writeJsonFile("view_fanout.json", vis::buildViewJson(ctx, top));
        vis::writeTextFile("fanout.graphml", vis::buildGraphML(ctx, top));
    }

    std::cout << "Wrote view_pipeline.json, pipeline.graphml, "
                 "view_fanout.json and fanout.graphml.\n";
    std::cout << "\nDone.\n";
    return 0;
}
