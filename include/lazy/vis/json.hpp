#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "lazy/elab/container.hpp"
#include "lazy/elab/context.hpp"

namespace lazy {
namespace vis {

// Build a read-only view of an elaborated tree rooted at `top`:
// - containers: id, name, module, path, parent/children, nodes and boundary
//   ports
// - edges: one per internal link, from the supplying signal to the
//   receiving one, tagged with the container that resolved it
nlohmann::json buildViewJson(const elab::ElabContext& ctx,
                             const elab::Container& top);

inline void writeJsonFile(const std::string& path, const nlohmann::json& j) {
    std::ofstream ofs(path);
    if (!ofs)
        throw std::runtime_error("Cannot open file for writing: " + path);
    ofs << j.dump(2) << std::endl;
}

inline void writeTextFile(const std::string& path, const std::string& text) {
    std::ofstream ofs(path);
    if (!ofs)
        throw std::runtime_error("Cannot open file for writing: " + path);
    ofs << text;
}

} // namespace vis
} // namespace lazy
