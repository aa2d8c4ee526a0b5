#include "lazy/elab/bundle.hpp"

#include <cctype>
#include <unordered_map>

namespace lazy::elab {

std::string trimIndexSuffix(std::string_view name) {
    size_t end = name.size();
    while (true) {
        size_t us = name.find_last_of('_', end == 0 ? 0 : end - 1);
        if (end == 0 || us == std::string_view::npos || us + 1 >= end) break;
        bool digits = true;
        for (size_t i = us + 1; i < end; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
                digits = false;
                break;
            }
        }
        if (!digits) break;
        end = us;
    }
    return std::string(name.substr(0, end));
}

std::vector<std::string> uniquifyPortNames(
  const std::vector<std::string>& rawNames) {
    std::vector<std::string> keys;
    keys.reserve(rawNames.size());
    std::unordered_map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < rawNames.size(); ++i) {
        keys.push_back(trimIndexSuffix(rawNames[i]));
        groups[keys.back()].push_back(i);
    }

    std::vector<std::string> out(rawNames.size());
    for (const auto& [key, members] : groups) {
        if (members.size() == 1) {
            out[members.front()] = key;
            continue;
        }
        for (size_t j = 0; j < members.size(); ++j) {
            out[members[j]] = key + "_" + std::to_string(j);
        }
    }
    return out;
}

BoundaryBundle BoundaryBundle::build(const std::vector<BundleEntry>& elts,
                                     net::Netlist& nl, ContainerId owner) {
    std::vector<std::string> raw;
    raw.reserve(elts.size());
    for (const auto& e : elts)
        raw.push_back(e.mName);
    auto names = uniquifyPortNames(raw);

    BoundaryBundle bundle;
    bundle.mElements.reserve(elts.size());
    for (size_t i = 0; i < elts.size(); ++i) {
        const auto& e = elts[i];
        Signal port = e.mData.cloneType();
        if (e.mFlipped) port = port.flip();
        IdString name(names[i]);
        nl.bindPort(port.id(), owner, name, directionOf(e.mFlipped));
        bundle.mElements.push_back(BundlePort{name, port, e.mFlipped});
    }
    return bundle;
}

const BundlePort* BoundaryBundle::find(std::string_view name) const {
    for (const auto& p : mElements)
        if (p.mName.str() == name) return &p;
    return nullptr;
}

std::vector<std::string> BoundaryBundle::names() const {
    std::vector<std::string> out;
    out.reserve(mElements.size());
    for (const auto& p : mElements)
        out.push_back(p.mName.str());
    return out;
}

} // namespace lazy::elab
