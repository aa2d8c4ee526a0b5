#include "lazy/util/id_string.hpp"

namespace lazy {
IdString::Pool& IdString::pool() {
    static Pool p;
    return p;
}

uint32_t IdString::intern(std::string_view sv) {
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (auto it = p.mIndex.find(sv); it != p.mIndex.end()) return it->second;

    uint32_t id = static_cast<uint32_t>(p.mStrings.size());
    const std::string& owned = p.mStrings.emplace_back(sv);
    p.mIndex.emplace(std::string_view{owned}, id);
    return id;
}

uint32_t IdString::lookup(std::string_view sv) {
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (auto it = p.mIndex.find(sv); it != p.mIndex.end()) return it->second;
    return kInvalid;
}

const std::string& IdString::resolve(uint32_t id) {
    static const std::string kInvalidStr = "<invalid>";
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (id == kInvalid || id >= p.mStrings.size()) return kInvalidStr;
    return p.mStrings[id];
}
} // namespace lazy
