#pragma once
// Interned identifier used for container, port and signal names.
// The intern pool is process-wide and never shrinks.

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lazy {

class IdString {
  public:
    IdString()
        : mId(kInvalid) {}

    explicit IdString(std::string_view sv)
        : mId(intern(sv)) {}

    // Returns an invalid IdString if `sv` was never interned.
    static IdString tryLookup(std::string_view sv) {
        IdString s;
        s.mId = lookup(sv);
        return s;
    }

    bool valid() const { return mId != kInvalid; }
    bool empty() const { return !valid() || str().empty(); }
    uint32_t id() const { return mId; }
    const std::string& str() const { return resolve(mId); }

    bool operator==(const IdString& o) const { return mId == o.mId; }
    bool operator!=(const IdString& o) const { return mId != o.mId; }
    bool operator<(const IdString& o) const { return mId < o.mId; }

    struct Hash {
        size_t operator()(const IdString& s) const noexcept {
            return std::hash<uint32_t>{}(s.mId);
        }
    };

  private:
    static constexpr uint32_t kInvalid = 0xFFFFFFFFu;
    uint32_t mId;

    static uint32_t intern(std::string_view sv);
    static uint32_t lookup(std::string_view sv);
    static const std::string& resolve(uint32_t id);

    struct Pool {
        std::deque<std::string> mStrings;
        std::unordered_map<std::string_view, uint32_t> mIndex;
        std::mutex mMu;
    };
    static Pool& pool();
};

inline std::ostream& operator<<(std::ostream& os, const IdString& s) {
    return os << s.str();
}

} // namespace lazy
