#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include "lazy/util/id_string.hpp"

namespace lazy {

// Index of a Container inside its ElabContext arena.
using ContainerId = uint32_t;
inline constexpr ContainerId kNoContainer = 0xFFFFFFFFu;

enum class PortDirection { In, Out };

const char* to_string(PortDirection d);

// A flipped dangle receives, so its boundary port is an input.
PortDirection directionOf(bool flipped);

// Declaration site; file is null when unknown.
struct SourceInfo {
    const char* mFile = nullptr;
    int mLine = 0;

    bool known() const { return mFile != nullptr; }
    std::string toString() const;
};

#define LAZY_HERE ::lazy::SourceInfo{__FILE__, __LINE__}

struct Indent {
    int mN = 0;
    explicit Indent(int n)
        : mN(n) {}
};
std::ostream& operator<<(std::ostream& os, const Indent& i);

void info(std::ostream* diag, const std::string& msg, int indent = 0);
void warn(std::ostream* diag, const std::string& msg, int indent = 0);
void error(std::ostream* diag, const std::string& msg, int indent = 0);
} // namespace lazy
