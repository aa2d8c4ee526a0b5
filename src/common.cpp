#include "lazy/common.hpp"

namespace lazy {
const char* to_string(PortDirection d) {
    switch (d) {
    case PortDirection::In: return "In";
    case PortDirection::Out: return "Out";
    }
    return "?";
}

PortDirection directionOf(bool flipped) {
    return flipped ? PortDirection::In : PortDirection::Out;
}

std::string SourceInfo::toString() const {
    if (!known()) return "<unknown>";
    std::string file(mFile);
    auto slash = file.find_last_of('/');
    if (slash != std::string::npos) file = file.substr(slash + 1);
    return file + ":" + std::to_string(mLine);
}

std::ostream& operator<<(std::ostream& os, const Indent& i) {
    for (int k = 0; k < i.mN; ++k)
        os << ' ';
    return os;
}

void info(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "INFO: " << msg << "\n";
}
void warn(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "WARN: " << msg << "\n";
}
void error(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "ERROR: " << msg << "\n";
}
} // namespace lazy
