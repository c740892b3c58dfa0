#include "criteria.hpp"

#include <cstdio>

namespace oftee {

Criteria Criteria::with_dl_type(std::uint16_t value) {
    Criteria c;
    c.set = kBitDlType;
    c.dl_type = value;
    return c;
}

bool Criteria::match(const Criteria& state) const {
    if ((set & kBitDlType) && (!(state.set & kBitDlType) || dl_type != state.dl_type)) {
        return false;
    }
    return true;
}

std::string Criteria::describe() const {
    if (is_wildcard()) return "*";
    std::string out;
    if (set & kBitDlType) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "0x%04x", dl_type);
        out += "dl_type=";
        out += buf;
    }
    return out;
}

} // namespace oftee
