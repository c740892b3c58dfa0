#pragma once

#include <cstdint>
#include <string>

namespace oftee {

// Bits telling which fields of a Criteria carry a value.
enum CriteriaBit : std::uint64_t {
    kBitEmpty = 0x0,
    kBitDlType = 1ULL << 0
};

// Match criteria on a packet, modelled on ovs-ofctl match fields. Only the
// fields flagged in `set` are meaningful.
struct Criteria {
    std::uint64_t set = kBitEmpty;
    std::uint16_t dl_type = 0;

    static Criteria with_dl_type(std::uint16_t value);

    bool is_wildcard() const { return set == kBitEmpty; }

    // True when every field set here is also set in `state` with the same
    // value. Fields present only in `state` do not matter.
    bool match(const Criteria& state) const;

    std::string describe() const;
};

} // namespace oftee
