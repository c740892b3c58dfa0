#include "openflow.hpp"

#include <array>

namespace oftee {

namespace {

constexpr std::size_t kMatchHeaderSize = 4; // type(2) length(2)
constexpr std::size_t kPacketInPadAfterMatch = 2;

constexpr std::array<const char*, 11> kTypeNames = {
    "HELLO", "ERROR", "ECHO_REQUEST", "ECHO_REPLY", "EXPERIMENTER",
    "FEATURES_REQUEST", "FEATURES_REPLY", "GET_CONFIG_REQUEST",
    "GET_CONFIG_REPLY", "SET_CONFIG", "PACKET_IN"
};

} // namespace

std::uint16_t read_u16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

std::uint32_t read_u32(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

std::uint64_t read_u64(const std::uint8_t* data) {
    return (static_cast<std::uint64_t>(read_u32(data)) << 32) | read_u32(data + 4);
}

OfHeader OfHeader::decode(const std::uint8_t* data) {
    OfHeader h;
    h.version = data[0];
    h.type = data[1];
    h.length = read_u16(data + 2);
    h.xid = read_u32(data + 4);
    return h;
}

void OfHeader::encode(std::uint8_t* out) const {
    out[0] = version;
    out[1] = type;
    out[2] = static_cast<std::uint8_t>(length >> 8);
    out[3] = static_cast<std::uint8_t>(length);
    out[4] = static_cast<std::uint8_t>(xid >> 24);
    out[5] = static_cast<std::uint8_t>(xid >> 16);
    out[6] = static_cast<std::uint8_t>(xid >> 8);
    out[7] = static_cast<std::uint8_t>(xid);
}

const char* type_name(std::uint8_t type) {
    if (type < kTypeNames.size()) return kTypeNames[type];
    return "OTHER";
}

std::size_t packet_in_fixed_size(std::uint8_t version) {
    switch (version) {
        case kOfVersion10: return 10;
        case kOfVersion11: return 16;
        case kOfVersion12: return 12;
        default: return 16;
    }
}

std::optional<std::size_t> packet_in_frame_offset(const std::uint8_t* message, std::size_t length) {
    if (length < kOfHeaderSize) return std::nullopt;
    const auto version = message[0];
    std::size_t offset = kOfHeaderSize + packet_in_fixed_size(version);
    if (version == kOfVersion10 || version == kOfVersion11) {
        return offset <= length ? std::optional<std::size_t>(offset) : std::nullopt;
    }

    if (offset + kMatchHeaderSize > length) return std::nullopt;
    const std::size_t match_length = read_u16(message + offset + 2);
    if (match_length < kMatchHeaderSize) return std::nullopt;
    offset += (match_length + 7) / 8 * 8;
    offset += kPacketInPadAfterMatch;
    if (offset > length) return std::nullopt;
    return offset;
}

std::optional<std::uint16_t> extract_dl_type(const Bytes& message) {
    auto offset = packet_in_frame_offset(message.data(), message.size());
    if (!offset) return std::nullopt;
    if (message.size() - *offset < kEthernetHeaderSize) return std::nullopt;
    return read_u16(message.data() + *offset + kEtherTypeOffset);
}

} // namespace oftee
