#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace oftee {

using Bytes = std::vector<std::uint8_t>;
using SharedBytes = std::shared_ptr<const Bytes>;

constexpr std::size_t kOfHeaderSize = 8;
constexpr std::size_t kEthernetHeaderSize = 14;
constexpr std::size_t kEtherTypeOffset = 12;
constexpr std::size_t kDatapathIdSize = 8;

constexpr std::uint8_t kOfVersion10 = 0x01;
constexpr std::uint8_t kOfVersion11 = 0x02;
constexpr std::uint8_t kOfVersion12 = 0x03;
constexpr std::uint8_t kOfVersion13 = 0x04;

// Message types whose numbering is shared by every OpenFlow version.
enum class OfType : std::uint8_t {
    Hello = 0,
    Error = 1,
    EchoRequest = 2,
    EchoReply = 3,
    Experimenter = 4,
    FeaturesRequest = 5,
    FeaturesReply = 6,
    GetConfigRequest = 7,
    GetConfigReply = 8,
    SetConfig = 9,
    PacketIn = 10
};

struct OfHeader {
    std::uint8_t version = 0;
    std::uint8_t type = 0;
    std::uint16_t length = 0;
    std::uint32_t xid = 0;

    static OfHeader decode(const std::uint8_t* data);
    void encode(std::uint8_t* out) const;

    bool is(OfType t) const { return type == static_cast<std::uint8_t>(t); }
};

const char* type_name(std::uint8_t type);

// Size of the fixed part of a Packet-In body (after the common header).
// 1.0: buffer_id, total_len, in_port, reason, pad
// 1.1: buffer_id, in_port, in_phy_port, total_len, reason, table_id
// 1.2: buffer_id, total_len, reason, table_id (match follows)
// 1.3+: buffer_id, total_len, reason, table_id, cookie (match follows)
std::size_t packet_in_fixed_size(std::uint8_t version);

// Offset of the Ethernet frame inside a complete Packet-In message. From 1.2
// on the frame follows a variable length match padded to 8 bytes and two pad
// bytes. Empty when the match does not fit in the message.
std::optional<std::size_t> packet_in_frame_offset(const std::uint8_t* message, std::size_t length);

// EtherType of the frame carried by a complete Packet-In message, or empty
// when the frame is missing or too short.
std::optional<std::uint16_t> extract_dl_type(const Bytes& message);

std::uint16_t read_u16(const std::uint8_t* data);
std::uint32_t read_u32(const std::uint8_t* data);
std::uint64_t read_u64(const std::uint8_t* data);

} // namespace oftee
