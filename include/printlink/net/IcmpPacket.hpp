#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace printlink::net {

enum class IcmpType : std::uint8_t {
    EchoReply = 0,
    EchoRequest = 8
};

/**
 * @brief ICMP echo request / reply (RFC 792). Multi-byte fields are big-endian on the wire.
 */
struct IcmpEcho {
    static constexpr std::size_t kHeaderSize = 8;

    IcmpType type = IcmpType::EchoRequest;
    std::uint8_t code = 0;
    std::uint16_t checksum = 0;
    std::uint16_t identifier = 0;
    std::uint16_t sequence = 0;
    std::vector<std::uint8_t> payload;

    /// Serialize with a freshly computed checksum.
    std::vector<std::uint8_t> encode() const;

    /// Parse an ICMP message (no IP header). Returns false when @p size is too short.
    bool decode(const std::uint8_t* data, std::size_t size);
};

/// Internet checksum: one's complement of the one's complement sum of 16-bit words.
std::uint16_t internetChecksum(const std::uint8_t* data, std::size_t size);

/**
 * @brief Length of the IPv4 header at the start of @p data, or 0 when there is none.
 *
 * Raw ICMP sockets deliver the IP header in front of the ICMP message; datagram
 * ICMP sockets do not.
 */
std::size_t ipv4HeaderLength(const std::uint8_t* data, std::size_t size);

} // namespace printlink::net
