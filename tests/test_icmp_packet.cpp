#include "TestSupport.hpp"

#include "printlink/net/IcmpPacket.hpp"

#include <array>
#include <cstdint>
#include <vector>

using namespace printlink::net;

static void testEncodeEchoRequest() {
    IcmpEcho echo;
    echo.identifier = 0x1234;
    echo.sequence = 7;
    echo.payload = {'p', 'l', 'n', 'k'};

    const auto wire = echo.encode();
    ASSERT_EQ(wire.size(), IcmpEcho::kHeaderSize + 4, "header + payload");
    ASSERT_EQ(wire[0], std::uint8_t{8}, "echo request type");
    ASSERT_EQ(wire[1], std::uint8_t{0}, "code");
    ASSERT_EQ(wire[4], std::uint8_t{0x12}, "identifier high byte first");
    ASSERT_EQ(wire[5], std::uint8_t{0x34}, "identifier low byte");
    ASSERT_EQ(wire[7], std::uint8_t{7}, "sequence");

    // A message carrying its own checksum sums to zero.
    ASSERT_EQ(internetChecksum(wire.data(), wire.size()), std::uint16_t{0}, "checksum verifies");
}

static void testChecksumKnownValue() {
    // RFC 1071 example words.
    const std::array<std::uint8_t, 8> data{0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
    ASSERT_EQ(internetChecksum(data.data(), data.size()), std::uint16_t{0x220d}, "rfc1071 sample");

    const std::array<std::uint8_t, 3> odd{0x01, 0x02, 0x03};
    // 0x0102 + 0x0300 = 0x0402 -> ~ = 0xfbfd
    ASSERT_EQ(internetChecksum(odd.data(), odd.size()), std::uint16_t{0xfbfd}, "odd length pads with zero");
}

static void testDecodeReply() {
    const std::vector<std::uint8_t> raw{0x00, 0x00, 0xab, 0xcd, 0x00, 0x2a, 0x01, 0x00, 0xde, 0xad};
    IcmpEcho echo;
    ASSERT_TRUE(echo.decode(raw.data(), raw.size()), "decode reply");
    ASSERT_TRUE(echo.type == IcmpType::EchoReply, "type");
    ASSERT_EQ(echo.checksum, std::uint16_t{0xabcd}, "checksum field");
    ASSERT_EQ(echo.identifier, std::uint16_t{42}, "identifier");
    ASSERT_EQ(echo.sequence, std::uint16_t{256}, "sequence");
    ASSERT_EQ(echo.payload.size(), std::size_t{2}, "payload");

    IcmpEcho tooShort;
    ASSERT_TRUE(!tooShort.decode(raw.data(), 7), "short buffer rejected");
}

static void testIpv4HeaderLength() {
    std::vector<std::uint8_t> packet(28, 0);
    packet[0] = 0x45;   // IPv4, IHL 5
    ASSERT_EQ(ipv4HeaderLength(packet.data(), packet.size()), std::size_t{20}, "minimal header");

    packet[0] = 0x46;   // IHL 6, options present
    ASSERT_EQ(ipv4HeaderLength(packet.data(), packet.size()), std::size_t{24}, "header with options");

    packet[0] = 0x00;   // bare ICMP from a datagram socket
    ASSERT_EQ(ipv4HeaderLength(packet.data(), packet.size()), std::size_t{0}, "no IP header");

    packet[0] = 0x4f;   // claims 60 bytes, only 28 present
    ASSERT_EQ(ipv4HeaderLength(packet.data(), packet.size()), std::size_t{0}, "truncated header");
}

int main() {
    testEncodeEchoRequest();
    testChecksumKnownValue();
    testDecodeReply();
    testIpv4HeaderLength();
    return testsupport::finish("ICMP packet test");
}
