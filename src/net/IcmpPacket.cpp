#include "printlink/net/IcmpPacket.hpp"

namespace printlink::net {
namespace {
std::uint16_t read_be_u16(const std::uint8_t* data) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(data[0]) << 8)
                                     | static_cast<std::uint16_t>(data[1]));
}

void append_be_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}
} // namespace

std::uint16_t internetChecksum(const std::uint8_t* data, std::size_t size) {
    std::uint32_t sum = 0;
    std::size_t i = 0;
    for (; i + 1 < size; i += 2) {
        sum += read_be_u16(data + i);
    }
    if (i < size) {
        sum += static_cast<std::uint32_t>(data[i]) << 8;   // pad the odd byte
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFFu) + (sum >> 16);
    }
    return static_cast<std::uint16_t>(~sum & 0xFFFFu);
}

std::vector<std::uint8_t> IcmpEcho::encode() const {
    std::vector<std::uint8_t> out;
    out.reserve(kHeaderSize + payload.size());
    out.push_back(static_cast<std::uint8_t>(type));
    out.push_back(code);
    append_be_u16(out, 0);                 // checksum placeholder
    append_be_u16(out, identifier);
    append_be_u16(out, sequence);
    out.insert(out.end(), payload.begin(), payload.end());

    const auto sum = internetChecksum(out.data(), out.size());
    out[2] = static_cast<std::uint8_t>((sum >> 8) & 0xFFu);
    out[3] = static_cast<std::uint8_t>(sum & 0xFFu);
    return out;
}

bool IcmpEcho::decode(const std::uint8_t* data, std::size_t size) {
    if (!data || size < kHeaderSize) {
        return false;
    }
    type = static_cast<IcmpType>(data[0]);
    code = data[1];
    checksum = read_be_u16(data + 2);
    identifier = read_be_u16(data + 4);
    sequence = read_be_u16(data + 6);
    payload.assign(data + kHeaderSize, data + size);
    return true;
}

std::size_t ipv4HeaderLength(const std::uint8_t* data, std::size_t size) {
    if (!data || size < 20) {
        return 0;
    }
    if ((data[0] >> 4) != 4) {
        return 0;
    }
    const std::size_t length = static_cast<std::size_t>(data[0] & 0x0Fu) * 4;
    if (length < 20 || length > size) {
        return 0;
    }
    return length;
}

} // namespace printlink::net
