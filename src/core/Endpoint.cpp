#include "printlink/core/Endpoint.hpp"

#include <array>
#include <charconv>

namespace printlink::core {

expected<Endpoint> Endpoint::parse(std::string_view address, std::uint16_t port) {
    std::error_code ec;
    auto parsed = ip::make_address_v4(std::string(address), ec);
    if (ec) {
        return unexpected(Errc::InvalidAddress);
    }
    return Endpoint(parsed, port);
}

std::string Endpoint::toString() const {
    return address_.to_string() + ":" + std::to_string(port_);
}

std::optional<std::string> subnetPrefixOf(std::string_view address) {
    const auto dot = address.rfind('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(address.substr(0, dot));
}

std::optional<ip::address_v4> parseSubnetPrefix(std::string_view prefix) {
    std::array<unsigned char, 4> bytes{};
    std::size_t octet = 0;
    const char* cursor = prefix.data();
    const char* end = prefix.data() + prefix.size();

    while (octet < 3) {
        unsigned value = 0;
        auto [next, ec] = std::from_chars(cursor, end, value);
        if (ec != std::errc{} || next == cursor || value > 255) {
            return std::nullopt;
        }
        bytes[octet++] = static_cast<unsigned char>(value);
        cursor = next;
        if (octet < 3) {
            if (cursor == end || *cursor != '.') {
                return std::nullopt;
            }
            ++cursor;
        }
    }
    if (cursor != end) {
        return std::nullopt;
    }
    return ip::address_v4(bytes);
}

std::vector<ip::address_v4> hostsInSubnet(const ip::address_v4& network) {
    std::vector<ip::address_v4> hosts;
    hosts.reserve(kHostsPerSubnet);
    auto bytes = network.to_bytes();
    for (int octet = 1; octet <= kHostsPerSubnet; ++octet) {
        bytes[3] = static_cast<unsigned char>(octet);
        hosts.emplace_back(bytes);
    }
    return hosts;
}

bool inSubnet(const ip::address_v4& address, const ip::address_v4& network) {
    return (address.to_uint() & 0xFFFFFF00u) == (network.to_uint() & 0xFFFFFF00u);
}

} // namespace printlink::core
