#pragma once

#include "printlink/core/Expected.hpp"
#include "printlink/net/NetConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace printlink::core {

namespace ip = printlink::net::asio::ip;

/// Number of host addresses probed in a /24 (octets 1..254).
constexpr int kHostsPerSubnet = 254;

/**
 * @brief IPv4 address and TCP port of a printer candidate or connection target.
 */
class Endpoint {
public:
    Endpoint(ip::address_v4 address, std::uint16_t port)
    : address_(address), port_(port) {}

    /// Parse a dotted quad. Fails with Errc::InvalidAddress.
    static expected<Endpoint> parse(std::string_view address, std::uint16_t port);

    const ip::address_v4& address() const { return address_; }
    std::uint16_t port() const { return port_; }

    /// "a.b.c.d:port"
    std::string toString() const;

    net::tcp::endpoint toTcp() const { return {address_, port_}; }

    bool operator==(const Endpoint& other) const {
        return address_ == other.address_ && port_ == other.port_;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }

private:
    ip::address_v4 address_;
    std::uint16_t port_;
};

/**
 * @brief One printer found by a subnet scan. `name` is "address:port".
 */
struct DiscoveredPrinter {
    std::string name;
    Endpoint endpoint;

    explicit DiscoveredPrinter(const Endpoint& ep)
    : name(ep.toString()), endpoint(ep) {}
};

/**
 * @brief Everything in @p address before its last '.', e.g. "192.168.1" for "192.168.1.20".
 *
 * Returns std::nullopt when the string has no '.'.
 */
std::optional<std::string> subnetPrefixOf(std::string_view address);

/**
 * @brief Parse a three-octet prefix ("192.168.1") into the network base address.
 */
std::optional<ip::address_v4> parseSubnetPrefix(std::string_view prefix);

/// The 254 host addresses of the /24 whose base is @p network, in octet order.
std::vector<ip::address_v4> hostsInSubnet(const ip::address_v4& network);

/// True when @p address shares its first three octets with @p network.
bool inSubnet(const ip::address_v4& address, const ip::address_v4& network);

} // namespace printlink::core
