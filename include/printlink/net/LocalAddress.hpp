#pragma once
#include "printlink/net/NetConfig.hpp"

#include <optional>
#include <string>
#include <utility>

namespace printlink::net {

/**
 * @brief Source of this machine's own IPv4 address, used to pick the subnet to scan.
 */
class LocalAddressProvider {
public:
    virtual ~LocalAddressProvider() = default;
    virtual std::optional<asio::ip::address_v4> localIPv4() = 0;
};

/**
 * @brief Reads the address of the first up, non-loopback IPv4 interface via getifaddrs().
 *
 * An optional interface name ("wlan0", "en0") restricts the search to that adapter.
 */
class InterfaceAddressProvider : public LocalAddressProvider {
public:
    InterfaceAddressProvider() = default;
    explicit InterfaceAddressProvider(std::string interfaceName)
    : interfaceName_(std::move(interfaceName)) {}

    std::optional<asio::ip::address_v4> localIPv4() override;

private:
    std::string interfaceName_;
};

/**
 * @brief Always answers with the address it was given (or nothing).
 */
class FixedAddressProvider : public LocalAddressProvider {
public:
    explicit FixedAddressProvider(std::optional<asio::ip::address_v4> address)
    : address_(address) {}

    std::optional<asio::ip::address_v4> localIPv4() override { return address_; }

private:
    std::optional<asio::ip::address_v4> address_;
};

} // namespace printlink::net
