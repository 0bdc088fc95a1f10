#include "printlink/net/LocalAddress.hpp"
#include "printlink/log/Log.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace printlink::net {

std::optional<asio::ip::address_v4> InterfaceAddressProvider::localIPv4() {
    ifaddrs* interfaces = nullptr;
    if (::getifaddrs(&interfaces) != 0) {
        logError("[LocalAddress] getifaddrs failed: ", std::strerror(errno), "\n");
        return std::nullopt;
    }

    std::optional<asio::ip::address_v4> found;
    for (ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }
        if (!interfaceName_.empty() && interfaceName_ != ifa->ifa_name) {
            continue;
        }

        const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        found = asio::ip::address_v4(ntohl(sin->sin_addr.s_addr));
        logDebug("[LocalAddress] using ", ifa->ifa_name, " ", found->to_string(), "\n");
        break;
    }
    ::freeifaddrs(interfaces);

    if (!found) {
        logWarning("[LocalAddress] no usable IPv4 interface",
                   interfaceName_.empty() ? "" : " named ", interfaceName_, "\n");
    }
    return found;
}

} // namespace printlink::net
