#include "printlink/core/Error.hpp"

#include "printlink/net/NetConfig.hpp"

#include <string>

namespace printlink::core {

namespace {

class PrintlinkCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "printlink"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::ConnectTimeout:     return "connect timed out";
            case Errc::ConnectRefused:     return "connection refused";
            case Errc::NetworkUnreachable: return "network unreachable";
            case Errc::AlreadyConnected:   return "connector already connected";
            case Errc::NotConnected:       return "not connected";
            case Errc::WriteFailure:       return "write to printer failed";
            case Errc::SocketClosedByPeer: return "socket closed by peer";
            case Errc::ProbeFailure:       return "liveness probe failed";
            case Errc::InvalidAddress:     return "invalid IPv4 address";
        }
        return "unknown printlink error";
    }
};

} // namespace

const std::error_category& printlink_category() noexcept {
    static const PrintlinkCategory category;
    return category;
}

std::error_code make_error_code(Errc code) noexcept {
    return {static_cast<int>(code), printlink_category()};
}

std::error_code classifyConnectError(const std::error_code& ec) {
    namespace asio = printlink::net::asio;

    if (!ec || ec.category() == printlink_category()) {
        return ec;
    }
    if (ec == asio::error::timed_out || ec == asio::error::operation_aborted) {
        return make_error_code(Errc::ConnectTimeout);
    }
    if (ec == asio::error::connection_refused || ec == asio::error::connection_reset) {
        return make_error_code(Errc::ConnectRefused);
    }
    if (ec == asio::error::network_unreachable || ec == asio::error::host_unreachable ||
        ec == asio::error::network_down) {
        return make_error_code(Errc::NetworkUnreachable);
    }
    return ec;
}

} // namespace printlink::core
