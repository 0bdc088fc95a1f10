#include "TestSupport.hpp"

#include "printlink/core/Endpoint.hpp"
#include "printlink/core/Error.hpp"
#include "printlink/printer/PrinterConfig.hpp"

#include <string>
#include <vector>

using namespace printlink;
using core::Errc;

static void testErrorCategory() {
    const std::error_code ec = Errc::AlreadyConnected;
    ASSERT_EQ(std::string(ec.category().name()), std::string("printlink"), "category name");
    ASSERT_EQ(ec.message(), std::string("connector already connected"), "message");
    ASSERT_TRUE(ec == Errc::AlreadyConnected, "compares against the enum");
    ASSERT_TRUE(ec != Errc::NotConnected, "distinct values differ");
    ASSERT_TRUE(!std::error_code() , "default error_code is success");
}

static void testClassifyConnectError() {
    namespace asio = net::asio;
    std::error_code ec;

    ec = asio::error::timed_out;
    ASSERT_EQ(core::classifyConnectError(ec), core::make_error_code(Errc::ConnectTimeout), "timed_out");
    ec = asio::error::operation_aborted;
    ASSERT_EQ(core::classifyConnectError(ec), core::make_error_code(Errc::ConnectTimeout), "aborted by deadline");
    ec = asio::error::connection_refused;
    ASSERT_EQ(core::classifyConnectError(ec), core::make_error_code(Errc::ConnectRefused), "refused");
    ec = asio::error::host_unreachable;
    ASSERT_EQ(core::classifyConnectError(ec), core::make_error_code(Errc::NetworkUnreachable), "host unreachable");
    ec = asio::error::network_unreachable;
    ASSERT_EQ(core::classifyConnectError(ec), core::make_error_code(Errc::NetworkUnreachable), "network unreachable");

    ec = asio::error::access_denied;
    ASSERT_EQ(core::classifyConnectError(ec), ec, "unrelated errors pass through");
    ec = Errc::WriteFailure;
    ASSERT_EQ(core::classifyConnectError(ec), ec, "printlink errors pass through");
    ASSERT_EQ(core::classifyConnectError(std::error_code()), std::error_code(), "success stays success");
}

static void testEndpoint() {
    auto ep = core::Endpoint::parse("192.168.1.20", 9100);
    ASSERT_TRUE(ep.has_value(), "dotted quad parses");
    if (ep) {
        ASSERT_EQ(ep->toString(), std::string("192.168.1.20:9100"), "toString");
        ASSERT_EQ(ep->port(), std::uint16_t{9100}, "port");
        ASSERT_EQ(ep->toTcp().port(), std::uint16_t{9100}, "tcp endpoint port");

        core::DiscoveredPrinter printer(*ep);
        ASSERT_EQ(printer.name, std::string("192.168.1.20:9100"), "discovered printer name");
        ASSERT_TRUE(printer.endpoint == *ep, "discovered printer endpoint");
    }

    auto bad = core::Endpoint::parse("printer.local", 9100);
    ASSERT_TRUE(!bad, "hostnames are rejected");
    if (!bad) {
        ASSERT_EQ(bad.error(), core::make_error_code(Errc::InvalidAddress), "InvalidAddress");
    }
    ASSERT_TRUE(!core::Endpoint::parse("10.0.0.256", 9100), "octet out of range");
}

static void testSubnetHelpers() {
    ASSERT_EQ(core::subnetPrefixOf("192.168.1.20").value_or(""), std::string("192.168.1"), "prefix");
    ASSERT_EQ(core::subnetPrefixOf("10.0.0.").value_or("?"), std::string("10.0.0"), "trailing dot");
    ASSERT_TRUE(!core::subnetPrefixOf("localhost"), "no dot, no prefix");

    auto network = core::parseSubnetPrefix("192.168.1");
    ASSERT_TRUE(network.has_value(), "three octets parse");
    ASSERT_TRUE(!core::parseSubnetPrefix("192.168"), "two octets rejected");
    ASSERT_TRUE(!core::parseSubnetPrefix("192.168.1.0"), "four octets rejected");
    ASSERT_TRUE(!core::parseSubnetPrefix("192.168.300"), "octet out of range");
    ASSERT_TRUE(!core::parseSubnetPrefix("a.b.c"), "not numeric");
    ASSERT_TRUE(!core::parseSubnetPrefix(""), "empty");

    if (network) {
        auto hosts = core::hostsInSubnet(*network);
        ASSERT_EQ(hosts.size(), static_cast<std::size_t>(core::kHostsPerSubnet), "254 hosts");
        ASSERT_EQ(hosts.front().to_string(), std::string("192.168.1.1"), "first host");
        ASSERT_EQ(hosts.back().to_string(), std::string("192.168.1.254"), "last host");
        bool allInside = true;
        for (const auto& host : hosts) {
            allInside = allInside && core::inSubnet(host, *network);
        }
        ASSERT_TRUE(allInside, "every host is inside the subnet");
        ASSERT_TRUE(!core::inSubnet(core::ip::make_address_v4("192.168.2.1"), *network), "neighbour subnet");
    }
}

static void testLogHandler() {
    std::vector<std::string> lines;
    setLogHandler([&](LogLevel level, std::string_view message) {
        lines.push_back(std::string(log::toString(level)) + ":" + std::string(message));
    });
    setLogLevel(LogLevel::Info);
    logDebug("dropped ", 1);
    logInfo("kept ", 2);
    logError("also kept");
    resetLogHandler();

    ASSERT_EQ(lines.size(), std::size_t{2}, "debug filtered by level");
    if (lines.size() == 2) {
        ASSERT_TRUE(lines[0].find("kept 2") != std::string::npos, "variadic message built");
        ASSERT_TRUE(lines[1].find("also kept") != std::string::npos, "plain message forwarded");
    }
}

static void testConnectorDefaults() {
    using namespace std::chrono_literals;
    const printer::ConnectorOptions options;
    ASSERT_TRUE(options.connectTimeout == 5000ms, "connect timeout 5 s");
    ASSERT_TRUE(options.sendTimeout == printer::config::SEND_TIMEOUT_DEFAULT, "send timeout from config");
    // One send covers a whole print job, so the limit leaves room for slow printers.
    ASSERT_TRUE(options.sendTimeout >= 30s, "send timeout sized for large jobs");
    ASSERT_TRUE(options.probe.interval == 3s && options.probe.timeout == 7s, "probe defaults");
    ASSERT_TRUE(options.probingEnabled, "probing on by default");

    const printer::DiscoveryOptions discovery;
    ASSERT_EQ(discovery.port, std::uint16_t{9100}, "raw printing port");
    ASSERT_TRUE(discovery.timeout == 4000ms, "discovery timeout 4 s");
    ASSERT_TRUE(!discovery.address.has_value(), "local address by default");
}

int main() {
    testErrorCategory();
    testClassifyConnectError();
    testEndpoint();
    testSubnetHelpers();
    testLogHandler();
    testConnectorDefaults();
    return testsupport::finish("core test");
}
