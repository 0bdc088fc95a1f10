#pragma once
#include "printlink/core/Endpoint.hpp"
#include "printlink/net/LocalAddress.hpp"
#include "printlink/net/NetService.hpp"
#include "printlink/net/SubnetScanner.hpp"
#include "printlink/printer/PrinterConfig.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace printlink::printer {

/**
 * @brief Printers found so far by a running discovery, in the order they answered.
 */
class DiscoveryStream {
public:
    DiscoveryStream() = default;
    explicit DiscoveryStream(net::ScanStream scan) : scan_(std::move(scan)) {}

    /// Blocks until the next printer answers; std::nullopt once the scan is exhausted.
    std::optional<core::DiscoveredPrinter> next();
    std::vector<core::DiscoveredPrinter> collect();
    void cancel() { scan_.cancel(); }

private:
    net::ScanStream scan_;
};

/**
 * @brief Finds raw-TCP printers on the local /24.
 *
 * The subnet comes from DiscoveryOptions::address when set, otherwise from the
 * local-address service. With neither, discovery ends immediately with no
 * results. Results are never cached; every call scans again.
 */
class PrinterDiscovery {
public:
    explicit PrinterDiscovery(
        std::shared_ptr<net::asio::io_context> io = net::shared_io_context(),
        std::shared_ptr<net::LocalAddressProvider> localAddress =
            std::make_shared<net::InterfaceAddressProvider>());

    /// Incremental discovery, e.g. to fill a device list as printers answer.
    DiscoveryStream discover(const DiscoveryOptions& options = {});

    /// Runs a whole scan and returns every printer that answered.
    std::vector<core::DiscoveredPrinter> discoverPrinters(const DiscoveryOptions& options = {});

private:
    std::optional<std::string> deviceAddress(const DiscoveryOptions& options);

    net::SubnetScanner scanner_;
    std::shared_ptr<net::LocalAddressProvider> localAddress_;
};

} // namespace printlink::printer
