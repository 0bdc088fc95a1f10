#include "printlink/printer/PrinterDiscovery.hpp"
#include "printlink/log/Log.hpp"

namespace printlink::printer {

std::optional<core::DiscoveredPrinter> DiscoveryStream::next() {
    auto endpoint = scan_.next();
    if (!endpoint) {
        return std::nullopt;
    }
    return core::DiscoveredPrinter(*endpoint);
}

std::vector<core::DiscoveredPrinter> DiscoveryStream::collect() {
    std::vector<core::DiscoveredPrinter> printers;
    while (auto printer = next()) {
        printers.push_back(*printer);
    }
    return printers;
}

PrinterDiscovery::PrinterDiscovery(std::shared_ptr<net::asio::io_context> io,
                                   std::shared_ptr<net::LocalAddressProvider> localAddress)
: scanner_(std::move(io))
, localAddress_(std::move(localAddress))
{}

std::optional<std::string> PrinterDiscovery::deviceAddress(const DiscoveryOptions& options) {
    if (options.address && !options.address->empty()) {
        return options.address;
    }
    if (!localAddress_) {
        return std::nullopt;
    }
    if (auto local = localAddress_->localIPv4()) {
        return local->to_string();
    }
    return std::nullopt;
}

DiscoveryStream PrinterDiscovery::discover(const DiscoveryOptions& options) {
    const auto address = deviceAddress(options);
    if (!address) {
        logWarning("[PrinterDiscovery] local address unknown, nothing to scan\n");
        return DiscoveryStream();
    }

    const auto prefix = core::subnetPrefixOf(*address);
    if (!prefix) {
        logError("[PrinterDiscovery] cannot derive a subnet from '", *address, "'\n");
        return DiscoveryStream();
    }

    return DiscoveryStream(scanner_.scan(*prefix, options.port, options.timeout, options.maxInFlight));
}

std::vector<core::DiscoveredPrinter> PrinterDiscovery::discoverPrinters(const DiscoveryOptions& options) {
    auto printers = discover(options).collect();
    logInfo("[PrinterDiscovery] found ", printers.size(), " printer(s)\n");
    return printers;
}

} // namespace printlink::printer
