#include "printlink/log/Log.hpp"
#include "printlink/printer/PrinterDiscovery.hpp"
#include "printlink/printer/TcpPrinterConnector.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace printlink;

namespace {

void applyLogLevelFromEnv() {
    const char* raw = std::getenv("PRINTLINK_LOG_LEVEL");
    if (!raw) {
        return;
    }
    const std::string level(raw);
    if (level == "debug") {
        setLogLevel(LogLevel::Debug);
    } else if (level == "info") {
        setLogLevel(LogLevel::Info);
    } else if (level == "warning") {
        setLogLevel(LogLevel::Warning);
    } else if (level == "error") {
        setLogLevel(LogLevel::Error);
    } else {
        logWarning("unknown PRINTLINK_LOG_LEVEL '", level, "', keeping ", log::toString(log::logLevel()), "\n");
    }
}

bool parsePort(const char* text, std::uint16_t& port) {
    char* end = nullptr;
    const long value = std::strtol(text, &end, 10);
    if (!end || *end != '\0' || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<std::uint16_t>(value);
    return true;
}

void usage() {
    std::cerr << "usage:\n"
                 "  printlink-cli scan [address] [port]\n"
                 "  printlink-cli send <ip> <file> [port]\n";
}

int runScan(int argc, char** argv) {
    printer::DiscoveryOptions options;
    if (argc > 2) {
        options.address = std::string(argv[2]);
    }
    if (argc > 3 && !parsePort(argv[3], options.port)) {
        std::cerr << "invalid port '" << argv[3] << "'\n";
        return 2;
    }

    printer::PrinterDiscovery discovery;
    auto stream = discovery.discover(options);

    int found = 0;
    while (auto printer = stream.next()) {
        std::cout << printer->name << "\n";
        ++found;
    }
    std::cout << found << " printer(s) found\n";
    return 0;
}

int runSend(int argc, char** argv) {
    if (argc < 4) {
        usage();
        return 2;
    }
    const std::string address = argv[2];
    const std::string path = argv[3];
    std::uint16_t port = printer::config::PRINTER_PORT_DEFAULT;
    if (argc > 4 && !parsePort(argv[4], port)) {
        std::cerr << "invalid port '" << argv[4] << "'\n";
        return 2;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "cannot open '" << path << "'\n";
        return 1;
    }
    const printer::TcpPrinterConnector::Bytes payload{
        std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

    printer::TcpPrinterConnector connector;
    connector.statusStream().subscribe([](core::ConnectionStatus status) {
        logInfo("status: ", core::toString(status), "\n");
    });

    if (auto connected = connector.connect(address, port); !connected) {
        std::cerr << "connect failed: " << connected.error().message() << "\n";
        return 1;
    }

    auto sent = connector.send(payload);
    if (!sent) {
        std::cerr << "send failed: " << sent.error().message() << "\n";
    } else {
        std::cout << "sent " << payload.size() << " bytes to " << address << ":" << port << "\n";
    }

    // Give the printer a moment to drain its buffer before the socket goes away.
    if (auto closed = connector.disconnect(std::chrono::milliseconds(250)); !closed) {
        std::cerr << "disconnect failed: " << closed.error().message() << "\n";
    }
    return sent ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    applyLogLevelFromEnv();

    if (argc < 2) {
        usage();
        return 2;
    }

    const std::string command = argv[1];
    if (command == "scan") {
        return runScan(argc, argv);
    }
    if (command == "send") {
        return runSend(argc, argv);
    }

    usage();
    return 2;
}
