#include "core/types/ScanConfig.hpp"

#include "core/types/Errors.hpp"
#include "core/types/Subnet.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>
#include <sstream>

namespace lanwatch::core {

namespace {

constexpr int MIN_PORT = 1;
constexpr int MAX_PORT = 65535;

void requireRange(const char* field, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        std::ostringstream oss;
        oss << field << " must be between " << lo << " and " << hi << " (got " << value << ")";
        throw ConfigurationError(oss.str());
    }
}

void requirePorts(const char* field, const std::vector<int>& ports) {
    for (int port : ports) {
        if (port < MIN_PORT || port > MAX_PORT) {
            throw ConfigurationError(std::string(field) + " contains invalid port " +
                                     std::to_string(port));
        }
    }
}

int parsePort(const std::string& text, const std::string& expression) {
    bool digitsOnly = std::all_of(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
    if (text.empty() || text.size() > 5 || !digitsOnly) {
        throw ConfigurationError("Invalid port range '" + expression + "'");
    }
    int port = std::stoi(text);
    if (port < MIN_PORT || port > MAX_PORT) {
        throw ConfigurationError("Port out of range in '" + expression + "': " + text);
    }
    return port;
}

std::string trim(const std::string& str) {
    auto begin = str.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = str.find_last_not_of(" \t");
    return str.substr(begin, end - begin + 1);
}

} // namespace

void ScanConfig::validate() const {
    if (subnetCidr && !subnetCidr->empty() && !Subnet::tryParse(*subnetCidr)) {
        throw ConfigurationError("Invalid subnet: '" + *subnetCidr + "'");
    }

    for (const auto& ip : excludeIps) {
        if (!Subnet::isValidAddress(ip)) {
            throw ConfigurationError("Invalid excluded address: '" + ip + "'");
        }
    }

    requireRange("scan_rate", scanRate, 1, 1000);
    requireRange("max_workers", maxWorkers, 1, 200);
    requireRange("max_retries", maxRetries, 0, 5);

    if (!parseTimeout(scanTimeout)) {
        throw ConfigurationError("Invalid scan timeout: '" + scanTimeout + "'");
    }

    if (pingMethods.empty()) {
        throw ConfigurationError("At least one ping method is required");
    }

    requirePorts("tcp_ping_ports", tcpPingPorts);
    requirePorts("ack_ping_ports", ackPingPorts);

    expandPortRange(portRange);
}

std::chrono::milliseconds ScanConfig::timeout() const {
    auto parsed = parseTimeout(scanTimeout);
    if (!parsed) {
        throw ConfigurationError("Invalid scan timeout: '" + scanTimeout + "'");
    }
    return *parsed;
}

std::optional<std::chrono::milliseconds> ScanConfig::parseTimeout(const std::string& text) {
    static const std::regex pattern(R"(^(\d+(?:\.\d+)?)(ms|s|m|h)?$)");

    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        return std::nullopt;
    }

    double value = std::stod(match[1].str());
    std::string unit = match[2].matched ? match[2].str() : "s";

    double millis = value;
    if (unit == "s") {
        millis = value * 1000.0;
    } else if (unit == "m") {
        millis = value * 60'000.0;
    } else if (unit == "h") {
        millis = value * 3'600'000.0;
    }

    if (millis <= 0.0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(millis)));
}

std::vector<uint16_t> ScanConfig::expandPortRange(const std::string& text) {
    std::set<uint16_t> ports;

    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            throw ConfigurationError("Invalid port range '" + text + "'");
        }

        auto dash = item.find('-');
        if (dash == std::string::npos) {
            ports.insert(static_cast<uint16_t>(parsePort(item, text)));
            continue;
        }

        int lo = parsePort(trim(item.substr(0, dash)), text);
        int hi = parsePort(trim(item.substr(dash + 1)), text);
        if (lo > hi) {
            throw ConfigurationError("Port range start exceeds end in '" + text + "'");
        }
        for (int port = lo; port <= hi; ++port) {
            ports.insert(static_cast<uint16_t>(port));
        }
    }

    if (ports.empty()) {
        throw ConfigurationError("Port range is empty");
    }
    return {ports.begin(), ports.end()};
}

std::string ScanConfig::methodToString(ProbeMethod method) {
    switch (method) {
    case ProbeMethod::Icmp:
        return "icmp";
    case ProbeMethod::TcpSyn:
        return "tcp_syn";
    case ProbeMethod::TcpAck:
        return "tcp_ack";
    case ProbeMethod::Udp:
        return "udp";
    }
    return "icmp";
}

std::optional<ProbeMethod> ScanConfig::methodFromString(const std::string& str) {
    if (str == "icmp") {
        return ProbeMethod::Icmp;
    }
    if (str == "tcp_syn") {
        return ProbeMethod::TcpSyn;
    }
    if (str == "tcp_ack") {
        return ProbeMethod::TcpAck;
    }
    if (str == "udp") {
        return ProbeMethod::Udp;
    }
    return std::nullopt;
}

ScanConfig ScanPresets::fast() {
    ScanConfig config;
    config.scanRate = 300;
    config.maxWorkers = 100;
    config.scanTimeout = "1s";
    config.maxRetries = 1;
    config.resolveHostnames = false;
    config.fetchVendorInfo = false;
    config.pingMethods = {ProbeMethod::Icmp};
    config.tcpPingPorts = {80};
    config.ackPingPorts = {};
    return config;
}

ScanConfig ScanPresets::balanced() {
    return ScanConfig{};
}

ScanConfig ScanPresets::thorough() {
    ScanConfig config;
    config.scanRate = 50;
    config.maxWorkers = 30;
    config.scanTimeout = "5s";
    config.maxRetries = 3;
    config.pingMethods = {ProbeMethod::Icmp, ProbeMethod::TcpSyn, ProbeMethod::TcpAck};
    config.tcpPingPorts = {22, 23, 25, 53, 80, 110, 443, 993, 995};
    config.ackPingPorts = {80, 443};
    return config;
}

ScanConfig ScanPresets::stealth() {
    ScanConfig config;
    config.scanRate = 10;
    config.maxWorkers = 10;
    config.scanTimeout = "10s";
    config.maxRetries = 1;
    config.resolveHostnames = false;
    config.fetchVendorInfo = true;
    config.pingMethods = {ProbeMethod::TcpSyn};
    config.tcpPingPorts = {80, 443};
    config.ackPingPorts = {};
    return config;
}

ScanConfig ScanPresets::byName(const std::string& name) {
    for (const auto& preset : all()) {
        if (preset.name == name) {
            return preset.config;
        }
    }
    throw ConfigurationError("Unknown preset: '" + name + "'");
}

std::vector<ScanPreset> ScanPresets::all() {
    return {
        {"fast", "Fast", "Quick sweep with minimal probing, no name or vendor lookups", fast()},
        {"balanced", "Balanced", "Default trade-off between speed and accuracy", balanced()},
        {"thorough", "Thorough", "Multiple probe kinds and retries for maximum coverage",
         thorough()},
        {"stealth", "Stealth", "Low-rate TCP probing to minimise network noise", stealth()},
    };
}

} // namespace lanwatch::core
