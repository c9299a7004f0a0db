#include "core/types/Subnet.hpp"

#include "core/types/Errors.hpp"

#include <asio/ip/address_v4.hpp>
#include <asio/ip/network_v4.hpp>

namespace lanwatch::core {

namespace {

uint64_t countUsableHosts(int prefixLength) {
    if (prefixLength >= 31) {
        return prefixLength == 32 ? 1 : 2;
    }
    return (uint64_t{1} << (32 - prefixLength)) - 2;
}

} // namespace

std::string Subnet::cidr() const {
    return network + "/" + std::to_string(prefixLength);
}

bool Subnet::contains(const std::string& address) const {
    asio::error_code ec;
    auto addr = asio::ip::make_address_v4(address, ec);
    if (ec) {
        return false;
    }

    auto net = asio::ip::make_network_v4(cidr(), ec);
    if (ec) {
        return false;
    }

    auto first = net.network().to_uint();
    auto last = net.broadcast().to_uint();
    auto value = addr.to_uint();
    return value >= first && value <= last;
}

std::vector<std::string> Subnet::hostAddresses() const {
    std::vector<std::string> hosts;

    asio::error_code ec;
    auto net = asio::ip::make_network_v4(cidr(), ec);
    if (ec) {
        return hosts;
    }

    uint32_t first = net.network().to_uint();
    uint32_t last = net.broadcast().to_uint();
    if (prefixLength < 31) {
        ++first;
        --last;
    }

    hosts.reserve(static_cast<size_t>(last - first) + 1);
    for (uint64_t value = first; value <= last; ++value) {
        hosts.push_back(asio::ip::address_v4(static_cast<uint32_t>(value)).to_string());
    }
    return hosts;
}

Subnet Subnet::parse(const std::string& cidr) {
    auto subnet = tryParse(cidr);
    if (!subnet) {
        throw ConfigurationError("Invalid subnet: '" + cidr + "'");
    }
    return *subnet;
}

std::optional<Subnet> Subnet::tryParse(const std::string& cidr) {
    std::string text = cidr;
    if (text.find('/') == std::string::npos) {
        text += "/32";
    }

    asio::error_code ec;
    auto net = asio::ip::make_network_v4(text, ec);
    if (ec) {
        return std::nullopt;
    }

    Subnet subnet;
    subnet.network = net.network().to_string();
    subnet.broadcast = net.broadcast().to_string();
    subnet.prefixLength = net.prefix_length();
    subnet.usableHosts = countUsableHosts(subnet.prefixLength);
    return subnet;
}

bool Subnet::isValidAddress(const std::string& address) {
    asio::error_code ec;
    asio::ip::make_address_v4(address, ec);
    return !ec;
}

} // namespace lanwatch::core
