#include "core/types/NetworkInterface.hpp"

#include "core/types/Subnet.hpp"

#include <bit>

#ifdef __linux__
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#endif

namespace lanwatch::core {

namespace {

#ifdef __linux__
std::string toDottedQuad(const struct sockaddr* sa) {
    char buffer[INET_ADDRSTRLEN] = {};
    const auto* addr = reinterpret_cast<const struct sockaddr_in*>(sa);
    inet_ntop(AF_INET, &addr->sin_addr, buffer, INET_ADDRSTRLEN);
    return buffer;
}
#endif

} // namespace

int NetworkInterface::prefixLength() const {
#ifdef __linux__
    struct in_addr mask {};
    if (inet_pton(AF_INET, netmask.c_str(), &mask) != 1) {
        return -1;
    }
    return std::popcount(ntohl(mask.s_addr));
#else
    return -1;
#endif
}

std::optional<std::string> NetworkInterface::subnetCidr() const {
    int prefix = prefixLength();
    if (prefix < 0) {
        return std::nullopt;
    }

    auto subnet = Subnet::tryParse(ipAddress + "/" + std::to_string(prefix));
    if (!subnet) {
        return std::nullopt;
    }
    return subnet->cidr();
}

std::vector<NetworkInterface> NetworkInterfaceEnumerator::enumerate() {
    std::vector<NetworkInterface> interfaces;

#ifdef __linux__
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return interfaces;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        NetworkInterface iface;
        iface.name = ifa->ifa_name;
        iface.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        iface.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        iface.ipAddress = toDottedQuad(ifa->ifa_addr);
        if (ifa->ifa_netmask != nullptr) {
            iface.netmask = toDottedQuad(ifa->ifa_netmask);
        }

        interfaces.push_back(std::move(iface));
    }

    freeifaddrs(ifaddr);
#endif

    return interfaces;
}

std::optional<std::string> NetworkInterfaceEnumerator::selectLocalSubnet(
    const std::vector<NetworkInterface>& interfaces) {
    for (const auto& iface : interfaces) {
        if (!iface.isUp || iface.isLoopback) {
            continue;
        }
        if (auto cidr = iface.subnetCidr()) {
            return cidr;
        }
    }
    return std::nullopt;
}

std::optional<std::string> NetworkInterfaceEnumerator::detectLocalSubnet() {
    return selectLocalSubnet(enumerate());
}

} // namespace lanwatch::core
