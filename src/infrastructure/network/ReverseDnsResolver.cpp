#include "infrastructure/network/ReverseDnsResolver.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace lanwatch::infra {

std::optional<std::string> ReverseDnsResolver::resolve(const std::string& ipAddress) {
    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, ipAddress.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST] = {};
    int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr), host,
                         sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0) {
        spdlog::debug("No reverse name for {}: {}", ipAddress, gai_strerror(rc));
        return std::nullopt;
    }

    std::string name(host);
    if (name.empty() || name == ipAddress) {
        return std::nullopt;
    }
    return name;
}

} // namespace lanwatch::infra
