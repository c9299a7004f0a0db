#include "infrastructure/network/IcmpPinger.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <random>
#include <regex>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace lanwatch::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr size_t ICMP_PACKET_SIZE = 64;

#ifdef __linux__
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};
#endif

} // namespace

IcmpPinger::IcmpPinger(std::shared_ptr<core::IProcessRunner> runner, std::string pingPath)
    : runner_(std::move(runner)), pingPath_(std::move(pingPath)) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);

#ifdef __linux__
    SocketHandle probe(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    rawSockets_ = probe.valid();
#endif

    if (rawSockets_) {
        spdlog::debug("IcmpPinger using raw sockets, identifier {}", identifier_);
    } else {
        spdlog::info("Raw ICMP sockets unavailable (need CAP_NET_RAW), using {}", pingPath_);
    }
}

uint16_t IcmpPinger::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> IcmpPinger::buildEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(ICMP_PACKET_SIZE, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

std::optional<double> IcmpPinger::parsePingOutput(const std::string& output) {
    static const std::regex pattern(R"(time[=<]\s*([0-9]+(?:\.[0-9]+)?)\s*ms)");

    std::smatch match;
    if (!std::regex_search(output, match, pattern)) {
        return std::nullopt;
    }
    return std::stod(match[1].str());
}

std::optional<double> IcmpPinger::ping(const std::string& address,
                                       std::chrono::milliseconds timeout) {
    return rawSockets_ ? rawPing(address, timeout) : commandPing(address, timeout);
}

std::optional<double> IcmpPinger::rawPing(const std::string& address,
                                          std::chrono::milliseconds timeout) {
#ifdef __linux__
    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        return std::nullopt;
    }

    SocketHandle sock(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    if (!sock.valid()) {
        return commandPing(address, timeout);
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = buildEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    if (sendto(sock.get(), packet.data(), packet.size(), 0,
               reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) < 0) {
        spdlog::debug("Failed to send ICMP echo to {}", address);
        return std::nullopt;
    }

    // A raw socket sees every ICMP packet delivered to the host
    std::array<uint8_t, 1024> recvBuffer{};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }

        struct timeval tv {};
        tv.tv_sec = remaining.count() / 1'000'000;
        tv.tv_usec = remaining.count() % 1'000'000;
        setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        if (received < 0) {
            return std::nullopt;
        }

        auto recvTime = std::chrono::steady_clock::now();
        if (from.sin_addr.s_addr != dest.sin_addr.s_addr || received < 28) {
            continue;
        }

        size_t ipHeaderLen = static_cast<size_t>((recvBuffer[0] & 0x0F) * 4);
        if (static_cast<size_t>(received) < ipHeaderLen + 8) {
            continue;
        }

        const uint8_t* icmpHeader = recvBuffer.data() + ipHeaderLen;
        if (icmpHeader[0] != ICMP_ECHO_REPLY) {
            continue;
        }

        uint16_t recvId = static_cast<uint16_t>((icmpHeader[4] << 8) | icmpHeader[5]);
        uint16_t recvSeq = static_cast<uint16_t>((icmpHeader[6] << 8) | icmpHeader[7]);
        if (recvId != identifier_ || recvSeq != seq) {
            continue;
        }

        auto latency = std::chrono::duration<double, std::milli>(recvTime - sendTime).count();
        spdlog::debug("Ping to {} successful: {:.2f}ms", address, latency);
        return latency;
    }
#else
    return commandPing(address, timeout);
#endif
}

std::optional<double> IcmpPinger::commandPing(const std::string& address,
                                              std::chrono::milliseconds timeout) {
    // iputils ping takes whole seconds for -W
    auto waitSeconds = std::max<int64_t>(1, (timeout.count() + 999) / 1000);
    auto result = runner_->run({pingPath_, "-n", "-c", "1", "-W", std::to_string(waitSeconds),
                                address},
                               timeout + std::chrono::seconds(1));
    if (!result.succeeded()) {
        return std::nullopt;
    }

    // Some ping builds omit the time field for sub-millisecond replies
    return parsePingOutput(result.stdoutText).value_or(0.0);
}

} // namespace lanwatch::infra
