#pragma once

#include "core/services/IProcessRunner.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Sends single ICMP echo requests and measures the round trip.
 *
 * Uses a raw ICMP socket when the process holds CAP_NET_RAW, otherwise runs
 * the system ping command once per probe. Safe to call from many threads.
 */
class IcmpPinger {
public:
    /**
     * @brief Constructs the pinger and checks for raw socket permission.
     * @param runner Process runner used when raw sockets are unavailable.
     * @param pingPath Program name or path of the system ping command.
     */
    explicit IcmpPinger(std::shared_ptr<core::IProcessRunner> runner,
                        std::string pingPath = "ping");

    /**
     * @brief Sends one echo request.
     * @param address IPv4 address to probe.
     * @param timeout Maximum time to wait for the reply.
     * @return Round-trip time in milliseconds, or nullopt if no reply arrived.
     */
    std::optional<double> ping(const std::string& address, std::chrono::milliseconds timeout);

    [[nodiscard]] bool usesRawSockets() const { return rawSockets_; }

    /**
     * @brief Extracts the round trip from ping output ("time=0.42 ms").
     */
    static std::optional<double> parsePingOutput(const std::string& output);

    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    std::optional<double> rawPing(const std::string& address, std::chrono::milliseconds timeout);
    std::optional<double> commandPing(const std::string& address,
                                      std::chrono::milliseconds timeout);

    std::shared_ptr<core::IProcessRunner> runner_;
    std::string pingPath_;
    bool rawSockets_{false};
    uint16_t identifier_;
    std::atomic<uint16_t> sequenceNumber_{0};
};

} // namespace lanwatch::infra
