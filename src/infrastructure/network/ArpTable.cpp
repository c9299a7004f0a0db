#include "infrastructure/network/ArpTable.hpp"

#include "core/types/MacAddress.hpp"
#include "core/types/Subnet.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace lanwatch::infra {

namespace {

constexpr unsigned long ATF_COMPLETE = 0x02;

} // namespace

std::vector<ArpEntry> ArpTable::parseKernelCache(const std::string& content) {
    std::vector<ArpEntry> entries;
    std::istringstream stream(content);
    std::string line;

    // Header: IP address  HW type  Flags  HW address  Mask  Device
    std::getline(stream, line);

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string ip;
        std::string hwType;
        std::string flags;
        std::string mac;
        std::string mask;
        std::string device;
        if (!(fields >> ip >> hwType >> flags >> mac >> mask)) {
            continue;
        }
        fields >> device;

        unsigned long flagBits = 0;
        try {
            flagBits = std::stoul(flags, nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }

        if ((flagBits & ATF_COMPLETE) == 0 || core::MacAddress::isNull(mac) ||
            !core::Subnet::isValidAddress(ip)) {
            continue;
        }

        auto normalized = core::MacAddress::normalize(mac);
        if (!normalized) {
            continue;
        }

        entries.push_back({ip, *normalized, std::nullopt, device});
    }

    return entries;
}

std::vector<ArpEntry> ArpTable::parseArpScan(const std::string& output) {
    std::vector<ArpEntry> entries;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        auto firstTab = line.find('\t');
        if (firstTab == std::string::npos) {
            continue;
        }

        std::string ip = line.substr(0, firstTab);
        auto secondTab = line.find('\t', firstTab + 1);
        std::string mac = line.substr(firstTab + 1, secondTab == std::string::npos
                                                        ? std::string::npos
                                                        : secondTab - firstTab - 1);

        if (!core::Subnet::isValidAddress(ip)) {
            continue;
        }
        auto normalized = core::MacAddress::normalize(mac);
        if (!normalized) {
            continue;
        }

        ArpEntry entry{ip, *normalized, std::nullopt, ""};
        if (secondTab != std::string::npos) {
            auto vendor = line.substr(secondTab + 1);
            while (!vendor.empty() && vendor.back() == ' ') {
                vendor.pop_back();
            }
            if (!vendor.empty() && vendor != "(Unknown)") {
                entry.vendor = vendor;
            }
        }
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::vector<ArpEntry> ArpTable::readKernelCache(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::debug("ARP cache {} not readable", path);
        return {};
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parseKernelCache(content.str());
}

} // namespace lanwatch::infra
