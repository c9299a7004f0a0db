#include "core/types/ScanSession.hpp"

namespace lanwatch::core {

std::string ScanSession::scanTypeToString(ScanType type) {
    switch (type) {
    case ScanType::Ping:
        return "ping";
    case ScanType::Arp:
        return "arp";
    case ScanType::Comprehensive:
        return "comprehensive";
    }
    return "ping";
}

std::optional<ScanType> ScanSession::scanTypeFromString(const std::string& str) {
    if (str == "ping") {
        return ScanType::Ping;
    }
    if (str == "arp") {
        return ScanType::Arp;
    }
    if (str == "comprehensive") {
        return ScanType::Comprehensive;
    }
    return std::nullopt;
}

std::string ScanSession::statusToString(SessionStatus status) {
    switch (status) {
    case SessionStatus::Running:
        return "running";
    case SessionStatus::Success:
        return "success";
    case SessionStatus::Error:
        return "error";
    }
    return "running";
}

SessionStatus ScanSession::statusFromString(const std::string& str) {
    if (str == "success") {
        return SessionStatus::Success;
    }
    if (str == "error") {
        return SessionStatus::Error;
    }
    return SessionStatus::Running;
}

std::string SweepOutcome::statusToString(SweepStatus status) {
    switch (status) {
    case SweepStatus::Started:
        return "started";
    case SweepStatus::Rejected:
        return "rejected";
    case SweepStatus::Success:
        return "success";
    case SweepStatus::Error:
        return "error";
    }
    return "error";
}

} // namespace lanwatch::core
