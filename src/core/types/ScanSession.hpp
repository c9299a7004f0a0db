/**
 * @file ScanSession.hpp
 * @brief Sweep kinds, per-sweep session records and sweep outcomes.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lanwatch::core {

/**
 * @brief What a sweep does.
 */
enum class ScanType : int {
    Ping = 0,         ///< Host discovery only
    Arp = 1,          ///< ARP-based discovery
    Comprehensive = 2 ///< Discovery followed by a per-host detail pass
};

/**
 * @brief Lifecycle of a ScanSession row.
 */
enum class SessionStatus : int {
    Running = 0, ///< Opened, not yet sealed
    Success = 1, ///< Sealed after a completed sweep
    Error = 2    ///< Sealed after a failed sweep
};

/**
 * @brief Persistent record of one sweep, opened at start and sealed at end.
 */
struct ScanSession {
    int64_t id{0};                                  ///< Unique identifier
    std::chrono::system_clock::time_point startTime; ///< When the sweep started
    std::optional<std::chrono::system_clock::time_point> endTime; ///< Set when sealed
    std::string subnet;                             ///< Requested or resolved subnet
    ScanType scanType{ScanType::Ping};              ///< Sweep kind
    int devicesFound{0};                            ///< Live hosts observed
    SessionStatus status{SessionStatus::Running};   ///< Running until sealed
    std::string errorMessage;                       ///< Failure reason for Error sessions

    [[nodiscard]] bool isSealed() const { return endTime.has_value(); }

    static std::string scanTypeToString(ScanType type);

    /**
     * @brief Parses a scan type name ("ping", "arp", "comprehensive").
     * @return The scan type, or nullopt for an unknown name.
     */
    static std::optional<ScanType> scanTypeFromString(const std::string& str);

    static std::string statusToString(SessionStatus status);
    static SessionStatus statusFromString(const std::string& str);

    bool operator==(const ScanSession& other) const = default;
};

/**
 * @brief Result kind of a sweep request.
 */
enum class SweepStatus : int {
    Started = 0,  ///< Accepted and running in the background
    Rejected = 1, ///< Another sweep was already running; nothing was done
    Success = 2,  ///< Completed
    Error = 3     ///< Failed; the session was sealed with the error
};

/**
 * @brief What a sweep request returns to its caller.
 */
struct SweepOutcome {
    SweepStatus status{SweepStatus::Rejected};
    std::string subnet;                    ///< Resolved subnet, or the requested one
    ScanType scanType{ScanType::Ping};
    std::optional<int> devicesFound;       ///< Live hosts, for Success
    std::optional<double> durationSeconds; ///< Wall time, for Success and Error
    std::optional<int64_t> sessionId;      ///< Session written for this sweep
    std::string message;                   ///< Human-readable detail

    static std::string statusToString(SweepStatus status);
};

/**
 * @brief Snapshot of the scheduler state.
 */
struct ScanStatus {
    bool scanning{false};     ///< A sweep is in progress
    int intervalSeconds{300}; ///< Periodic interval
    bool periodicRunning{false}; ///< The periodic loop is active
    std::optional<std::chrono::system_clock::time_point> lastScanTime; ///< Last completed sweep
};

/**
 * @brief Aggregate device and session counters.
 */
struct NetworkStats {
    int totalDevices{0};
    int onlineDevices{0};
    int offlineDevices{0};
    int sessionsLast24h{0};
};

} // namespace lanwatch::core
