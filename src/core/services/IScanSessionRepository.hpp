/**
 * @file IScanSessionRepository.hpp
 * @brief Storage contract for sweep sessions.
 */

#pragma once

#include "core/types/ScanSession.hpp"

#include <chrono>
#include <vector>

namespace lanwatch::core {

/**
 * @brief Persistent store for ScanSession, written only by the orchestrator.
 */
class IScanSessionRepository {
public:
    virtual ~IScanSessionRepository() = default;

    /**
     * @brief Opens a session at the start of a sweep.
     * @return ID of the new session.
     */
    virtual int64_t open(const ScanSession& session) = 0;

    /**
     * @brief Seals a session with its end time, subnet, device count and status.
     */
    virtual void seal(const ScanSession& session) = 0;

    /**
     * @brief Returns the most recent sessions, newest first.
     */
    virtual std::vector<ScanSession> recent(int limit) = 0;

    /**
     * @brief Counts sessions started at or after the given time.
     */
    virtual int countSince(std::chrono::system_clock::time_point since) = 0;
};

} // namespace lanwatch::core
