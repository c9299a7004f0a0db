#pragma once

#include "core/services/IScanSessionRepository.hpp"
#include "infrastructure/database/Database.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief SQLite-backed store for sweep sessions.
 */
class ScanSessionRepository : public core::IScanSessionRepository {
public:
    explicit ScanSessionRepository(std::shared_ptr<Database> db);

    int64_t open(const core::ScanSession& session) override;
    void seal(const core::ScanSession& session) override;
    std::vector<core::ScanSession> recent(int limit) override;
    int countSince(std::chrono::system_clock::time_point since) override;

    std::optional<core::ScanSession> findById(int64_t id);

    /**
     * @brief Deletes sessions started before the given age.
     * @return Number of deleted sessions.
     */
    int cleanupOldSessions(std::chrono::hours maxAge);

private:
    core::ScanSession rowToSession(Statement& stmt);
    std::shared_ptr<Database> db_;
};

} // namespace lanwatch::infra
