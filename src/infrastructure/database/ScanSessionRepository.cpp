#include "infrastructure/database/ScanSessionRepository.hpp"

#include "infrastructure/database/SqlTime.hpp"

#include <spdlog/spdlog.h>

namespace lanwatch::infra {

ScanSessionRepository::ScanSessionRepository(std::shared_ptr<Database> db)
    : db_(std::move(db)) {}

int64_t ScanSessionRepository::open(const core::ScanSession& session) {
    auto stmt = db_->prepare(R"(
        INSERT INTO scan_sessions (start_time, subnet, scan_type, status)
        VALUES (?, ?, ?, ?)
    )");

    stmt.bind(1, timePointToString(session.startTime));
    stmt.bind(2, session.subnet);
    stmt.bind(3, core::ScanSession::scanTypeToString(session.scanType));
    stmt.bind(4, core::ScanSession::statusToString(core::SessionStatus::Running));
    stmt.step();

    auto id = db_->lastInsertRowId();
    spdlog::debug("Opened scan session {}", id);
    return id;
}

void ScanSessionRepository::seal(const core::ScanSession& session) {
    auto stmt = db_->prepare(R"(
        UPDATE scan_sessions SET
            end_time = ?, subnet = ?, devices_found = ?, status = ?, error_message = ?
        WHERE id = ?
    )");

    auto endTime = session.endTime.value_or(std::chrono::system_clock::now());
    stmt.bind(1, timePointToString(endTime));
    stmt.bind(2, session.subnet);
    stmt.bind(3, session.devicesFound);
    stmt.bind(4, core::ScanSession::statusToString(session.status));
    stmt.bind(5, session.errorMessage);
    stmt.bind(6, session.id);
    stmt.step();

    spdlog::debug("Sealed scan session {} ({})", session.id,
                  core::ScanSession::statusToString(session.status));
}

std::vector<core::ScanSession> ScanSessionRepository::recent(int limit) {
    std::vector<core::ScanSession> sessions;
    auto stmt = db_->prepare(R"(
        SELECT id, start_time, end_time, subnet, scan_type, devices_found, status, error_message
        FROM scan_sessions ORDER BY start_time DESC, id DESC LIMIT ?
    )");
    stmt.bind(1, limit);

    while (stmt.step()) {
        sessions.push_back(rowToSession(stmt));
    }
    return sessions;
}

int ScanSessionRepository::countSince(std::chrono::system_clock::time_point since) {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM scan_sessions WHERE start_time >= ?");
    stmt.bind(1, timePointToString(since));
    stmt.step();
    return stmt.columnInt(0);
}

std::optional<core::ScanSession> ScanSessionRepository::findById(int64_t id) {
    auto stmt = db_->prepare(R"(
        SELECT id, start_time, end_time, subnet, scan_type, devices_found, status, error_message
        FROM scan_sessions WHERE id = ?
    )");
    stmt.bind(1, id);

    if (stmt.step()) {
        return rowToSession(stmt);
    }
    return std::nullopt;
}

int ScanSessionRepository::cleanupOldSessions(std::chrono::hours maxAge) {
    auto cutoff = std::chrono::system_clock::now() - maxAge;
    auto stmt = db_->prepare("DELETE FROM scan_sessions WHERE start_time < ?");
    stmt.bind(1, timePointToString(cutoff));
    stmt.step();

    int removed = db_->changes();
    spdlog::info("Cleaned up {} scan sessions older than {} hours", removed, maxAge.count());
    return removed;
}

core::ScanSession ScanSessionRepository::rowToSession(Statement& stmt) {
    core::ScanSession session;
    session.id = stmt.columnInt64(0);
    session.startTime = stringToTimePoint(stmt.columnText(1));
    if (!stmt.columnIsNull(2)) {
        session.endTime = stringToTimePoint(stmt.columnText(2));
    }
    session.subnet = stmt.columnText(3);
    session.scanType =
        core::ScanSession::scanTypeFromString(stmt.columnText(4)).value_or(core::ScanType::Ping);
    session.devicesFound = stmt.columnInt(5);
    session.status = core::ScanSession::statusFromString(stmt.columnText(6));
    session.errorMessage = stmt.columnText(7);
    return session;
}

} // namespace lanwatch::infra
