#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace lanwatch::infra {

namespace {

struct Migration {
    int version;
    const char* description;
    const char* sql;
};

constexpr std::array MIGRATIONS{
    Migration{1, "device inventory", R"(
        CREATE TABLE IF NOT EXISTS devices (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            ip_address TEXT NOT NULL UNIQUE,
            mac_address TEXT,
            hostname TEXT,
            vendor TEXT,
            custom_name TEXT,
            device_type TEXT,
            first_seen TEXT NOT NULL,
            last_seen TEXT NOT NULL,
            is_online INTEGER NOT NULL DEFAULT 0,
            open_ports TEXT NOT NULL DEFAULT '[]'
        );
        CREATE INDEX IF NOT EXISTS idx_devices_mac ON devices(mac_address);
        CREATE INDEX IF NOT EXISTS idx_devices_online ON devices(is_online);

        CREATE TABLE IF NOT EXISTS scan_records (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            device_id INTEGER NOT NULL REFERENCES devices(id) ON DELETE CASCADE,
            scan_time TEXT NOT NULL,
            is_online INTEGER NOT NULL,
            latency_ms REAL
        );
        CREATE INDEX IF NOT EXISTS idx_scan_records_device_time
            ON scan_records(device_id, scan_time);
        CREATE INDEX IF NOT EXISTS idx_scan_records_time ON scan_records(scan_time);

        CREATE TABLE IF NOT EXISTS scan_sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            start_time TEXT NOT NULL,
            end_time TEXT,
            subnet TEXT NOT NULL DEFAULT '',
            scan_type TEXT NOT NULL,
            devices_found INTEGER NOT NULL DEFAULT 0,
            status TEXT NOT NULL DEFAULT 'running',
            error_message TEXT NOT NULL DEFAULT ''
        );
        CREATE INDEX IF NOT EXISTS idx_scan_sessions_start ON scan_sessions(start_time);
    )"},

    // Seeded with virtualisation and a few consumer prefixes; the rest is
    // learned from nmap and arp-scan output.
    Migration{2, "vendor prefixes", R"(
        CREATE TABLE IF NOT EXISTS oui_vendors (
            prefix TEXT PRIMARY KEY,
            vendor TEXT NOT NULL
        );
        INSERT OR IGNORE INTO oui_vendors (prefix, vendor) VALUES
            ('005056', 'VMware'),
            ('000C29', 'VMware'),
            ('080027', 'VirtualBox'),
            ('525400', 'QEMU'),
            ('001B21', 'Intel'),
            ('002324', 'Apple'),
            ('D89EF3', 'Apple'),
            ('ACDE48', 'Apple');
    )"},
};

void check(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        throw StorageError(std::string(what) + ": " + sqlite3_errstr(rc));
    }
}

} // namespace

Statement::Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::bind(int index, int value) {
    check(sqlite3_bind_int(stmt_, index, value), "bind int");
}

void Statement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value), "bind int64");
}

void Statement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value), "bind double");
}

void Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT),
          "bind text");
}

void Statement::bind(int index, const std::optional<std::string>& value) {
    if (value) {
        bind(index, *value);
    } else {
        bindNull(index);
    }
}

void Statement::bindNull(int index) {
    check(sqlite3_bind_null(stmt_, index), "bind null");
}

bool Statement::step() {
    switch (int rc = sqlite3_step(stmt_)) {
    case SQLITE_ROW:
        return true;
    case SQLITE_DONE:
        return false;
    default:
        throw StorageError(std::string("step: ") + sqlite3_errstr(rc));
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::columnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::columnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::columnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

std::optional<std::string> Statement::columnOptionalText(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    return columnText(index);
}

bool Statement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

Database::Database(const std::string& path) {
    spdlog::info("Opening device database {}", path);

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("Cannot open " + path + ": " + error);
    }

    configureConnection();
    createMigrationsTable();
}

Database::~Database() {
    sqlite3_close(db_);
}

void Database::configureConnection() {
    execute("PRAGMA journal_mode=WAL");
    execute("PRAGMA synchronous=NORMAL");
    execute("PRAGMA foreign_keys=ON");
}

void Database::execute(const std::string& sql) {
    std::lock_guard lock(mutex_);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errmsg(db_);
        sqlite3_free(errMsg);
        throw StorageError("SQL execution failed: " + error);
    }
}

Statement Database::prepare(const std::string& sql) {
    std::lock_guard lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("Cannot prepare statement: ") + sqlite3_errmsg(db_));
    }
    return Statement(stmt);
}

int64_t Database::lastInsertRowId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::beginTransaction() {
    execute("BEGIN IMMEDIATE");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

void Database::createMigrationsTable() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            applied_at TEXT DEFAULT CURRENT_TIMESTAMP
        )
    )");
}

int Database::schemaVersion() {
    auto stmt = prepare("SELECT MAX(version) FROM schema_migrations");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt(0);
    }
    return 0;
}

void Database::recordVersion(int version) {
    auto stmt = prepare("INSERT INTO schema_migrations (version) VALUES (?)");
    stmt.bind(1, version);
    stmt.step();
}

void Database::runMigrations() {
    int current = schemaVersion();
    spdlog::debug("Schema version {}", current);

    for (const auto& migration : MIGRATIONS) {
        if (migration.version <= current) {
            continue;
        }
        spdlog::info("Applying migration {}: {}", migration.version, migration.description);
        transaction([&] {
            execute(migration.sql);
            recordVersion(migration.version);
        });
    }

    spdlog::info("Database schema at version {}", schemaVersion());
}

} // namespace lanwatch::infra
