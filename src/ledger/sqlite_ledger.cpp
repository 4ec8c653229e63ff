#include "s3sync/ledger/sqlite_ledger.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace s3sync::ledger {
namespace fs = std::filesystem;
using sync::FileStatusRecord;
using sync::PartRecord;
using sync::TransferRecord;
using sync::TransferState;
using sync::UploadStatus;

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS file_status (
    path          TEXT PRIMARY KEY,
    last_modified INTEGER NOT NULL,
    upload_status INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS transfers (
    transfer_id     TEXT PRIMARY KEY,
    source_path     TEXT NOT NULL,
    source_modified INTEGER NOT NULL,
    piece_size      INTEGER NOT NULL DEFAULT 0,
    created_at      INTEGER NOT NULL,
    state           INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_transfers_source ON transfers (source_path, source_modified, state);
CREATE TABLE IF NOT EXISTS parts (
    transfer_id   TEXT NOT NULL REFERENCES transfers (transfer_id),
    sequence      INTEGER NOT NULL,
    part_path     TEXT NOT NULL,
    upload_status INTEGER NOT NULL,
    PRIMARY KEY (transfer_id, sequence)
);
)SQL";

/**
 * @brief RAII wrapper for a prepared statement
 */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bind(int index, std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    int step() { return sqlite3_step(stmt_); }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string text(int column) const {
        const auto* raw = sqlite3_column_text(stmt_, column);
        return raw ? reinterpret_cast<const char*>(raw) : std::string();
    }

    std::int64_t int64(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

    std::string last_error() const { return sqlite3_errmsg(db_); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

template<typename T>
Result<T> ledger_error(const std::string& what, const std::string& detail) {
    return Err<T>(ErrorCode::Ledger, what + ": " + detail);
}

std::string generate_transfer_id() {
    static std::mt19937_64 engine{std::random_device{}()};
    static std::mutex engine_mutex;
    std::lock_guard lock(engine_mutex);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << engine()
        << std::setw(16) << engine();
    return oss.str();
}

// Column order of every transfers SELECT
TransferRecord read_transfer(const Statement& st) {
    TransferRecord record;
    record.transfer_id = st.text(0);
    record.source_path = st.text(1);
    record.source_modified = st.int64(2);
    record.piece_size = static_cast<std::uint64_t>(st.int64(3));
    record.created_at = st.int64(4);
    record.state = static_cast<TransferState>(st.int64(5));
    return record;
}

std::int64_t status_value(UploadStatus status) {
    return status == UploadStatus::Uploaded ? 1 : 0;
}

UploadStatus status_from(std::int64_t value) {
    return value == 1 ? UploadStatus::Uploaded : UploadStatus::Pending;
}

} // namespace

Result<std::unique_ptr<SqliteLedger>> SqliteLedger::open(const fs::path& db_path) {
    const std::string location = db_path.string();
    if (location != ":memory:" && db_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(db_path.parent_path(), ec);
        if (ec) {
            return ledger_error<std::unique_ptr<SqliteLedger>>(
                "Failed to create ledger directory " + db_path.parent_path().string(), ec.message());
        }
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(location.c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return ledger_error<std::unique_ptr<SqliteLedger>>("Failed to open ledger " + location, message);
    }

    auto ledger = std::make_unique<SqliteLedger>(db, OpenKey{});
    for (const char* pragma : {"PRAGMA journal_mode=WAL;",
                               "PRAGMA synchronous=FULL;",
                               "PRAGMA foreign_keys=ON;",
                               "PRAGMA busy_timeout=5000;"}) {
        if (auto res = ledger->exec(pragma); res.is_error()) {
            return Err<std::unique_ptr<SqliteLedger>>(res.error());
        }
    }
    if (auto res = ledger->migrate(); res.is_error()) {
        return Err<std::unique_ptr<SqliteLedger>>(res.error());
    }

    spdlog::debug("Opened ledger {}", location);
    return Ok(std::move(ledger));
}

SqliteLedger::SqliteLedger(sqlite3* db, OpenKey) : db_(db) {}

SqliteLedger::~SqliteLedger() {
    sqlite3_close(db_);
}

Result<void> SqliteLedger::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        return ledger_error<void>("SQLite exec failed", message);
    }
    return Ok();
}

Result<int> SqliteLedger::schema_version() {
    Statement st(db_, "PRAGMA user_version;");
    if (!st.ok() || st.step() != SQLITE_ROW) {
        return ledger_error<int>("Failed to read schema version", st.last_error());
    }
    return Ok(static_cast<int>(st.int64(0)));
}

Result<void> SqliteLedger::migrate() {
    auto version = schema_version();
    if (version.is_error()) {
        return Err<void>(version.error());
    }
    if (version.value() > kSchemaVersion) {
        return ledger_error<void>("Unsupported ledger schema",
                                  "version " + std::to_string(version.value()) + " is newer than " +
                                  std::to_string(kSchemaVersion));
    }

    if (auto res = exec(kSchema); res.is_error()) {
        return res;
    }
    if (version.value() == 1) {
        // v1 transfers carry no piece size; 0 never matches, so reconcile abandons them
        if (auto res = exec("ALTER TABLE transfers ADD COLUMN piece_size INTEGER NOT NULL DEFAULT 0;");
            res.is_error()) {
            return res;
        }
        spdlog::info("Upgraded ledger schema from version 1 to {}", kSchemaVersion);
    }

    const std::string pragma = "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";";
    return exec(pragma.c_str());
}

Result<std::optional<FileStatusRecord>> SqliteLedger::get_file_status(const std::string& path) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "SELECT path, last_modified, upload_status FROM file_status WHERE path = ?");
    if (!st.ok()) {
        return ledger_error<std::optional<FileStatusRecord>>("get_file_status prepare failed", st.last_error());
    }
    st.bind(1, path);

    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return Ok(std::optional<FileStatusRecord>());
    }
    if (rc != SQLITE_ROW) {
        return ledger_error<std::optional<FileStatusRecord>>("get_file_status failed", st.last_error());
    }

    FileStatusRecord record;
    record.path = st.text(0);
    record.last_modified = st.int64(1);
    record.upload_status = status_from(st.int64(2));
    return Ok(std::optional<FileStatusRecord>(std::move(record)));
}

Result<void> SqliteLedger::upsert_file_status(const std::string& path,
                                              std::int64_t last_modified,
                                              UploadStatus status) {
    std::lock_guard lock(mutex_);
    Statement st(db_, R"SQL(
        INSERT INTO file_status (path, last_modified, upload_status) VALUES (?, ?, ?)
        ON CONFLICT (path) DO UPDATE SET
            upload_status = CASE
                WHEN file_status.last_modified = excluded.last_modified AND file_status.upload_status = 1
                THEN 1 ELSE excluded.upload_status END,
            last_modified = excluded.last_modified
    )SQL");
    if (!st.ok()) {
        return ledger_error<void>("upsert_file_status prepare failed", st.last_error());
    }
    st.bind(1, path);
    st.bind(2, last_modified);
    st.bind(3, status_value(status));
    if (st.step() != SQLITE_DONE) {
        return ledger_error<void>("upsert_file_status failed for " + path, st.last_error());
    }
    return Ok();
}

Result<void> SqliteLedger::mark_file_uploaded(const std::string& path) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "UPDATE file_status SET upload_status = 1 WHERE path = ?");
    if (!st.ok()) {
        return ledger_error<void>("mark_file_uploaded prepare failed", st.last_error());
    }
    st.bind(1, path);
    if (st.step() != SQLITE_DONE) {
        return ledger_error<void>("mark_file_uploaded failed for " + path, st.last_error());
    }
    if (sqlite3_changes(db_) == 0) {
        return ledger_error<void>("mark_file_uploaded failed", "no status record for " + path);
    }
    return Ok();
}

Result<TransferRecord> SqliteLedger::create_transfer(const std::string& source_path,
                                                     std::int64_t source_modified,
                                                     std::uint64_t piece_size) {
    std::lock_guard lock(mutex_);
    TransferRecord record;
    record.transfer_id = generate_transfer_id();
    record.source_path = source_path;
    record.source_modified = source_modified;
    record.piece_size = piece_size;
    record.created_at = sync::unix_now();
    record.state = TransferState::Open;

    Statement st(db_, R"SQL(
        INSERT INTO transfers (transfer_id, source_path, source_modified, piece_size, created_at, state)
        VALUES (?, ?, ?, ?, ?, ?)
    )SQL");
    if (!st.ok()) {
        return ledger_error<TransferRecord>("create_transfer prepare failed", st.last_error());
    }
    st.bind(1, record.transfer_id);
    st.bind(2, record.source_path);
    st.bind(3, record.source_modified);
    st.bind(4, static_cast<std::int64_t>(record.piece_size));
    st.bind(5, record.created_at);
    st.bind(6, static_cast<std::int64_t>(record.state));
    if (st.step() != SQLITE_DONE) {
        return ledger_error<TransferRecord>("create_transfer failed for " + source_path, st.last_error());
    }
    return Ok(std::move(record));
}

Result<std::optional<TransferRecord>> SqliteLedger::find_open_transfer(const std::string& source_path,
                                                                       std::int64_t source_modified,
                                                                       std::uint64_t piece_size) {
    std::lock_guard lock(mutex_);
    Statement st(db_, R"SQL(
        SELECT transfer_id, source_path, source_modified, piece_size, created_at, state
        FROM transfers
        WHERE source_path = ? AND source_modified = ? AND piece_size = ? AND state = 0
        ORDER BY created_at DESC
        LIMIT 1
    )SQL");
    if (!st.ok()) {
        return ledger_error<std::optional<TransferRecord>>("find_open_transfer prepare failed", st.last_error());
    }
    st.bind(1, source_path);
    st.bind(2, source_modified);
    st.bind(3, static_cast<std::int64_t>(piece_size));

    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return Ok(std::optional<TransferRecord>());
    }
    if (rc != SQLITE_ROW) {
        return ledger_error<std::optional<TransferRecord>>("find_open_transfer failed", st.last_error());
    }
    return Ok(std::optional<TransferRecord>(read_transfer(st)));
}

Result<std::vector<TransferRecord>> SqliteLedger::list_open_transfers() {
    std::lock_guard lock(mutex_);
    Statement st(db_, R"SQL(
        SELECT transfer_id, source_path, source_modified, piece_size, created_at, state
        FROM transfers WHERE state = 0 ORDER BY created_at, transfer_id
    )SQL");
    if (!st.ok()) {
        return ledger_error<std::vector<TransferRecord>>("list_open_transfers prepare failed", st.last_error());
    }

    std::vector<TransferRecord> records;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        records.push_back(read_transfer(st));
    }
    if (rc != SQLITE_DONE) {
        return ledger_error<std::vector<TransferRecord>>("list_open_transfers failed", st.last_error());
    }
    return Ok(std::move(records));
}

Result<void> SqliteLedger::close_transfer(const std::string& transfer_id, TransferState state) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "UPDATE transfers SET state = ? WHERE transfer_id = ?");
    if (!st.ok()) {
        return ledger_error<void>("close_transfer prepare failed", st.last_error());
    }
    st.bind(1, static_cast<std::int64_t>(state));
    st.bind(2, transfer_id);
    if (st.step() != SQLITE_DONE) {
        return ledger_error<void>("close_transfer failed for " + transfer_id, st.last_error());
    }
    if (sqlite3_changes(db_) == 0) {
        return ledger_error<void>("close_transfer failed", "unknown transfer " + transfer_id);
    }
    return Ok();
}

Result<void> SqliteLedger::record_parts(const std::string& transfer_id,
                                        const std::vector<std::string>& part_paths) {
    std::lock_guard lock(mutex_);
    if (auto res = exec("BEGIN IMMEDIATE;"); res.is_error()) {
        return res;
    }

    Statement st(db_, R"SQL(
        INSERT INTO parts (transfer_id, sequence, part_path, upload_status) VALUES (?, ?, ?, 0)
        ON CONFLICT (transfer_id, sequence) DO UPDATE SET
            upload_status = CASE WHEN parts.part_path = excluded.part_path
                                 THEN parts.upload_status ELSE 0 END,
            part_path = excluded.part_path
    )SQL");

    auto rollback = [this](const std::string& what, const std::string& detail) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            spdlog::error("Ledger rollback failed: {}", err ? err : "unknown error");
            sqlite3_free(err);
        }
        return ledger_error<void>(what, detail);
    };

    if (!st.ok()) {
        return rollback("record_parts prepare failed", st.last_error());
    }

    for (std::size_t i = 0; i < part_paths.size(); ++i) {
        st.reset();
        st.bind(1, transfer_id);
        st.bind(2, static_cast<std::int64_t>(i));
        st.bind(3, part_paths[i]);
        if (st.step() != SQLITE_DONE) {
            return rollback("record_parts failed for " + part_paths[i], st.last_error());
        }
    }

    return exec("COMMIT;");
}

Result<std::vector<PartRecord>> SqliteLedger::list_parts(const std::string& transfer_id) {
    std::lock_guard lock(mutex_);
    Statement st(db_, R"SQL(
        SELECT transfer_id, part_path, sequence, upload_status
        FROM parts WHERE transfer_id = ? ORDER BY sequence
    )SQL");
    if (!st.ok()) {
        return ledger_error<std::vector<PartRecord>>("list_parts prepare failed", st.last_error());
    }
    st.bind(1, transfer_id);

    std::vector<PartRecord> parts;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        PartRecord part;
        part.transfer_id = st.text(0);
        part.part_path = st.text(1);
        part.sequence = static_cast<std::uint32_t>(st.int64(2));
        part.upload_status = status_from(st.int64(3));
        parts.push_back(std::move(part));
    }
    if (rc != SQLITE_DONE) {
        return ledger_error<std::vector<PartRecord>>("list_parts failed", st.last_error());
    }
    return Ok(std::move(parts));
}

Result<void> SqliteLedger::mark_part_uploaded(const std::string& transfer_id,
                                              const std::string& part_path) {
    std::lock_guard lock(mutex_);
    Statement st(db_, "UPDATE parts SET upload_status = 1 WHERE transfer_id = ? AND part_path = ?");
    if (!st.ok()) {
        return ledger_error<void>("mark_part_uploaded prepare failed", st.last_error());
    }
    st.bind(1, transfer_id);
    st.bind(2, part_path);
    if (st.step() != SQLITE_DONE) {
        return ledger_error<void>("mark_part_uploaded failed for " + part_path, st.last_error());
    }
    if (sqlite3_changes(db_) == 0) {
        return ledger_error<void>("mark_part_uploaded failed", "no part record for " + part_path);
    }
    return Ok();
}

} // namespace s3sync::ledger
