#pragma once

#include "s3sync/ledger/ledger.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

struct sqlite3;

namespace s3sync::ledger {

/**
 * @brief Ledger persisted in a SQLite database file
 *
 * DURABILITY:
 * WAL journal with synchronous=FULL; every mutating call commits before it
 * returns, so a status written here survives a process crash.
 *
 * THREAD SAFETY:
 * Calls are serialised by an internal mutex. The sync pipeline only ever has
 * one writer, the lock just keeps multi-statement writes atomic.
 */
class SqliteLedger : public Ledger {
public:
    static constexpr int kSchemaVersion = 2;

private:
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    /// Open (creating or upgrading if needed) the database at `db_path`; ":memory:" is accepted.
    static Result<std::unique_ptr<SqliteLedger>> open(const std::filesystem::path& db_path);

    /// Only reachable through open().
    SqliteLedger(sqlite3* db, OpenKey);
    ~SqliteLedger() override;

    SqliteLedger(const SqliteLedger&) = delete;
    SqliteLedger& operator=(const SqliteLedger&) = delete;

    Result<std::optional<sync::FileStatusRecord>> get_file_status(const std::string& path) override;
    Result<void> upsert_file_status(const std::string& path,
                                    std::int64_t last_modified,
                                    sync::UploadStatus status) override;
    Result<void> mark_file_uploaded(const std::string& path) override;

    Result<sync::TransferRecord> create_transfer(const std::string& source_path,
                                                 std::int64_t source_modified,
                                                 std::uint64_t piece_size) override;
    Result<std::optional<sync::TransferRecord>> find_open_transfer(const std::string& source_path,
                                                                   std::int64_t source_modified,
                                                                   std::uint64_t piece_size) override;
    Result<std::vector<sync::TransferRecord>> list_open_transfers() override;
    Result<void> close_transfer(const std::string& transfer_id, sync::TransferState state) override;

    Result<void> record_parts(const std::string& transfer_id,
                              const std::vector<std::string>& part_paths) override;
    Result<std::vector<sync::PartRecord>> list_parts(const std::string& transfer_id) override;
    Result<void> mark_part_uploaded(const std::string& transfer_id,
                                    const std::string& part_path) override;

private:
    Result<void> exec(const char* sql);
    Result<int> schema_version();
    Result<void> migrate();

    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace s3sync::ledger
