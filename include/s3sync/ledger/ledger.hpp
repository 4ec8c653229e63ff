#pragma once

/**
 * @file ledger.hpp
 * @brief Durable record of file and part upload status
 *
 * WHY THIS FILE EXISTS:
 * A crashed or interrupted run must resume without re-uploading completed
 * work. Every status change is committed here right after the object store
 * confirms the corresponding Put.
 *
 * HOW IT INTEGRATES:
 * - Syncer refreshes FileStatusRecords before uploading
 * - SplitCoordinator creates TransferRecords and PartRecords
 * - Uploader marks files and parts Uploaded after each successful Put
 *
 * The ledger is always passed explicitly to the call that needs it.
 */

#include "s3sync/core/result.hpp"
#include "s3sync/sync/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace s3sync::ledger {

class Ledger {
public:
    virtual ~Ledger() = default;

    // ── File status (manifest) ──────────────────────────────

    virtual Result<std::optional<sync::FileStatusRecord>> get_file_status(const std::string& path) = 0;

    /**
     * Insert or refresh a file's manifest entry.
     *
     * An entry already Uploaded for the same last_modified keeps its status;
     * a different last_modified replaces the entry with the given status.
     */
    virtual Result<void> upsert_file_status(const std::string& path,
                                            std::int64_t last_modified,
                                            sync::UploadStatus status) = 0;

    virtual Result<void> mark_file_uploaded(const std::string& path) = 0;

    // ── Transfers ───────────────────────────────────────────

    virtual Result<sync::TransferRecord> create_transfer(const std::string& source_path,
                                                         std::int64_t source_modified,
                                                         std::uint64_t piece_size) = 0;

    /**
     * Open transfer cut from this exact source version with this piece size.
     *
     * Parts of a transfer cut with another piece size hold different bytes
     * under the same names, so they are never reused.
     */
    virtual Result<std::optional<sync::TransferRecord>> find_open_transfer(const std::string& source_path,
                                                                           std::int64_t source_modified,
                                                                           std::uint64_t piece_size) = 0;

    virtual Result<std::vector<sync::TransferRecord>> list_open_transfers() = 0;

    virtual Result<void> close_transfer(const std::string& transfer_id, sync::TransferState state) = 0;

    // ── Parts ───────────────────────────────────────────────

    /**
     * Record pieces in emission order; index i gets sequence i.
     *
     * A part already recorded at the same sequence with the same path keeps
     * its status, so re-splitting an open transfer does not lose progress.
     */
    virtual Result<void> record_parts(const std::string& transfer_id,
                                      const std::vector<std::string>& part_paths) = 0;

    /// Parts of a transfer ordered by sequence.
    virtual Result<std::vector<sync::PartRecord>> list_parts(const std::string& transfer_id) = 0;

    virtual Result<void> mark_part_uploaded(const std::string& transfer_id,
                                            const std::string& part_path) = 0;
};

} // namespace s3sync::ledger
