#pragma once

#include "s3sync/core/cancellation.hpp"
#include "s3sync/core/result.hpp"
#include "s3sync/events/event_bus.hpp"
#include "s3sync/ledger/ledger.hpp"
#include "s3sync/storage/object_store.hpp"
#include "s3sync/sync/inventory.hpp"
#include "s3sync/sync/split_coordinator.hpp"
#include "s3sync/sync/threshold.hpp"
#include "s3sync/sync/uploader.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace s3sync::sync {

struct SyncOptions {
    std::filesystem::path root;
    std::uint64_t split_threshold = kMaxSingleObjectSize;
    std::uint64_t piece_size = kMaxSingleObjectSize;
};

struct BatchReport {
    std::size_t units_uploaded = 0;
    std::size_t units_skipped = 0;
    std::size_t puts_issued = 0;
};

struct ReconcileReport {
    std::size_t transfers_kept = 0;
    std::size_t transfers_completed = 0;
    std::size_t transfers_abandoned = 0;
    std::size_t pieces_removed = 0;
};

/**
 * @brief Drives a batch of changed paths through split and upload
 *
 * Units are processed one at a time in the order given. The first error
 * stops the batch and is returned unchanged; statuses committed for earlier
 * units stay committed.
 */
class Syncer {
public:
    Syncer(SyncOptions options, storage::ObjectStore& store, events::EventBus& bus);

    /**
     * @brief Upload every path in `units` (root-relative)
     *
     * A unit whose manifest entry is already Uploaded for its current
     * modification time is skipped without a Put.
     */
    Result<BatchReport> upload_all(const std::vector<std::string>& units,
                                   bool deep,
                                   ledger::Ledger& ledger,
                                   const CancellationToken& token = CancellationToken());

    /// Paths from `inventory` that are new, modified, or not yet Uploaded.
    Result<std::vector<std::string>> changed_files(const InventoryMap& inventory, ledger::Ledger& ledger) const;

    /// Refresh manifest entries for every inventoried file.
    Result<void> update_manifest(const InventoryMap& inventory, ledger::Ledger& ledger) const;

    /**
     * @brief Startup pass over transfers left open by an earlier run
     *
     * Transfers whose source is gone, has changed, or was cut with another
     * piece size are closed as Abandoned. Those whose source is already
     * Uploaded are closed as Completed, and the rest stay open so their
     * Uploaded parts are not sent again. Every staging directory is deleted.
     */
    Result<ReconcileReport> reconcile(ledger::Ledger& ledger);

    /// Keep the staging directory out of `inventory`.
    void exclude_working_files(Inventory& inventory) const;

    const SyncOptions& options() const noexcept { return options_; }

private:
    struct SplitUpload {
        std::size_t puts = 0;
        std::size_t parts = 0;
    };

    Result<SplitUpload> upload_split(const std::string& path,
                                     std::int64_t modified,
                                     bool deep,
                                     ledger::Ledger& ledger,
                                     const CancellationToken& token);

    std::size_t remove_leftover_pieces(const TransferRecord& transfer) const;

    SyncOptions options_;
    events::EventBus& bus_;
    SplitCoordinator coordinator_;
    Uploader uploader_;
};

} // namespace s3sync::sync
