#include "s3sync/sync/syncer.hpp"

#include "s3sync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <system_error>

namespace s3sync::sync {
namespace fs = std::filesystem;

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

// Deletes a staging directory; returns the number of piece files it held
std::size_t remove_staging_dir(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }

    std::size_t pieces = 0;
    fs::recursive_directory_iterator it(dir, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            ++pieces;
        }
        it.increment(ec);
    }

    fs::remove_all(dir, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging directory {}: {}", dir.string(), ec.message());
        return 0;
    }
    return pieces;
}

} // namespace

Syncer::Syncer(SyncOptions options, storage::ObjectStore& store, events::EventBus& bus)
    : options_(std::move(options)),
      bus_(bus),
      coordinator_(options_.root, options_.piece_size, bus),
      uploader_(options_.root, store, bus) {}

Result<BatchReport> Syncer::upload_all(const std::vector<std::string>& units,
                                       bool deep,
                                       ledger::Ledger& ledger,
                                       const CancellationToken& token) {
    BatchReport report;
    if (units.empty()) {
        spdlog::info("No files to update!");
        return Ok(report);
    }

    const auto batch_start = std::chrono::steady_clock::now();
    bus_.emit(events::BatchStartedEvent{units.size(), deep});

    auto fail = [&](const std::string& path, Error error) {
        bus_.emit(events::BatchFailedEvent{path, error, report.units_uploaded + report.units_skipped});
        return Err<BatchReport>(std::move(error));
    };

    for (std::size_t i = 0; i < units.size(); ++i) {
        const std::string& path = units[i];

        if (token.is_cancelled()) {
            return fail(path, Error(ErrorCode::Cancelled, "Batch cancelled before " + path));
        }

        const fs::path absolute = options_.root / fs::path(path).relative_path();
        std::error_code ec;
        const auto size = fs::file_size(absolute, ec);
        if (ec) {
            return fail(path, Error(ErrorCode::Io, "Failed to stat " + absolute.string() + ": " + ec.message()));
        }
        const auto modified = file_mtime(absolute, ec);
        if (ec) {
            return fail(path, Error(ErrorCode::Io, "Failed to stat " + absolute.string() + ": " + ec.message()));
        }

        auto status = ledger.get_file_status(path);
        if (status.is_error()) {
            return fail(path, status.error());
        }
        const auto& record = status.value();
        if (record && record->upload_status == UploadStatus::Uploaded && record->last_modified == modified) {
            ++report.units_skipped;
            bus_.emit(events::UnitSkippedEvent{path});
            continue;
        }

        if (auto pending = ledger.upsert_file_status(path, modified, UploadStatus::Pending); pending.is_error()) {
            return fail(path, pending.error());
        }

        const auto unit_start = std::chrono::steady_clock::now();
        const auto size_bytes = static_cast<std::uint64_t>(size);
        bus_.emit(events::UnitStartedEvent{path, size_bytes, i + 1, units.size()});

        std::size_t part_count = 0;
        if (classify(size_bytes, options_.split_threshold) == UploadPlan::Whole) {
            FileUnit unit;
            unit.path = path;
            unit.size_bytes = size_bytes;

            auto uploaded = uploader_.upload_unit(unit, deep, ledger);
            if (uploaded.is_error()) {
                return fail(path, uploaded.error());
            }
            ++report.puts_issued;
        } else {
            auto uploaded = upload_split(path, modified, deep, ledger, token);
            if (uploaded.is_error()) {
                return fail(path, uploaded.error());
            }
            report.puts_issued += uploaded.value().puts;
            part_count = uploaded.value().parts;
        }

        ++report.units_uploaded;
        bus_.emit(events::UnitUploadedEvent{path, size_bytes, part_count, elapsed_since(unit_start)});
    }

    bus_.emit(events::BatchCompletedEvent{report.units_uploaded, report.units_skipped,
                                          report.puts_issued, elapsed_since(batch_start)});
    return Ok(report);
}

Result<Syncer::SplitUpload> Syncer::upload_split(const std::string& path,
                                                 std::int64_t modified,
                                                 bool deep,
                                                 ledger::Ledger& ledger,
                                                 const CancellationToken& token) {
    auto split = coordinator_.split(path, modified, ledger, token);
    if (split.is_error()) {
        return Err<SplitUpload>(split.error());
    }
    // Pieces stay on disk until `outcome` goes out of scope
    SplitOutcome& outcome = split.value();

    auto puts = uploader_.upload_parts(outcome.parts, outcome.piece_dir, deep, ledger);
    if (puts.is_error()) {
        return Err<SplitUpload>(puts.error());
    }

    // File first: reconcile() closes a transfer whose source is already Uploaded
    if (auto marked = ledger.mark_file_uploaded(path); marked.is_error()) {
        return Err<SplitUpload>(marked.error());
    }
    if (auto closed = ledger.close_transfer(outcome.transfer.transfer_id, TransferState::Completed);
        closed.is_error()) {
        return Err<SplitUpload>(closed.error());
    }

    SplitUpload result;
    result.puts = puts.value();
    result.parts = outcome.parts.size();
    return Ok(result);
}

Result<std::vector<std::string>> Syncer::changed_files(const InventoryMap& inventory,
                                                       ledger::Ledger& ledger) const {
    std::vector<std::string> changed;
    for (const auto& [path, modified] : inventory) {
        auto status = ledger.get_file_status(path);
        if (status.is_error()) {
            return Err<std::vector<std::string>>(status.error());
        }
        const auto& record = status.value();
        if (!record || record->last_modified != modified || record->upload_status != UploadStatus::Uploaded) {
            changed.push_back(path);
        }
    }

    spdlog::debug("{} of {} files need an upload", changed.size(), inventory.size());
    return Ok(std::move(changed));
}

Result<void> Syncer::update_manifest(const InventoryMap& inventory, ledger::Ledger& ledger) const {
    for (const auto& [path, modified] : inventory) {
        auto upserted = ledger.upsert_file_status(path, modified, UploadStatus::Pending);
        if (upserted.is_error()) {
            return upserted;
        }
    }
    return Ok();
}

Result<ReconcileReport> Syncer::reconcile(ledger::Ledger& ledger) {
    ReconcileReport report;

    auto open = ledger.list_open_transfers();
    if (open.is_error()) {
        return Err<ReconcileReport>(open.error());
    }

    for (const auto& transfer : open.value()) {
        report.pieces_removed += remove_leftover_pieces(transfer);

        const fs::path source = options_.root / fs::path(transfer.source_path).relative_path();
        std::error_code ec;
        const bool exists = fs::is_regular_file(source, ec);
        const auto modified = exists ? file_mtime(source, ec) : 0;

        TransferState verdict = TransferState::Open;
        if (!exists || ec || modified != transfer.source_modified) {
            verdict = TransferState::Abandoned;
            spdlog::warn("Abandoned transfer {}: {} is gone or has changed",
                         transfer.transfer_id, transfer.source_path);
        } else if (transfer.piece_size != options_.piece_size) {
            verdict = TransferState::Abandoned;
            spdlog::warn("Abandoned transfer {}: {} was cut into {} byte pieces, now {}",
                         transfer.transfer_id, transfer.source_path,
                         transfer.piece_size, options_.piece_size);
        } else {
            auto status = ledger.get_file_status(transfer.source_path);
            if (status.is_error()) {
                return Err<ReconcileReport>(status.error());
            }
            const auto& record = status.value();
            if (record && record->upload_status == UploadStatus::Uploaded &&
                record->last_modified == transfer.source_modified) {
                verdict = TransferState::Completed;
            }
        }

        if (verdict == TransferState::Open) {
            ++report.transfers_kept;
            spdlog::info("Keeping open transfer {} for {}", transfer.transfer_id, transfer.source_path);
            continue;
        }

        if (auto closed = ledger.close_transfer(transfer.transfer_id, verdict); closed.is_error()) {
            return Err<ReconcileReport>(closed.error());
        }
        if (verdict == TransferState::Abandoned) {
            ++report.transfers_abandoned;
        } else {
            ++report.transfers_completed;
            spdlog::info("Closed finished transfer {} for {}", transfer.transfer_id, transfer.source_path);
        }
    }

    // Staging directories of transfers that were already closed
    const fs::path staging = SplitCoordinator::staging_root(options_.root);
    std::error_code ec;
    if (fs::is_directory(staging, ec)) {
        std::vector<fs::path> orphans;
        for (fs::directory_iterator it(staging, ec), end; !ec && it != end; it.increment(ec)) {
            orphans.push_back(it->path());
        }
        for (const auto& orphan : orphans) {
            report.pieces_removed += remove_staging_dir(orphan);
        }
    }

    return Ok(report);
}

void Syncer::exclude_working_files(Inventory& inventory) const {
    inventory.exclude(std::string(kStagingDirName) + "/");
}

std::size_t Syncer::remove_leftover_pieces(const TransferRecord& transfer) const {
    const auto removed =
        remove_staging_dir(SplitCoordinator::pieces_dir(options_.root, transfer.transfer_id));
    if (removed > 0) {
        spdlog::info("Removed {} leftover pieces of {}", removed, transfer.source_path);
    }
    return removed;
}

} // namespace s3sync::sync
