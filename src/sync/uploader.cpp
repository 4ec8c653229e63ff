#include "s3sync/sync/uploader.hpp"

#include "s3sync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace s3sync::sync {
namespace fs = std::filesystem;

Uploader::Uploader(fs::path root, storage::ObjectStore& store, events::EventBus& bus)
    : root_(std::move(root)), store_(store), bus_(bus) {}

Result<void> Uploader::upload_unit(const FileUnit& unit, bool deep, ledger::Ledger& ledger) {
    const fs::path absolute =
        unit.local_path.empty() ? root_ / fs::path(unit.path).relative_path() : unit.local_path;

    std::ifstream input(absolute, std::ios::binary);
    if (!input) {
        // A missing piece here means it was cleaned up before its upload
        return Err<void>(ErrorCode::Io, "Failed to open " + absolute.string() + " for upload");
    }

    const std::string key = storage::make_object_key(unit.path);
    auto put = store_.put(key, input, unit.size_bytes, storage::storage_class_for(deep));
    if (put.is_error()) {
        return put;
    }

    if (unit.is_part) {
        return ledger.mark_part_uploaded(unit.transfer_id, unit.path);
    }
    return ledger.mark_file_uploaded(unit.path);
}

Result<std::size_t> Uploader::upload_parts(const std::vector<PartRecord>& parts,
                                           const fs::path& piece_dir,
                                           bool deep,
                                           ledger::Ledger& ledger) {
    std::size_t puts = 0;
    bool first = true;
    std::uint32_t previous = 0;

    for (const auto& part : parts) {
        if (!first && part.sequence <= previous) {
            return Err<std::size_t>(ErrorCode::Coordination,
                                    "Parts out of order: sequence " + std::to_string(part.sequence) +
                                    " after " + std::to_string(previous));
        }
        first = false;
        previous = part.sequence;

        if (part.upload_status == UploadStatus::Uploaded) {
            spdlog::debug("Part {} already uploaded, skipping", part.part_path);
            continue;
        }

        const fs::path absolute = piece_dir / fs::path(part.part_path).filename();
        std::error_code ec;
        const auto size = fs::file_size(absolute, ec);
        if (ec) {
            return Err<std::size_t>(ErrorCode::Io,
                                    "Failed to stat part " + absolute.string() + ": " + ec.message());
        }

        FileUnit unit;
        unit.path = part.part_path;
        unit.local_path = absolute;
        unit.size_bytes = static_cast<std::uint64_t>(size);
        unit.is_part = true;
        unit.transfer_id = part.transfer_id;

        auto result = upload_unit(unit, deep, ledger);
        if (result.is_error()) {
            return Err<std::size_t>(result.error());
        }
        ++puts;

        bus_.emit(events::PartUploadedEvent{part.transfer_id, part.part_path, part.sequence,
                                            parts.size(), unit.size_bytes});
    }

    return Ok(puts);
}

} // namespace s3sync::sync
