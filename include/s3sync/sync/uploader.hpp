#pragma once

#include "s3sync/core/result.hpp"
#include "s3sync/events/event_bus.hpp"
#include "s3sync/ledger/ledger.hpp"
#include "s3sync/storage/object_store.hpp"
#include "s3sync/sync/types.hpp"

#include <filesystem>
#include <vector>

namespace s3sync::sync {

/**
 * @brief Puts one unit into the object store, then commits its status
 *
 * A status is committed strictly after the store confirmed the Put. The
 * first error (open, Put, commit) is returned as-is; nothing is retried and
 * no local file is deleted.
 */
class Uploader {
public:
    Uploader(std::filesystem::path root, storage::ObjectStore& store, events::EventBus& bus);

    Result<void> upload_unit(const FileUnit& unit, bool deep, ledger::Ledger& ledger);

    /**
     * @brief Upload a transfer's parts in sequence order
     *
     * Each part is read from `piece_dir` under the file name of its part path
     * and stored under the part path itself. Parts already Uploaded are
     * skipped. Each part's status is committed right after its own Put, so an
     * interruption leaves an exact record.
     *
     * @return Number of Puts issued
     */
    Result<std::size_t> upload_parts(const std::vector<PartRecord>& parts,
                                     const std::filesystem::path& piece_dir,
                                     bool deep,
                                     ledger::Ledger& ledger);

private:
    std::filesystem::path root_;
    storage::ObjectStore& store_;
    events::EventBus& bus_;
};

} // namespace s3sync::sync
