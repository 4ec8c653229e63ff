#pragma once

#include "s3sync/core/cancellation.hpp"
#include "s3sync/core/result.hpp"
#include "s3sync/events/event_bus.hpp"
#include "s3sync/ledger/ledger.hpp"
#include "s3sync/sync/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace s3sync::sync {

/// Working directory under the sync root; pieces are staged below it.
inline constexpr char kStagingDirName[] = ".s3sync";

/**
 * @brief Owns the piece files produced for one transfer
 *
 * Every adopted piece is deleted when the set is destroyed (or reset),
 * whatever happened to the transfer in between. The staging directory given
 * at construction is removed too once it is empty. Move-only.
 */
class PieceSet {
public:
    PieceSet() = default;
    explicit PieceSet(std::filesystem::path directory);
    ~PieceSet();

    PieceSet(const PieceSet&) = delete;
    PieceSet& operator=(const PieceSet&) = delete;

    PieceSet(PieceSet&& other) noexcept;
    PieceSet& operator=(PieceSet&& other) noexcept;

    void adopt(std::filesystem::path piece);

    /// Delete all adopted pieces now. Returns the number removed.
    std::size_t reset();

    [[nodiscard]] const std::vector<std::filesystem::path>& paths() const noexcept { return pieces_; }
    [[nodiscard]] std::size_t size() const noexcept { return pieces_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pieces_.empty(); }

private:
    std::filesystem::path directory_;
    std::vector<std::filesystem::path> pieces_;
};

struct SplitOutcome {
    TransferRecord transfer;
    std::vector<PartRecord> parts;   ///< Ledger view, ordered by sequence
    std::filesystem::path piece_dir; ///< Where the piece files of `parts` are staged
    PieceSet pieces;                 ///< Keep alive until the parts are uploaded
};

/**
 * @brief Runs the splitter on a worker thread and folds its output into parts
 *
 * PROTOCOL:
 * 1. Reuse the open transfer for (source, mtime, piece size) or create one
 * 2. Start FileSplitter::run on its own thread with one SplitEvent channel,
 *    writing into pieces_dir(root, transfer_id)
 * 3. Each PieceReady becomes a Pending part with the next sequence; the part
 *    path is the source path plus the piece suffix, not the staged location
 * 4. SplitFinished ends the loop; the worker is joined before returning
 * 5. Success: parts are recorded, then re-read so earlier progress shows
 *    Failure: produced parts are recorded as Pending, pieces are deleted,
 *             and the splitter's error is returned unchanged
 */
class SplitCoordinator {
public:
    SplitCoordinator(std::filesystem::path root, std::uint64_t piece_size, events::EventBus& bus);

    Result<SplitOutcome> split(const std::string& source_path,
                               std::int64_t source_modified,
                               ledger::Ledger& ledger,
                               const CancellationToken& token);

    [[nodiscard]] std::uint64_t piece_size() const noexcept { return piece_size_; }

    /// "<root>/.s3sync/pieces"
    static std::filesystem::path staging_root(const std::filesystem::path& root);

    /// Staging directory of one transfer's pieces.
    static std::filesystem::path pieces_dir(const std::filesystem::path& root, const std::string& transfer_id);

private:
    std::filesystem::path root_;
    std::uint64_t piece_size_;
    events::EventBus& bus_;
};

} // namespace s3sync::sync
