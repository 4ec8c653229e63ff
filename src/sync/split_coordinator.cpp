#include "s3sync/sync/split_coordinator.hpp"

#include "s3sync/events/events.hpp"
#include "s3sync/sync/channel.hpp"
#include "s3sync/sync/splitter.hpp"

#include <spdlog/spdlog.h>

#include <system_error>
#include <thread>
#include <variant>

namespace s3sync::sync {
namespace fs = std::filesystem;

namespace {

/// Joins the worker on every exit path out of split().
class WorkerJoiner {
public:
    explicit WorkerJoiner(std::thread& worker) : worker_(worker) {}
    ~WorkerJoiner() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    WorkerJoiner(const WorkerJoiner&) = delete;
    WorkerJoiner& operator=(const WorkerJoiner&) = delete;

private:
    std::thread& worker_;
};

} // namespace

// ──────────────────────────────────────────────────────────
// PieceSet
// ──────────────────────────────────────────────────────────

PieceSet::PieceSet(fs::path directory) : directory_(std::move(directory)) {}

PieceSet::~PieceSet() {
    reset();
}

PieceSet::PieceSet(PieceSet&& other) noexcept
    : directory_(std::move(other.directory_)), pieces_(std::move(other.pieces_)) {
    other.directory_.clear();
    other.pieces_.clear();
}

PieceSet& PieceSet::operator=(PieceSet&& other) noexcept {
    if (this != &other) {
        reset();
        directory_ = std::move(other.directory_);
        pieces_ = std::move(other.pieces_);
        other.directory_.clear();
        other.pieces_.clear();
    }
    return *this;
}

void PieceSet::adopt(fs::path piece) {
    pieces_.push_back(std::move(piece));
}

std::size_t PieceSet::reset() {
    std::size_t removed = 0;
    if (!pieces_.empty()) {
        removed = FileSplitter::clean_up(pieces_);
        spdlog::debug("Cleaned up {}/{} pieces", removed, pieces_.size());
        pieces_.clear();
    }

    if (!directory_.empty()) {
        std::error_code ec;
        fs::remove(directory_, ec);
        if (ec) {
            spdlog::debug("Staging directory {} kept: {}", directory_.string(), ec.message());
        }
        directory_.clear();
    }
    return removed;
}

// ──────────────────────────────────────────────────────────
// SplitCoordinator
// ──────────────────────────────────────────────────────────

SplitCoordinator::SplitCoordinator(fs::path root, std::uint64_t piece_size, events::EventBus& bus)
    : root_(std::move(root)), piece_size_(piece_size), bus_(bus) {}

fs::path SplitCoordinator::staging_root(const fs::path& root) {
    return root / kStagingDirName / "pieces";
}

fs::path SplitCoordinator::pieces_dir(const fs::path& root, const std::string& transfer_id) {
    return staging_root(root) / transfer_id;
}

Result<SplitOutcome> SplitCoordinator::split(const std::string& source_path,
                                             std::int64_t source_modified,
                                             ledger::Ledger& ledger,
                                             const CancellationToken& token) {
    auto existing = ledger.find_open_transfer(source_path, source_modified, piece_size_);
    if (existing.is_error()) {
        return Err<SplitOutcome>(existing.error());
    }

    SplitOutcome outcome;
    const bool resumed = existing.value().has_value();
    if (resumed) {
        outcome.transfer = *existing.value();
    } else {
        auto created = ledger.create_transfer(source_path, source_modified, piece_size_);
        if (created.is_error()) {
            return Err<SplitOutcome>(created.error());
        }
        outcome.transfer = created.value();
    }

    outcome.piece_dir = pieces_dir(root_, outcome.transfer.transfer_id);
    std::error_code ec;
    fs::create_directories(outcome.piece_dir, ec);
    if (ec) {
        return Err<SplitOutcome>(ErrorCode::Io, "Failed to create staging directory " +
                                                outcome.piece_dir.string() + ": " + ec.message());
    }
    outcome.pieces = PieceSet(outcome.piece_dir);

    const fs::path source = root_ / fs::path(source_path).relative_path();
    const auto size = fs::file_size(source, ec);
    bus_.emit(events::SplitStartedEvent{source_path, outcome.transfer.transfer_id,
                                        ec ? 0 : static_cast<std::uint64_t>(size), resumed});

    Channel<SplitEvent> channel;
    std::vector<std::string> part_paths;
    std::optional<Error> failure;

    {
        std::thread worker([&channel, &token, source, piece_dir = outcome.piece_dir, piece_size = piece_size_]() {
            FileSplitter::run(source, piece_dir, piece_size, channel, token);
        });
        WorkerJoiner joiner(worker);

        while (true) {
            auto event = channel.receive();
            if (!event) {
                failure = Error(ErrorCode::Coordination,
                                "Splitter closed the channel without a result for " + source_path);
                break;
            }

            if (auto* piece = std::get_if<PieceReady>(&*event)) {
                outcome.pieces.adopt(piece->path);
                const auto sequence = static_cast<std::uint32_t>(part_paths.size());
                part_paths.push_back(source_path + FileSplitter::piece_suffix(sequence));
                bus_.emit(events::PieceCreatedEvent{source_path, part_paths.back(), sequence, piece->size_bytes});
                continue;
            }

            failure = std::get<SplitFinished>(*event).error;
            break;
        }
    }

    if (failure) {
        if (!part_paths.empty()) {
            // Keep a Pending trace of what was produced before the failure
            auto recorded = ledger.record_parts(outcome.transfer.transfer_id, part_paths);
            if (recorded.is_error()) {
                spdlog::error("Failed to record partial split of {}: {}",
                              source_path, to_string(recorded.error()));
            }
        }
        return Err<SplitOutcome>(*failure);
    }

    if (auto recorded = ledger.record_parts(outcome.transfer.transfer_id, part_paths); recorded.is_error()) {
        return Err<SplitOutcome>(recorded.error());
    }

    auto parts = ledger.list_parts(outcome.transfer.transfer_id);
    if (parts.is_error()) {
        return Err<SplitOutcome>(parts.error());
    }

    // Drop stale rows from an earlier split with a different piece count
    for (auto& part : parts.value()) {
        if (part.sequence < part_paths.size()) {
            outcome.parts.push_back(std::move(part));
        }
    }

    bus_.emit(events::SplitCompletedEvent{source_path, outcome.transfer.transfer_id, outcome.parts.size()});
    return Ok(std::move(outcome));
}

} // namespace s3sync::sync
