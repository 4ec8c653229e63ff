#pragma once

#include "s3sync/core/cancellation.hpp"
#include "s3sync/core/error.hpp"
#include "s3sync/sync/channel.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace s3sync::sync {

/**
 * @brief A piece has been fully written and closed
 */
struct PieceReady {
    std::filesystem::path path;
    std::uint64_t size_bytes = 0;
};

/**
 * @brief Terminal message; nothing follows it on the channel
 */
struct SplitFinished {
    std::optional<Error> error;  ///< nullopt on success
};

using SplitEvent = std::variant<PieceReady, SplitFinished>;

/**
 * @brief Cuts one file into bounded-size piece files in a staging directory
 *
 * Pieces are named "<source file name>.partNNNN" and cover the source bytes
 * in order. The source directory itself is never written to, and the
 * splitter never touches the ledger or the network.
 */
class FileSplitter {
public:
    static constexpr std::size_t kReadBufferSize = 1024 * 1024;

    /**
     * @brief Split `source` into pieces of at most `piece_size` bytes
     *
     * `piece_dir` must exist; any file there with a piece name is overwritten.
     *
     * Emits one PieceReady per piece, then exactly one SplitFinished, then
     * closes the channel. Cancellation is polled between buffer reads and ends
     * the run with ErrorCode::Cancelled. A piece that was being written when
     * the run failed is removed before SplitFinished is sent.
     */
    static void run(const std::filesystem::path& source,
                    const std::filesystem::path& piece_dir,
                    std::uint64_t piece_size,
                    Channel<SplitEvent>& channel,
                    const CancellationToken& token);

    /// ".partNNNN", the suffix of piece `index` in both its file name and its object key.
    static std::string piece_suffix(std::uint32_t index);

    static std::filesystem::path piece_path(const std::filesystem::path& piece_dir,
                                            const std::filesystem::path& source,
                                            std::uint32_t index);

    /// Remove piece files; failures are logged, never thrown. Returns removed count.
    static std::size_t clean_up(const std::vector<std::filesystem::path>& pieces);
};

} // namespace s3sync::sync
