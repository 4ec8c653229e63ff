#include "s3sync/sync/splitter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace s3sync::sync {
namespace fs = std::filesystem;

namespace {

void finish(Channel<SplitEvent>& channel, std::optional<Error> error) {
    channel.send(SplitFinished{std::move(error)});
    channel.close();
}

void discard_partial(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove partial piece {}: {}", path.string(), ec.message());
    }
}

} // namespace

void FileSplitter::run(const fs::path& source,
                       const fs::path& piece_dir,
                       std::uint64_t piece_size,
                       Channel<SplitEvent>& channel,
                       const CancellationToken& token) {
    if (piece_size == 0) {
        finish(channel, Error(ErrorCode::Coordination, "piece size must be > 0"));
        return;
    }

    try {
        std::ifstream input(source, std::ios::binary);
        if (!input) {
            finish(channel, Error(ErrorCode::Io, "Failed to open source file: " + source.string()));
            return;
        }

        const auto buffer_size = static_cast<std::size_t>(
            std::min<std::uint64_t>(kReadBufferSize, piece_size));
        std::vector<char> buffer(buffer_size);
        std::uint32_t index = 0;

        while (true) {
            const fs::path path = piece_path(piece_dir, source, index);
            std::ofstream output;
            std::uint64_t written = 0;

            while (written < piece_size) {
                if (token.is_cancelled()) {
                    if (output.is_open()) {
                        output.close();
                        discard_partial(path);
                    }
                    finish(channel, Error(ErrorCode::Cancelled, "Split cancelled: " + source.string()));
                    return;
                }

                const auto wanted = static_cast<std::streamsize>(
                    std::min<std::uint64_t>(buffer.size(), piece_size - written));
                input.read(buffer.data(), wanted);
                const std::streamsize count = input.gcount();
                if (count == 0) {
                    break;
                }

                if (!output.is_open()) {
                    output.open(path, std::ios::binary | std::ios::trunc);
                    if (!output) {
                        finish(channel, Error(ErrorCode::Io, "Failed to create piece: " + path.string()));
                        return;
                    }
                }

                output.write(buffer.data(), count);
                if (!output) {
                    output.close();
                    discard_partial(path);
                    finish(channel, Error(ErrorCode::Io, "Failed to write piece: " + path.string()));
                    return;
                }
                written += static_cast<std::uint64_t>(count);

                if (count < wanted) {
                    break;
                }
            }

            if (input.bad()) {
                if (output.is_open()) {
                    output.close();
                    discard_partial(path);
                }
                finish(channel, Error(ErrorCode::Io, "Failed to read source file: " + source.string()));
                return;
            }

            if (written == 0) {
                break;
            }

            output.close();
            if (!output) {
                discard_partial(path);
                finish(channel, Error(ErrorCode::Io, "Failed to flush piece: " + path.string()));
                return;
            }

            spdlog::debug("Wrote piece {} ({} bytes)", path.string(), written);
            channel.send(PieceReady{path, written});
            ++index;

            if (input.eof()) {
                break;
            }
        }

        finish(channel, std::nullopt);
    } catch (const std::exception& e) {
        finish(channel, Error(ErrorCode::Coordination,
                              std::string("Splitter failed for ") + source.string() + ": " + e.what()));
    }
}

std::string FileSplitter::piece_suffix(std::uint32_t index) {
    std::ostringstream suffix;
    suffix << ".part" << std::setw(4) << std::setfill('0') << index;
    return suffix.str();
}

fs::path FileSplitter::piece_path(const fs::path& piece_dir, const fs::path& source, std::uint32_t index) {
    return piece_dir / (source.filename().string() + piece_suffix(index));
}

std::size_t FileSplitter::clean_up(const std::vector<fs::path>& pieces) {
    std::size_t removed = 0;
    for (const auto& piece : pieces) {
        std::error_code ec;
        if (fs::remove(piece, ec)) {
            ++removed;
        } else if (ec) {
            spdlog::warn("Failed to remove piece {}: {}", piece.string(), ec.message());
        }
    }
    return removed;
}

} // namespace s3sync::sync
