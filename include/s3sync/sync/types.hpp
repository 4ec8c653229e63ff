#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace s3sync::sync {

enum class UploadStatus {
    Pending,
    Uploaded
};

enum class TransferState {
    Open,
    Completed,
    Abandoned
};

/**
 * @brief A path scheduled for upload: a whole source file or one generated piece
 */
struct FileUnit {
    std::string path;          ///< Relative to the sync root; also the object key
    std::filesystem::path local_path;  ///< Bytes are read from here; empty means root / path
    std::uint64_t size_bytes = 0;
    bool is_part = false;
    std::string transfer_id;   ///< Owning transfer when is_part, empty otherwise
};

/**
 * @brief One split-and-upload lifecycle of an oversized source file
 */
struct TransferRecord {
    std::string transfer_id;
    std::string source_path;
    std::int64_t source_modified = 0;  ///< Source mtime the pieces were cut from
    std::uint64_t piece_size = 0;      ///< Piece size the pieces were cut with
    std::int64_t created_at = 0;
    TransferState state = TransferState::Open;
};

struct PartRecord {
    std::string transfer_id;
    std::string part_path;
    std::uint32_t sequence = 0;
    UploadStatus upload_status = UploadStatus::Pending;
};

/**
 * @brief Manifest entry for a source file, used as change fingerprint
 */
struct FileStatusRecord {
    std::string path;
    std::int64_t last_modified = 0;   ///< Unix seconds
    UploadStatus upload_status = UploadStatus::Pending;
};

inline const char* to_string(UploadStatus status) {
    return status == UploadStatus::Uploaded ? "uploaded" : "pending";
}

inline std::int64_t unix_now() {
    return static_cast<std::int64_t>(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

} // namespace s3sync::sync
