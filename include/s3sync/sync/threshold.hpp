#pragma once

#include <cstdint>

namespace s3sync::sync {

/// Largest body the object store accepts in a single Put (4 GiB).
inline constexpr std::uint64_t kMaxSingleObjectSize = 4ULL * 1024 * 1024 * 1024;

enum class UploadPlan {
    Whole,
    Split
};

/**
 * @brief Decide whether a file fits in one object or must be split
 *
 * A file exactly at the threshold still fits.
 */
[[nodiscard]] UploadPlan classify(std::uint64_t size_bytes,
                                  std::uint64_t threshold = kMaxSingleObjectSize) noexcept;

} // namespace s3sync::sync
