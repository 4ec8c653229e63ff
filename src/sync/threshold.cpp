#include "s3sync/sync/threshold.hpp"

namespace s3sync::sync {

UploadPlan classify(std::uint64_t size_bytes, std::uint64_t threshold) noexcept {
    return size_bytes > threshold ? UploadPlan::Split : UploadPlan::Whole;
}

} // namespace s3sync::sync
