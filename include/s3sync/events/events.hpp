/**
 * @file events.hpp
 * @brief Progress events emitted by the upload pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense: PieceCreatedEvent, UnitUploadedEvent
 */

#pragma once

#include "s3sync/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace s3sync::events {

// ════════════════════════════════════════════════════════
// Batch Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per upload_all() call with a non-empty unit set
 *
 * WHO EMITS: Syncer
 */
struct BatchStartedEvent {
    std::size_t unit_count = 0;
    bool deep = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct BatchCompletedEvent {
    std::size_t units_uploaded = 0;
    std::size_t units_skipped = 0;
    std::size_t puts_issued = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when the batch stops on its first error
 */
struct BatchFailedEvent {
    std::string path;
    Error error;
    std::size_t units_completed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Unit Events
// ════════════════════════════════════════════════════════

struct UnitStartedEvent {
    std::string path;
    std::uint64_t size_bytes = 0;
    std::size_t index = 0;   ///< 1-based position in the batch
    std::size_t total = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Unit already Uploaded for its current modification time
 */
struct UnitSkippedEvent {
    std::string path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UnitUploadedEvent {
    std::string path;
    std::uint64_t size_bytes = 0;
    std::size_t part_count = 0;    ///< 0 for a whole-file upload
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Split / Part Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a file crosses the single-object limit
 *
 * WHO EMITS: SplitCoordinator
 * WHO SUBSCRIBES: Logger (warns that the file will be split)
 */
struct SplitStartedEvent {
    std::string source_path;
    std::string transfer_id;
    std::uint64_t size_bytes = 0;
    bool resumed = false;   ///< Reusing an open transfer from an earlier run
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PieceCreatedEvent {
    std::string source_path;
    std::string part_path;
    std::uint32_t sequence = 0;
    std::uint64_t size_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SplitCompletedEvent {
    std::string source_path;
    std::string transfer_id;
    std::size_t part_count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PartUploadedEvent {
    std::string transfer_id;
    std::string part_path;
    std::uint32_t sequence = 0;
    std::size_t part_count = 0;
    std::uint64_t size_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace s3sync::events
