/**
 * @file components.hpp
 * @brief Event subscribers that report upload progress
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Components react to pipeline events automatically
 */

#pragma once

#include "s3sync/events/event_bus.hpp"
#include "s3sync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace s3sync::events {

/**
 * @brief Logs every pipeline event through spdlog
 *
 * Per-piece and per-part progress is logged at debug level, everything
 * else at info (warn for splits, error for failures).
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<BatchStartedEvent>([this](const BatchStartedEvent& e) {
            on_batch_started(e);
        });

        bus_.subscribe<BatchCompletedEvent>([this](const BatchCompletedEvent& e) {
            on_batch_completed(e);
        });

        bus_.subscribe<BatchFailedEvent>([this](const BatchFailedEvent& e) {
            on_batch_failed(e);
        });

        bus_.subscribe<UnitStartedEvent>([this](const UnitStartedEvent& e) {
            on_unit_started(e);
        });

        bus_.subscribe<UnitSkippedEvent>([this](const UnitSkippedEvent& e) {
            on_unit_skipped(e);
        });

        bus_.subscribe<UnitUploadedEvent>([this](const UnitUploadedEvent& e) {
            on_unit_uploaded(e);
        });

        bus_.subscribe<SplitStartedEvent>([this](const SplitStartedEvent& e) {
            on_split_started(e);
        });

        bus_.subscribe<PieceCreatedEvent>([this](const PieceCreatedEvent& e) {
            on_piece_created(e);
        });

        bus_.subscribe<SplitCompletedEvent>([this](const SplitCompletedEvent& e) {
            on_split_completed(e);
        });

        bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            on_part_uploaded(e);
        });
    }

private:
    void on_batch_started(const BatchStartedEvent& e) {
        spdlog::info("[BatchStarted] units={} storage={}", e.unit_count, e.deep ? "deep-archive" : "standard");
    }

    void on_batch_completed(const BatchCompletedEvent& e) {
        spdlog::info("[BatchCompleted] uploaded={} skipped={} puts={} duration={}ms",
                     e.units_uploaded, e.units_skipped, e.puts_issued, e.duration.count());
    }

    void on_batch_failed(const BatchFailedEvent& e) {
        spdlog::error("[BatchFailed] path={} completed={} error={}",
                      e.path, e.units_completed, to_string(e.error));
    }

    void on_unit_started(const UnitStartedEvent& e) {
        spdlog::info("[Uploading] {} ({} bytes) {}/{}", e.path, e.size_bytes, e.index, e.total);
    }

    void on_unit_skipped(const UnitSkippedEvent& e) {
        spdlog::info("[Skipped] {} already uploaded", e.path);
    }

    void on_unit_uploaded(const UnitUploadedEvent& e) {
        if (e.part_count > 0) {
            spdlog::info("[Uploaded] {} bytes={} parts={} duration={}ms",
                         e.path, e.size_bytes, e.part_count, e.duration.count());
        } else {
            spdlog::info("[Uploaded] {} bytes={} duration={}ms", e.path, e.size_bytes, e.duration.count());
        }
    }

    void on_split_started(const SplitStartedEvent& e) {
        spdlog::warn("[Splitting] {} ({} bytes) too big for a single object, transfer={}{}",
                     e.source_path, e.size_bytes, e.transfer_id, e.resumed ? " (resumed)" : "");
    }

    void on_piece_created(const PieceCreatedEvent& e) {
        spdlog::debug("[PieceCreated] {} seq={} bytes={}", e.part_path, e.sequence, e.size_bytes);
    }

    void on_split_completed(const SplitCompletedEvent& e) {
        spdlog::info("[SplitCompleted] {} into {} parts, transfer={}", e.source_path, e.part_count, e.transfer_id);
    }

    void on_part_uploaded(const PartUploadedEvent& e) {
        spdlog::debug("[PartUploaded] {} part {}/{} bytes={}",
                      e.part_path, e.sequence + 1, e.part_count, e.size_bytes);
    }

    EventBus& bus_;
};

/**
 * @brief Counts uploads for an end-of-run summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> units_uploaded{0};
        std::atomic<uint64_t> units_skipped{0};
        std::atomic<uint64_t> units_failed{0};
        std::atomic<uint64_t> files_split{0};
        std::atomic<uint64_t> pieces_created{0};
        std::atomic<uint64_t> parts_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UnitUploadedEvent>([this](const UnitUploadedEvent& e) {
            stats_.units_uploaded++;
            if (e.part_count == 0) {
                stats_.bytes_uploaded += e.size_bytes;
            }
        });

        bus_.subscribe<UnitSkippedEvent>([this](const UnitSkippedEvent&) {
            stats_.units_skipped++;
        });

        bus_.subscribe<BatchFailedEvent>([this](const BatchFailedEvent&) {
            stats_.units_failed++;
        });

        bus_.subscribe<SplitStartedEvent>([this](const SplitStartedEvent&) {
            stats_.files_split++;
        });

        bus_.subscribe<PieceCreatedEvent>([this](const PieceCreatedEvent&) {
            stats_.pieces_created++;
        });

        // Part bytes are counted per part so a resumed transfer is not double counted
        bus_.subscribe<PartUploadedEvent>([this](const PartUploadedEvent& e) {
            stats_.parts_uploaded++;
            stats_.bytes_uploaded += e.size_bytes;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Units uploaded:  {}", stats_.units_uploaded.load());
        spdlog::info("  Units skipped:   {}", stats_.units_skipped.load());
        spdlog::info("  Units failed:    {}", stats_.units_failed.load());
        spdlog::info("  Files split:     {}", stats_.files_split.load());
        spdlog::info("  Pieces created:  {}", stats_.pieces_created.load());
        spdlog::info("  Parts uploaded:  {}", stats_.parts_uploaded.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace s3sync::events
