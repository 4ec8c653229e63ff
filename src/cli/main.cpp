#include "s3sync/config/config.hpp"
#include "s3sync/core/cancellation.hpp"
#include "s3sync/events/components.hpp"
#include "s3sync/events/event_bus.hpp"
#include "s3sync/ledger/sqlite_ledger.hpp"
#include "s3sync/sync/inventory.hpp"
#include "s3sync/sync/syncer.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

// Global token for signal handling
s3sync::CancellationToken* g_cancel = nullptr;

void signal_handler(int signal) {
    if (signal == SIGINT && g_cancel != nullptr) {
        g_cancel->cancel();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> [--deep] [--dry-run] [--verbose]\n"
              << "  --deep      Upload to deep archive storage\n"
              << "  --dry-run   List changed files without uploading\n"
              << "  --verbose   Log at debug level\n";
}

int fail(const s3sync::Error& error) {
    spdlog::error("{}", s3sync::to_string(error));
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path config_path;
    bool deep = false;
    bool dry_run = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--deep") {
            deep = true;
        } else if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (config_path.empty() && arg.rfind("-", 0) != 0) {
            config_path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    auto loaded = s3sync::config::load_config(config_path);
    if (loaded.is_error()) {
        return fail(loaded.error());
    }
    auto& config = loaded.value();
    s3sync::config::apply_environment(config);
    if (auto valid = s3sync::config::validate(config); valid.is_error()) {
        return fail(valid.error());
    }

    spdlog::set_level(verbose ? spdlog::level::debug
                              : s3sync::config::parse_log_level(config.log_level).value());
    deep = deep || config.deep_archive;

    auto ledger = s3sync::ledger::SqliteLedger::open(config.ledger_path);
    if (ledger.is_error()) {
        return fail(ledger.error());
    }

    auto store = s3sync::config::make_object_store(config.store);
    if (store.is_error()) {
        return fail(store.error());
    }

    s3sync::events::EventBus event_bus;
    s3sync::events::LoggerComponent logger(event_bus);
    s3sync::events::MetricsComponent metrics(event_bus);

    s3sync::sync::Syncer syncer(s3sync::config::to_sync_options(config), *store.value(), event_bus);

    auto reconciled = syncer.reconcile(*ledger.value());
    if (reconciled.is_error()) {
        return fail(reconciled.error());
    }
    const auto& report = reconciled.value();
    if (report.transfers_kept + report.transfers_completed + report.transfers_abandoned > 0) {
        spdlog::info("Open transfers: {} kept, {} completed, {} abandoned ({} pieces removed)",
                     report.transfers_kept, report.transfers_completed,
                     report.transfers_abandoned, report.pieces_removed);
    }

    s3sync::sync::Inventory inventory(config.filters);
    syncer.exclude_working_files(inventory);
    const auto ledger_relative = config.ledger_path.lexically_relative(config.root);
    if (!ledger_relative.empty() && *ledger_relative.begin() != "..") {
        // Also covers the -wal and -shm companions
        inventory.exclude(ledger_relative.generic_string());
    }

    auto scanned = inventory.scan(config.root);
    if (scanned.is_error()) {
        return fail(scanned.error());
    }

    auto changed = syncer.changed_files(scanned.value(), *ledger.value());
    if (changed.is_error()) {
        return fail(changed.error());
    }

    if (dry_run) {
        for (const auto& path : changed.value()) {
            std::cout << path << "\n";
        }
        spdlog::info("{} of {} files would be uploaded", changed.value().size(), scanned.value().size());
        return 0;
    }

    if (auto manifest = syncer.update_manifest(scanned.value(), *ledger.value()); manifest.is_error()) {
        return fail(manifest.error());
    }

    s3sync::CancellationToken cancel;
    g_cancel = &cancel;
    std::signal(SIGINT, signal_handler);

    auto uploaded = syncer.upload_all(changed.value(), deep, *ledger.value(), cancel);

    std::signal(SIGINT, SIG_DFL);
    g_cancel = nullptr;

    metrics.print_stats();
    if (uploaded.is_error()) {
        return fail(uploaded.error());
    }
    return 0;
}
