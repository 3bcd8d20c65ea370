/**
 * @file components.hpp
 * @brief Observers that turn transfer events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * upload_resumable(config, transport, root, &bus);
 * metrics.print_stats();
 */

#pragma once

#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace bulkup::events {

/**
 * @brief Logs every transfer event through spdlog
 *
 * Per-file progress is debug, failures are warnings, discovery and run
 * summaries are info. Skips are reported by the Discoverer itself.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<DiscoveryCompletedEvent>(
            [this](const DiscoveryCompletedEvent& e) { on_discovery_completed(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<FileUploadStartedEvent>(
            [this](const FileUploadStartedEvent& e) { on_upload_started(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<FileUploadCompletedEvent>(
            [this](const FileUploadCompletedEvent& e) { on_upload_completed(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<FileUploadFailedEvent>(
            [this](const FileUploadFailedEvent& e) { on_upload_failed(e); }));
        subscriptions_.push_back(bus.subscribe_scoped<UploadRunFinishedEvent>(
            [this](const UploadRunFinishedEvent& e) { on_run_finished(e); }));
    }

private:
    void on_discovery_completed(const DiscoveryCompletedEvent& e) {
        spdlog::info("[Discovery] root={} pending={} skipped={} bytes={} duration={}ms",
                     e.root, e.pending_files, e.skipped_files, e.total_bytes, e.duration.count());
    }

    void on_upload_started(const FileUploadStartedEvent& e) {
        spdlog::debug("[UploadStarted] worker={} path={} bytes={}", e.worker_id, e.file_path, e.total_bytes);
    }

    void on_upload_completed(const FileUploadCompletedEvent& e) {
        spdlog::debug("[UploadCompleted] worker={} path={} remote={} bytes={} duration={}ms",
                      e.worker_id, e.file_path, e.remote_path, e.total_bytes, e.duration.count());
    }

    void on_upload_failed(const FileUploadFailedEvent& e) {
        spdlog::warn("[UploadFailed] worker={} path={} reason={}", e.worker_id, e.file_path, e.reason);
    }

    void on_run_finished(const UploadRunFinishedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Upload of {} {}", e.root, e.cancelled ? "stopped early" : "finished");
        spdlog::info("  completed={} failed={} skipped={} remaining={} duration={}ms",
                     e.completed, e.failed, e.skipped, e.remaining, e.duration.count());
        spdlog::info("════════════════════════════════════════════");
    }

    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Counts files and bytes moving through the engine
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> files_skipped{0};
        std::atomic<std::uint64_t> discovery_runs{0};
        std::atomic<std::uint64_t> bytes_discovered{0};
        std::atomic<std::uint64_t> uploads_started{0};
        std::atomic<std::uint64_t> files_uploaded{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> runs_finished{0};
        std::atomic<std::uint64_t> runs_cancelled{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<FileSkippedEvent>(
            [this](const FileSkippedEvent&) { stats_.files_skipped++; }));
        subscriptions_.push_back(bus.subscribe_scoped<DiscoveryCompletedEvent>(
            [this](const DiscoveryCompletedEvent& e) {
                stats_.discovery_runs++;
                stats_.bytes_discovered += e.total_bytes;
            }));
        subscriptions_.push_back(bus.subscribe_scoped<FileUploadStartedEvent>(
            [this](const FileUploadStartedEvent&) { stats_.uploads_started++; }));
        subscriptions_.push_back(bus.subscribe_scoped<FileUploadCompletedEvent>(
            [this](const FileUploadCompletedEvent& e) {
                stats_.files_uploaded++;
                stats_.bytes_uploaded += e.total_bytes;
            }));
        subscriptions_.push_back(bus.subscribe_scoped<FileUploadFailedEvent>(
            [this](const FileUploadFailedEvent&) { stats_.uploads_failed++; }));
        subscriptions_.push_back(bus.subscribe_scoped<UploadRunFinishedEvent>(
            [this](const UploadRunFinishedEvent& e) {
                stats_.runs_finished++;
                if (e.cancelled) {
                    stats_.runs_cancelled++;
                }
            }));
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Discovery runs:  {}", stats_.discovery_runs.load());
        spdlog::info("  Bytes found:     {}", stats_.bytes_discovered.load());
        spdlog::info("  Files skipped:   {}", stats_.files_skipped.load());
        spdlog::info("  Uploads started: {}", stats_.uploads_started.load());
        spdlog::info("  Files uploaded:  {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("  Uploads failed:  {}", stats_.uploads_failed.load());
        spdlog::info("  Runs finished:   {}", stats_.runs_finished.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    std::vector<Subscription> subscriptions_;
};

} // namespace bulkup::events
