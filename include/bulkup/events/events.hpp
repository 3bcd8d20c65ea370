/**
 * @file events.hpp
 * @brief Event types emitted while discovering and uploading a local tree
 *
 * NAMING CONVENTION:
 * Events are past-tense (FileSkippedEvent, FileUploadCompletedEvent) and
 * carry plain values so subscribers never touch workload internals.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bulkup::events {

// ════════════════════════════════════════════════════════
// Discovery Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted for each path left out of the transfer queue
 *
 * WHO EMITS: Discoverer
 * WHO SUBSCRIBES: Logger (warn with reasons), Metrics
 */
struct FileSkippedEvent {
    std::string path;
    std::vector<std::string> reasons;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once a discovery pass has classified every file
 */
struct DiscoveryCompletedEvent {
    std::string root;
    std::size_t pending_files = 0;
    std::size_t skipped_files = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

struct FileUploadStartedEvent {
    std::size_t worker_id = 0;
    std::string file_path;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileUploadCompletedEvent {
    std::size_t worker_id = 0;
    std::string file_path;
    std::string remote_path;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct FileUploadFailedEvent {
    std::size_t worker_id = 0;
    std::string file_path;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a run has drained its queue or stopped early
 *
 * WHO EMITS: ResumableUploadService
 * WHO SUBSCRIBES: Logger (summary), Metrics
 */
struct UploadRunFinishedEvent {
    std::string root;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    std::size_t remaining = 0;
    bool cancelled = false;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace bulkup::events
