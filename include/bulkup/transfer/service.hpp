#pragma once

#include "bulkup/core/config.hpp"
#include "bulkup/core/result.hpp"
#include "bulkup/transfer/session.hpp"
#include "bulkup/transfer/transport.hpp"
#include "bulkup/transfer/types.hpp"
#include "bulkup/transfer/validator.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace bulkup::events {
class EventBus;
}

namespace bulkup::transfer {

class WorkerPool;

/**
 * @brief Outcome of one call to ResumableUploadService::run()
 */
struct UploadReport {
    std::filesystem::path root;
    std::vector<CompletedTransfer> completed;
    std::vector<FailureRecord> failed;
    std::vector<SkipRecord> skipped;
    std::size_t remaining = 0;       ///< Still pending when the run stopped early
    std::uint64_t total_bytes = 0;
    Timestamp discovery_started_at{};
    Timestamp discovery_finished_at{};
    bool cancelled = false;

    [[nodiscard]] bool all_succeeded() const noexcept { return failed.empty() && remaining == 0; }
};

/**
 * @brief Uploads every new or changed file under a local root
 *
 * One run: open the root's persistence log, discover, drain the queue with
 * the worker pool, report. Running again on the same root only uploads
 * what failed, what changed and what the previous run never reached.
 *
 * run() is not reentrant. request_stop() may be called from any thread
 * but takes a lock, so it must not be called from a raw signal handler.
 */
class ResumableUploadService {
public:
    ResumableUploadService(TransferConfig config,
                           Transport& transport,
                           events::EventBus* bus = nullptr,
                           std::shared_ptr<const FileValidator> validator = nullptr);

    ResumableUploadService(const ResumableUploadService&) = delete;
    ResumableUploadService& operator=(const ResumableUploadService&) = delete;

    /**
     * @brief Discovers and uploads everything under local_root
     *
     * Only setup problems (missing root, root not a directory) are returned
     * as errors. Per-file failures are reported in UploadReport::failed.
     */
    Result<UploadReport> run(const std::filesystem::path& local_root);

    /// Stops the active run after in-flight uploads finish. A stop requested
    /// before run() starts makes the next run upload nothing.
    void request_stop();

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

    /// Lifecycle of the most recent run; nullopt before the first one
    [[nodiscard]] std::optional<UploadSessionInfo> session() const;

private:
    std::string next_session_id();

    TransferConfig config_;
    Transport& transport_;
    events::EventBus* bus_ = nullptr;
    std::shared_ptr<const FileValidator> validator_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<std::uint64_t> session_counter_{0};

    mutable std::mutex mutex_;
    WorkerPool* active_pool_ = nullptr;
    std::optional<UploadSession> session_;
};

/**
 * @brief Convenience wrapper for a single run with a fresh service
 */
Result<UploadReport> upload_resumable(const TransferConfig& config,
                                      Transport& transport,
                                      const std::filesystem::path& local_root,
                                      events::EventBus* bus = nullptr);

} // namespace bulkup::transfer
