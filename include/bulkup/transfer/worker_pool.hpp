#pragma once

#include "bulkup/transfer/transport.hpp"
#include "bulkup/transfer/workload.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>

namespace bulkup::events {
class EventBus;
}

namespace bulkup::transfer {

struct WorkerPoolOptions {
    std::size_t concurrency = 5;
    /// Sleep between polls while other workers still hold in-flight uploads
    std::chrono::milliseconds idle_backoff{10};
};

struct PoolSummary {
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    bool stopped = false;  ///< request_stop() was observed before the queue drained
};

/**
 * @brief Drains a workload with a fixed number of concurrent workers
 *
 * Workers run on a boost::asio::thread_pool owned by run(). Each one loops
 * acquire -> upload -> complete/fail until nothing is pending or in progress.
 */
class WorkerPool {
public:
    WorkerPool(TransferWorkload& workload,
               Transport& transport,
               WorkerPoolOptions options = {},
               events::EventBus* bus = nullptr);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Blocks until every worker has exited
    PoolSummary run();

    /**
     * @brief Graceful shutdown
     *
     * Workers stop acquiring, finish their current upload and exit. Pending
     * candidates stay pending for a later run.
     */
    void request_stop() noexcept { stop_requested_.store(true); }
    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(); }

private:
    void worker_loop(std::size_t worker_id);
    void transfer_one(std::size_t worker_id, const CandidateRef& candidate);

    TransferWorkload& workload_;
    Transport& transport_;
    WorkerPoolOptions options_;
    events::EventBus* bus_ = nullptr;

    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> attempted_{0};
    std::atomic<std::size_t> succeeded_{0};
    std::atomic<std::size_t> failed_{0};
};

} // namespace bulkup::transfer
