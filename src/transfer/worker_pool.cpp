#include "bulkup/transfer/worker_pool.hpp"

#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <optional>
#include <thread>

namespace bulkup::transfer {

namespace asio = boost::asio;

WorkerPool::WorkerPool(TransferWorkload& workload,
                       Transport& transport,
                       WorkerPoolOptions options,
                       events::EventBus* bus)
    : workload_(workload), transport_(transport), options_(options), bus_(bus) {
    options_.concurrency = std::max<std::size_t>(options_.concurrency, 1);
}

PoolSummary WorkerPool::run() {
    attempted_ = 0;
    succeeded_ = 0;
    failed_ = 0;

    spdlog::debug("Starting {} upload workers for {} files",
                  options_.concurrency, workload_.remaining_files());

    asio::thread_pool pool(options_.concurrency);
    for (std::size_t worker_id = 0; worker_id < options_.concurrency; ++worker_id) {
        asio::post(pool, [this, worker_id]() { worker_loop(worker_id); });
    }
    pool.join();

    PoolSummary summary;
    summary.attempted = attempted_.load();
    summary.succeeded = succeeded_.load();
    summary.failed = failed_.load();
    summary.stopped = stop_requested() && workload_.has_pending();
    return summary;
}

void WorkerPool::worker_loop(std::size_t worker_id) {
    while (!stop_requested()) {
        auto next = workload_.acquire_next();
        if (!next) {
            if (!workload_.has_in_progress()) {
                break;
            }
            // Another worker may still fail or finish; nothing is requeued, so this ends
            std::this_thread::sleep_for(options_.idle_backoff);
            continue;
        }
        transfer_one(worker_id, *next);
    }
    spdlog::debug("Worker {} exiting", worker_id);
}

void WorkerPool::transfer_one(std::size_t worker_id, const CandidateRef& candidate) {
    using namespace std::chrono;
    attempted_++;
    const auto started = steady_clock::now();
    const std::string path = candidate->resolved_path();

    if (bus_ != nullptr) {
        bus_->emit(events::FileUploadStartedEvent{worker_id, path, candidate->size()});
    }

    std::optional<Outcome<TransferReceipt>> outcome;
    try {
        outcome.emplace(transport_.upload(*candidate));
    } catch (const std::exception& e) {
        outcome.emplace(Err<TransferReceipt>(ErrorCode::RemoteService, std::string("Transport threw: ") + e.what()));
    }

    if (outcome->is_error()) {
        const std::string& reason = outcome->error().message;
        spdlog::warn("Worker {}: upload of {} failed: {}", worker_id, path, reason);
        workload_.mark_failed(candidate, reason);
        failed_++;
        if (bus_ != nullptr) {
            bus_->emit(events::FileUploadFailedEvent{worker_id, path, reason});
        }
        return;
    }

    CompletedTransfer transfer{candidate, outcome->value(), Clock::now()};
    const std::string remote_path = transfer.receipt.remote_path;
    auto marked = workload_.mark_completed(Ok(std::move(transfer)));
    if (marked.is_error()) {
        spdlog::error("Worker {}: could not record completion of {}: {}", worker_id, path, marked.error().message);
        return;
    }
    succeeded_++;

    if (bus_ != nullptr) {
        bus_->emit(events::FileUploadCompletedEvent{
            worker_id,
            path,
            remote_path,
            candidate->size(),
            duration_cast<milliseconds>(steady_clock::now() - started)});
    }
}

} // namespace bulkup::transfer
