#include "bulkup/transfer/service.hpp"

#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"
#include "bulkup/persistence/store.hpp"
#include "bulkup/transfer/discoverer.hpp"
#include "bulkup/transfer/worker_pool.hpp"
#include "bulkup/transfer/workload.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <string>

namespace bulkup::transfer {
namespace {

// A stop raised before run() applies to that run; the flag is consumed when it returns
class StopFlagReset {
public:
    explicit StopFlagReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~StopFlagReset() { flag_ = false; }

    StopFlagReset(const StopFlagReset&) = delete;
    StopFlagReset& operator=(const StopFlagReset&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

ResumableUploadService::ResumableUploadService(TransferConfig config,
                                               Transport& transport,
                                               events::EventBus* bus,
                                               std::shared_ptr<const FileValidator> validator)
    : config_(std::move(config)),
      transport_(transport),
      bus_(bus),
      validator_(std::move(validator)) {
    if (!validator_) {
        validator_ = std::make_shared<DefaultFileValidator>(config_.disallowed_media_types);
    }
}

Result<UploadReport> ResumableUploadService::run(const std::filesystem::path& local_root) {
    using namespace std::chrono;
    const auto started = steady_clock::now();
    StopFlagReset reset_stop(stop_requested_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.emplace(next_session_id(), local_root.string());
        if (auto res = session_->start(); res.is_error()) {
            return Err<UploadReport>(res.error());
        }
    }

    auto fail_session = [this](const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto res = session_->mark_failed(error.message); res.is_error()) {
            spdlog::debug("Session {}: {}", session_->session_id(), res.error().message);
        }
    };

    persistence::PersistenceStore store(local_root,
                                        config_.resolved_state_dir(),
                                        config_.persist_state,
                                        config_.client_id,
                                        config_.digest);
    TransferWorkload workload(&store);

    DiscoveryOptions discovery_options;
    discovery_options.max_resume_age = config_.max_resume_age();
    discovery_options.warn_skipped = config_.warn_skipped;
    Discoverer discoverer(*validator_, store, discovery_options, bus_);

    auto discovered = discoverer.discover(local_root, workload);
    if (discovered.is_error()) {
        spdlog::error("Upload of {} not started: {}", local_root.string(), discovered.error().message);
        fail_session(discovered.error());
        return Err<UploadReport>(discovered.error());
    }
    const DiscoveryReport& discovery = discovered.value();

    workload.reset_progress();

    WorkerPoolOptions pool_options;
    pool_options.concurrency = config_.max_concurrent_uploads;
    pool_options.idle_backoff = config_.idle_backoff;
    WorkerPool pool(workload, transport_, pool_options, bus_);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_->update_pending(workload.remaining_files(), workload.remaining_bytes());
        if (auto res = session_->transition_to(SessionState::Transferring); res.is_error()) {
            return Err<UploadReport>(res.error());
        }
        active_pool_ = &pool;
        if (stop_requested_) {
            pool.request_stop();
        }
    }

    if (workload.has_pending()) {
        spdlog::info("Uploading {} files ({}) from {}",
                     workload.remaining_files(), workload.total_bytes_human(), discovery.root.string());
    }

    const PoolSummary summary = pool.run();

    UploadReport report;
    report.root = discovery.root;
    report.completed = workload.completed();
    report.failed = workload.failed();
    report.skipped = workload.skipped();
    report.remaining = workload.pending().size();
    report.total_bytes = workload.total_bytes();
    report.discovery_started_at = discovery.started_at;
    report.discovery_finished_at = discovery.finished_at;
    report.cancelled = summary.stopped || (stop_requested_ && report.remaining > 0);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_pool_ = nullptr;
        session_->update_pending(workload.remaining_files(), workload.remaining_bytes());
        const SessionState final_state = report.cancelled ? SessionState::Cancelled : SessionState::Complete;
        if (auto res = session_->transition_to(final_state); res.is_error()) {
            spdlog::error("Session {}: {}", session_->session_id(), res.error().message);
        }
    }

    spdlog::info(workload.progress_line());

    if (bus_ != nullptr) {
        bus_->emit(events::UploadRunFinishedEvent{
            report.root.string(),
            report.completed.size(),
            report.failed.size(),
            report.skipped.size(),
            report.remaining,
            report.cancelled,
            duration_cast<milliseconds>(steady_clock::now() - started)});
    }

    return Ok(std::move(report));
}

void ResumableUploadService::request_stop() {
    stop_requested_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_pool_ != nullptr) {
        active_pool_->request_stop();
    }
}

std::optional<UploadSessionInfo> ResumableUploadService::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->info();
}

std::string ResumableUploadService::next_session_id() {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "upload-" + std::to_string(epoch_ms) + "-" + std::to_string(++session_counter_);
}

Result<UploadReport> upload_resumable(const TransferConfig& config,
                                      Transport& transport,
                                      const std::filesystem::path& local_root,
                                      events::EventBus* bus) {
    ResumableUploadService service(config, transport, bus);
    return service.run(local_root);
}

} // namespace bulkup::transfer
