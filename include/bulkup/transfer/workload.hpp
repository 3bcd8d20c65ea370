#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/transfer/types.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bulkup::persistence {
class PersistenceStore;
}

namespace bulkup::transfer {

/**
 * @brief Queue state of one discovery-to-completion run
 *
 * Every discovered candidate sits in exactly one of pending, in-progress,
 * completed or failed. Skipped paths are kept separately and never queued.
 *
 * THREAD SAFETY:
 * All mutations and queries share one mutex. acquire_next() is the critical
 * operation: concurrent callers never receive the same candidate.
 * Persistence write-through happens after the lock is released.
 */
class TransferWorkload {
public:
    explicit TransferWorkload(persistence::PersistenceStore* store = nullptr);

    TransferWorkload(const TransferWorkload&) = delete;
    TransferWorkload& operator=(const TransferWorkload&) = delete;

    void register_candidate(CandidateRef candidate);
    void add_skipped(SkipRecord record);

    /// Moves the head of pending into in-progress; nullopt when pending is empty
    std::optional<CandidateRef> acquire_next();

    /**
     * @brief Records a successful transfer and writes it through to persistence
     *
     * Rejects error outcomes. Completing a candidate that is not in progress
     * (already completed, failed, or never acquired) changes nothing.
     */
    Result<void> mark_completed(const Outcome<CompletedTransfer>& outcome);

    /// Moves an in-progress candidate to failed; no-op for any other candidate
    void mark_failed(const CandidateRef& candidate, std::optional<std::string> reason);

    bool has_pending() const;
    bool has_in_progress() const;

    std::size_t total_files() const;
    std::uint64_t total_bytes() const;
    std::size_t remaining_files() const;
    std::uint64_t remaining_bytes() const;
    WorkloadCounts counts() const;

    /// Pending := discovered, runtime buffers cleared
    void reset_progress();
    /// Clears everything, including skipped records and total_bytes
    void reset_state();

    void set_discovery_window(Timestamp started_at, Timestamp finished_at);
    std::optional<Timestamp> discovery_started_at() const;
    std::optional<Timestamp> discovery_finished_at() const;

    std::vector<CandidateRef> discovered() const;
    std::vector<CandidateRef> pending() const;
    std::vector<CandidateRef> in_progress() const;
    std::vector<CompletedTransfer> completed() const;
    std::vector<FailureRecord> failed() const;
    std::vector<SkipRecord> skipped() const;

    /// e.g. "UP | 3 done + 1 fail + 2 act + 4 skpd / 10 total"
    std::string progress_line() const;

    /// Human-readable SI size of total_bytes(), e.g. "1.50 MB"
    std::string total_bytes_human() const;

    static std::string format_bytes(std::uint64_t bytes);

private:
    static bool take_from(std::vector<CandidateRef>& buffer, const CandidateRef& candidate);

    persistence::PersistenceStore* store_ = nullptr;

    mutable std::mutex mutex_;
    std::vector<CandidateRef> discovered_;
    std::deque<CandidateRef> pending_;
    std::vector<CandidateRef> in_progress_;
    std::vector<CompletedTransfer> completed_;
    std::vector<FailureRecord> failed_;
    std::vector<SkipRecord> skipped_;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t completed_bytes_ = 0;
    std::optional<Timestamp> discovery_started_at_;
    std::optional<Timestamp> discovery_finished_at_;
};

} // namespace bulkup::transfer
