#include "bulkup/transfer/workload.hpp"

#include "bulkup/persistence/store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace bulkup::transfer {

TransferWorkload::TransferWorkload(persistence::PersistenceStore* store)
    : store_(store) {}

void TransferWorkload::register_candidate(CandidateRef candidate) {
    if (!candidate) {
        return;
    }
    std::lock_guard lock(mutex_);
    total_bytes_ += candidate->size();
    discovered_.push_back(candidate);
    pending_.push_back(std::move(candidate));
}

void TransferWorkload::add_skipped(SkipRecord record) {
    std::lock_guard lock(mutex_);
    skipped_.push_back(std::move(record));
}

std::optional<CandidateRef> TransferWorkload::acquire_next() {
    std::lock_guard lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    CandidateRef next = std::move(pending_.front());
    pending_.pop_front();
    in_progress_.push_back(next);
    return next;
}

Result<void> TransferWorkload::mark_completed(const Outcome<CompletedTransfer>& outcome) {
    if (outcome.is_error()) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "mark_completed requires a successful outcome: " + outcome.error().message);
    }

    const CompletedTransfer& transfer = outcome.value();
    if (!transfer.candidate) {
        return Err<void>(ErrorCode::InvalidArgument, std::string("Completed transfer has no candidate"));
    }

    {
        std::lock_guard lock(mutex_);
        if (!take_from(in_progress_, transfer.candidate)) {
            spdlog::debug("Ignoring completion of {}: not in progress", transfer.candidate->resolved_path());
            return Ok();
        }
        completed_.push_back(transfer);
        completed_bytes_ += transfer.candidate->size();
    }

    if (store_ != nullptr) {
        store_->save(*transfer.candidate);
    }
    return Ok();
}

void TransferWorkload::mark_failed(const CandidateRef& candidate, std::optional<std::string> reason) {
    if (!candidate) {
        return;
    }
    std::lock_guard lock(mutex_);
    if (!take_from(in_progress_, candidate)) {
        spdlog::debug("Ignoring failure of {}: not in progress", candidate->resolved_path());
        return;
    }
    failed_.push_back(FailureRecord{candidate, std::move(reason)});
}

bool TransferWorkload::has_pending() const {
    std::lock_guard lock(mutex_);
    return !pending_.empty();
}

bool TransferWorkload::has_in_progress() const {
    std::lock_guard lock(mutex_);
    return !in_progress_.empty();
}

std::size_t TransferWorkload::total_files() const {
    std::lock_guard lock(mutex_);
    return discovered_.size();
}

std::uint64_t TransferWorkload::total_bytes() const {
    std::lock_guard lock(mutex_);
    return total_bytes_;
}

std::size_t TransferWorkload::remaining_files() const {
    std::lock_guard lock(mutex_);
    return pending_.size() + in_progress_.size();
}

std::uint64_t TransferWorkload::remaining_bytes() const {
    std::lock_guard lock(mutex_);
    return total_bytes_ > completed_bytes_ ? total_bytes_ - completed_bytes_ : 0;
}

WorkloadCounts TransferWorkload::counts() const {
    std::lock_guard lock(mutex_);
    WorkloadCounts counts;
    counts.discovered = discovered_.size();
    counts.pending = pending_.size();
    counts.in_progress = in_progress_.size();
    counts.completed = completed_.size();
    counts.failed = failed_.size();
    counts.skipped = skipped_.size();
    return counts;
}

void TransferWorkload::reset_progress() {
    std::lock_guard lock(mutex_);
    pending_.assign(discovered_.begin(), discovered_.end());
    in_progress_.clear();
    completed_.clear();
    failed_.clear();
    completed_bytes_ = 0;
}

void TransferWorkload::reset_state() {
    std::lock_guard lock(mutex_);
    discovered_.clear();
    pending_.clear();
    in_progress_.clear();
    completed_.clear();
    failed_.clear();
    skipped_.clear();
    total_bytes_ = 0;
    completed_bytes_ = 0;
    discovery_started_at_.reset();
    discovery_finished_at_.reset();
}

void TransferWorkload::set_discovery_window(Timestamp started_at, Timestamp finished_at) {
    std::lock_guard lock(mutex_);
    discovery_started_at_ = started_at;
    discovery_finished_at_ = finished_at;
}

std::optional<Timestamp> TransferWorkload::discovery_started_at() const {
    std::lock_guard lock(mutex_);
    return discovery_started_at_;
}

std::optional<Timestamp> TransferWorkload::discovery_finished_at() const {
    std::lock_guard lock(mutex_);
    return discovery_finished_at_;
}

std::vector<CandidateRef> TransferWorkload::discovered() const {
    std::lock_guard lock(mutex_);
    return discovered_;
}

std::vector<CandidateRef> TransferWorkload::pending() const {
    std::lock_guard lock(mutex_);
    return {pending_.begin(), pending_.end()};
}

std::vector<CandidateRef> TransferWorkload::in_progress() const {
    std::lock_guard lock(mutex_);
    return in_progress_;
}

std::vector<CompletedTransfer> TransferWorkload::completed() const {
    std::lock_guard lock(mutex_);
    return completed_;
}

std::vector<FailureRecord> TransferWorkload::failed() const {
    std::lock_guard lock(mutex_);
    return failed_;
}

std::vector<SkipRecord> TransferWorkload::skipped() const {
    std::lock_guard lock(mutex_);
    return skipped_;
}

std::string TransferWorkload::progress_line() const {
    const WorkloadCounts c = counts();
    std::ostringstream oss;
    oss << "UP | " << c.completed << " done"
        << " + " << c.failed << " fail"
        << " + " << c.in_progress << " act"
        << " + " << c.skipped << " skpd"
        << " / " << c.discovered << " total";
    return oss.str();
}

std::string TransferWorkload::total_bytes_human() const {
    return format_bytes(total_bytes());
}

std::string TransferWorkload::format_bytes(std::uint64_t bytes) {
    static constexpr const char* kSuffixes[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    constexpr std::size_t kLast = sizeof(kSuffixes) / sizeof(kSuffixes[0]) - 1;

    double size = static_cast<double>(bytes);
    std::size_t index = 0;
    while (size >= 1000.0 && index < kLast) {
        size /= 1000.0;
        ++index;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << ' ' << kSuffixes[index];
    return oss.str();
}

bool TransferWorkload::take_from(std::vector<CandidateRef>& buffer, const CandidateRef& candidate) {
    // Identity, not path: two candidates may resolve to the same file
    auto it = std::find(buffer.begin(), buffer.end(), candidate);
    if (it == buffer.end()) {
        return false;
    }
    buffer.erase(it);
    return true;
}

} // namespace bulkup::transfer
