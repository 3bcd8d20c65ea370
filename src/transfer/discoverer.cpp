#include "bulkup/transfer/discoverer.hpp"

#include "bulkup/events/event_bus.hpp"
#include "bulkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace bulkup::transfer {
namespace fs = std::filesystem;
using persistence::PersistedEntry;

Discoverer::Discoverer(const FileValidator& validator,
                       persistence::PersistenceStore& store,
                       DiscoveryOptions options,
                       events::EventBus* bus)
    : validator_(validator), store_(store), options_(options), bus_(bus) {}

Result<DiscoveryReport> Discoverer::discover(const fs::path& root, TransferWorkload& workload) {
    std::error_code ec;
    fs::path resolved_root = fs::absolute(root, ec);
    if (!ec) {
        resolved_root = fs::weakly_canonical(resolved_root, ec);
    }
    if (ec || !fs::exists(resolved_root, ec)) {
        return Err<DiscoveryReport>(ErrorCode::RootNotFound, "Upload root not found: '" + root.string() + "'");
    }
    if (!fs::is_directory(resolved_root, ec)) {
        return Err<DiscoveryReport>(ErrorCode::NotADirectory,
                                    "Upload root is not a directory: '" + resolved_root.string() + "'");
    }

    workload.reset_state();

    DiscoveryReport report;
    report.root = resolved_root;
    report.started_at = Clock::now();

    const auto persisted = store_.load();

    for (const auto& path : list_files(resolved_root)) {
        auto built = build_candidate(resolved_root, path);
        if (built.is_error()) {
            skip(workload, report, SkipRecord{path, {built.error().message}});
            continue;
        }
        const CandidateRef& candidate = built.value();

        auto verdict = validator_.validate(*candidate);
        if (!verdict.valid) {
            skip(workload, report, SkipRecord{path, std::move(verdict.reasons)});
            continue;
        }

        if (classify(*candidate, persisted, report.started_at) == Classification::Skipped) {
            skip(workload, report, SkipRecord{path, {kAlreadyUploadedReason}});
            continue;
        }

        report.total_bytes += candidate->size();
        report.pending.push_back(candidate);
        workload.register_candidate(candidate);
    }

    report.finished_at = Clock::now();
    workload.set_discovery_window(report.started_at, report.finished_at);

    spdlog::info("Prepared upload workload with {} files ({})",
                 report.pending.size(), TransferWorkload::format_bytes(report.total_bytes));
    if (!report.skipped.empty()) {
        spdlog::warn("Skipped {} paths during discovery", report.skipped.size());
    }

    if (bus_ != nullptr) {
        using namespace std::chrono;
        bus_->emit(events::DiscoveryCompletedEvent{
            resolved_root.string(),
            report.pending.size(),
            report.skipped.size(),
            report.total_bytes,
            duration_cast<milliseconds>(report.finished_at - report.started_at)});
    }

    return Ok(std::move(report));
}

Discoverer::Classification Discoverer::classify(const CandidateFile& candidate,
                                                const std::unordered_map<std::string, PersistedEntry>& persisted,
                                                Timestamp now) {
    const std::string key = candidate.resolved_path();
    auto it = persisted.find(key);
    if (it == persisted.end()) {
        return Classification::Pending;
    }

    const PersistedEntry& entry = it->second;
    if (std::chrono::duration_cast<std::chrono::hours>(now - entry.uploaded_at) > options_.max_resume_age) {
        spdlog::debug("Upload record for {} expired; uploading again", key);
        store_.remove(key);
        return Classification::Pending;
    }

    auto current = candidate.fingerprint(store_.fingerprinter());
    if (current.is_ok() && current.value() == entry.fingerprint) {
        spdlog::debug("Skipping already uploaded: '{}' ({})", candidate.name(), entry.fingerprint);
        return Classification::Skipped;
    }

    if (current.is_error()) {
        spdlog::warn("Cannot fingerprint {}: {}", key, current.error().message);
    } else {
        spdlog::debug("Content of {} changed since last upload", key);
    }
    store_.remove(key);
    return Classification::Pending;
}

void Discoverer::skip(TransferWorkload& workload, DiscoveryReport& report, SkipRecord record) {
    const bool already_uploaded =
        record.reasons.size() == 1 && record.reasons.front() == kAlreadyUploadedReason;
    const auto level = (options_.warn_skipped && !already_uploaded) ? spdlog::level::warn : spdlog::level::debug;
    spdlog::log(level, "Skipping {}:", record.path.string());
    for (const auto& reason : record.reasons) {
        spdlog::log(level, "  - {}", reason);
    }

    if (bus_ != nullptr) {
        bus_->emit(events::FileSkippedEvent{record.path.string(), record.reasons});
    }
    report.skipped.push_back(record);
    workload.add_skipped(std::move(record));
}

std::vector<fs::path> Discoverer::list_files(const fs::path& root) const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;

    while (!ec && it != end) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
        it.increment(ec);
    }
    if (ec) {
        // Files listed before the error are still processed
        spdlog::warn("Failed to walk {}: {}", root.string(), ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace bulkup::transfer
