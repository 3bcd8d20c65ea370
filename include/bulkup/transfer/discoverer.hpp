#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/persistence/store.hpp"
#include "bulkup/transfer/types.hpp"
#include "bulkup/transfer/validator.hpp"
#include "bulkup/transfer/workload.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace bulkup::events {
class EventBus;
}

namespace bulkup::transfer {

struct DiscoveryOptions {
    std::chrono::hours max_resume_age{24 * 30};
    bool warn_skipped = true;
};

struct DiscoveryReport {
    std::filesystem::path root;
    std::vector<CandidateRef> pending;
    std::vector<SkipRecord> skipped;
    std::uint64_t total_bytes = 0;
    Timestamp started_at{};
    Timestamp finished_at{};
};

/**
 * @brief Walks a local root and fills a workload with files that need uploading
 *
 * A file is queued unless it fails validation or the persistence log shows
 * it was uploaded within max_resume_age with identical content. Expired and
 * mismatched records are removed from the log as they are found.
 */
class Discoverer {
public:
    Discoverer(const FileValidator& validator,
               persistence::PersistenceStore& store,
               DiscoveryOptions options = {},
               events::EventBus* bus = nullptr);

    /**
     * @brief One-shot discovery pass; resets the workload first
     *
     * Errors (root missing, root not a directory) are returned before the
     * workload or the log is touched.
     */
    Result<DiscoveryReport> discover(const std::filesystem::path& root, TransferWorkload& workload);

private:
    enum class Classification {
        Pending,
        Skipped
    };

    Classification classify(const CandidateFile& candidate,
                            const std::unordered_map<std::string, persistence::PersistedEntry>& persisted,
                            Timestamp now);

    void skip(TransferWorkload& workload, DiscoveryReport& report, SkipRecord record);

    std::vector<std::filesystem::path> list_files(const std::filesystem::path& root) const;

    const FileValidator& validator_;
    persistence::PersistenceStore& store_;
    DiscoveryOptions options_;
    events::EventBus* bus_ = nullptr;
};

} // namespace bulkup::transfer
