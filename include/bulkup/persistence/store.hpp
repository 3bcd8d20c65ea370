#pragma once

/**
 * @file store.hpp
 * @brief On-disk record of files already uploaded from a local root
 *
 * Each (client, local root) pair owns one JSON Lines log under the uploads
 * directory. A line is written after every confirmed upload; discovery reads
 * the log back to skip files whose content has not changed since.
 *
 * LOG FORMAT (one object per line):
 *   {"resolved_path": "/data/a.csv", "fingerprint": "9f86d0...", "uploaded_at": "2026-01-02T03:04:05.000000Z"}
 *
 * Later lines win over earlier ones for the same path, so save() can append
 * without rewriting. remove() and purges rewrite the whole log through a
 * temporary file.
 *
 * FAILURE POLICY:
 * Nothing here fails a transfer. Unreadable logs, write errors and corrupt
 * lines are logged with spdlog::warn and the store behaves as if the
 * affected records were not there.
 *
 * THREAD SAFETY:
 * Appends and rewrites on one store are serialized by an internal mutex.
 * Two processes must not point at the same root at the same time.
 */

#include "bulkup/core/time.hpp"
#include "bulkup/transfer/candidate.hpp"
#include "bulkup/transfer/fingerprint.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace bulkup::persistence {

struct PersistedEntry {
    std::string resolved_path;
    std::string fingerprint;
    Timestamp uploaded_at{};
};

std::string entry_to_line(const PersistedEntry& entry);

/// Parses one log line; nullopt when it is not a well-formed record
std::optional<PersistedEntry> entry_from_line(const std::string& line);

class PersistenceStore {
public:
    static constexpr const char* kLogSuffix = "_uploads.jsonl";
    static constexpr std::size_t kLogNameHexChars = 16;

    /**
     * @param local_root  transfer root; canonicalized to derive the log name
     * @param uploads_dir directory holding every log (see platform::default_uploads_dir)
     * @param enabled     when false every operation is a no-op
     * @param client_id   optional account scope mixed into the log name
     * @param digest      algorithm used to fingerprint saved files
     */
    PersistenceStore(const std::filesystem::path& local_root,
                     std::filesystem::path uploads_dir,
                     bool enabled = true,
                     std::string client_id = {},
                     std::string digest = transfer::ContentFingerprinter::kDefaultAlgorithm);

    PersistenceStore(const PersistenceStore&) = delete;
    PersistenceStore& operator=(const PersistenceStore&) = delete;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::filesystem::path& log_path() const noexcept { return log_path_; }
    [[nodiscard]] const std::filesystem::path& uploads_dir() const noexcept { return uploads_dir_; }
    [[nodiscard]] const transfer::ContentFingerprinter& fingerprinter() const noexcept { return fingerprinter_; }

    /// Entries keyed by resolved path; empty when disabled or no log exists yet
    std::unordered_map<std::string, PersistedEntry> load() const;

    /// Fingerprints the candidate's current content and appends a record stamped now
    void save(const transfer::CandidateFile& candidate);

    /// Appends a prepared record
    void append(const PersistedEntry& entry);

    /// Drops the record for resolved_path, if any
    void remove(const std::string& resolved_path);

    /// Rewrites log keeping only records whose path is not excluded
    void rewrite_excluding(const std::filesystem::path& log,
                           const std::unordered_set<std::string>& excluded_paths);

    /// Removes records with this fingerprint from every log in uploads_dir(); returns how many
    std::size_t purge_by_fingerprint(const std::string& fingerprint);

    static std::size_t purge_by_fingerprint(const std::filesystem::path& uploads_dir,
                                            const std::string& fingerprint);

    /// "<hex>_uploads.jsonl" for the given root and client scope; hex is a truncated SHA-256
    static Result<std::string> log_name_for(const std::filesystem::path& local_root,
                                              const std::string& client_id = {});

private:
    bool ensure_uploads_dir() const;

    std::filesystem::path uploads_dir_;
    std::filesystem::path log_path_;
    bool enabled_ = true;
    transfer::ContentFingerprinter fingerprinter_;
    mutable std::mutex mutex_;
};

} // namespace bulkup::persistence
