#include "bulkup/persistence/store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <functional>
#include <system_error>
#include <vector>

namespace bulkup::persistence {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool has_log_suffix(const fs::path& path) {
    const std::string name = path.filename().string();
    const std::string suffix = PersistenceStore::kLogSuffix;
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * Rewrites log with the records for which keep() returns true.
 * Corrupt lines are dropped with a warning. Returns the number of
 * well-formed records removed, or nullopt if the log could not be rewritten.
 */
std::optional<std::size_t> rewrite_log(const fs::path& log,
                                       const std::function<bool(const PersistedEntry&)>& keep) {
    std::error_code ec;
    if (!fs::exists(log, ec)) {
        return 0;
    }

    std::ifstream input(log);
    if (!input) {
        spdlog::warn("Failed to open upload log {} for rewrite", log.string());
        return std::nullopt;
    }

    std::vector<std::string> kept;
    std::size_t removed = 0;
    std::size_t line_number = 0;
    std::string line;
    while (std::getline(input, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }
        auto entry = entry_from_line(line);
        if (!entry) {
            spdlog::warn("Dropping malformed record at {}:{}", log.string(), line_number);
            continue;
        }
        if (keep(*entry)) {
            kept.push_back(line);
        } else {
            ++removed;
        }
    }
    if (input.bad()) {
        spdlog::warn("Read error while rewriting upload log {}", log.string());
        return std::nullopt;
    }
    input.close();

    fs::path temp = log;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            spdlog::warn("Failed to create temporary upload log {}", temp.string());
            return std::nullopt;
        }
        for (const auto& record : kept) {
            output << record << '\n';
        }
        output.flush();
        if (!output) {
            spdlog::warn("Failed to write temporary upload log {}", temp.string());
            fs::remove(temp, ec);
            return std::nullopt;
        }
    }

    fs::rename(temp, log, ec);
    if (ec) {
        spdlog::warn("Failed to replace upload log {}: {}", log.string(), ec.message());
        fs::remove(temp, ec);
        return std::nullopt;
    }
    return removed;
}

} // namespace

std::string entry_to_line(const PersistedEntry& entry) {
    json j;
    j["resolved_path"] = entry.resolved_path;
    j["fingerprint"] = entry.fingerprint;
    j["uploaded_at"] = format_timestamp(entry.uploaded_at);
    return j.dump();
}

std::optional<PersistedEntry> entry_from_line(const std::string& line) {
    auto j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto path = j.find("resolved_path");
    auto fingerprint = j.find("fingerprint");
    auto uploaded_at = j.find("uploaded_at");
    if (path == j.end() || !path->is_string() ||
        fingerprint == j.end() || !fingerprint->is_string() ||
        uploaded_at == j.end() || !uploaded_at->is_string()) {
        return std::nullopt;
    }

    auto timestamp = parse_timestamp(uploaded_at->get<std::string>());
    if (!timestamp) {
        return std::nullopt;
    }

    PersistedEntry entry;
    entry.resolved_path = path->get<std::string>();
    entry.fingerprint = fingerprint->get<std::string>();
    entry.uploaded_at = *timestamp;
    if (entry.resolved_path.empty() || entry.fingerprint.empty()) {
        return std::nullopt;
    }
    return entry;
}

PersistenceStore::PersistenceStore(const fs::path& local_root,
                                   fs::path uploads_dir,
                                   bool enabled,
                                   std::string client_id,
                                   std::string digest)
    : uploads_dir_(std::move(uploads_dir)),
      enabled_(enabled),
      fingerprinter_(std::move(digest)) {
    auto name = log_name_for(local_root, client_id);
    if (name.is_error()) {
        spdlog::error("Upload log for {} unavailable, resume disabled: {}",
                      local_root.string(), name.error().message);
        enabled_ = false;
        return;
    }
    log_path_ = uploads_dir_ / name.value();
}

bool PersistenceStore::ensure_uploads_dir() const {
    std::error_code ec;
    fs::create_directories(uploads_dir_, ec);
    if (ec && !fs::is_directory(uploads_dir_)) {
        spdlog::warn("Failed to create uploads directory {}: {}", uploads_dir_.string(), ec.message());
        return false;
    }
    return true;
}

std::unordered_map<std::string, PersistedEntry> PersistenceStore::load() const {
    std::unordered_map<std::string, PersistedEntry> persisted;
    if (!enabled_) {
        return persisted;
    }

    std::lock_guard lock(mutex_);
    std::error_code ec;
    if (!fs::exists(log_path_, ec)) {
        return persisted;
    }

    std::ifstream input(log_path_);
    if (!input) {
        spdlog::warn("Failed to open upload log {}; resuming might be slower", log_path_.string());
        return persisted;
    }

    std::size_t line_number = 0;
    std::string line;
    while (std::getline(input, line)) {
        ++line_number;
        if (is_blank(line)) {
            continue;
        }
        auto entry = entry_from_line(line);
        if (!entry) {
            spdlog::warn("Skipping malformed record at {}:{}", log_path_.string(), line_number);
            continue;
        }
        auto key = entry->resolved_path;
        persisted.insert_or_assign(std::move(key), std::move(*entry));
    }

    spdlog::debug("Loaded {} upload records from {}", persisted.size(), log_path_.string());
    return persisted;
}

void PersistenceStore::save(const transfer::CandidateFile& candidate) {
    if (!enabled_) {
        return;
    }

    auto fingerprint = candidate.fingerprint(fingerprinter_);
    if (fingerprint.is_error()) {
        spdlog::warn("Not recording upload of {}: {}", candidate.resolved_path(), fingerprint.error().message);
        return;
    }

    PersistedEntry entry;
    entry.resolved_path = candidate.resolved_path();
    entry.fingerprint = std::move(fingerprint.value());
    entry.uploaded_at = Clock::now();
    append(entry);
}

void PersistenceStore::append(const PersistedEntry& entry) {
    if (!enabled_) {
        return;
    }

    std::string line;
    try {
        line = entry_to_line(entry);
    } catch (const json::exception& e) {
        // Paths that are not valid UTF-8 cannot be stored as JSON strings
        spdlog::warn("Not recording upload of {}: {}", entry.resolved_path, e.what());
        return;
    }

    std::lock_guard lock(mutex_);
    if (!ensure_uploads_dir()) {
        return;
    }

    std::ofstream output(log_path_, std::ios::app);
    if (!output) {
        spdlog::warn("Failed to open upload log {} for append", log_path_.string());
        return;
    }
    output << line << '\n';
    output.flush();
    if (!output) {
        spdlog::warn("Failed to persist upload record for {}", entry.resolved_path);
    }
}

void PersistenceStore::remove(const std::string& resolved_path) {
    if (!enabled_) {
        return;
    }
    rewrite_excluding(log_path_, {resolved_path});
}

void PersistenceStore::rewrite_excluding(const fs::path& log,
                                         const std::unordered_set<std::string>& excluded_paths) {
    if (!enabled_) {
        return;
    }

    std::lock_guard lock(mutex_);
    auto removed = rewrite_log(log, [&excluded_paths](const PersistedEntry& entry) {
        return excluded_paths.count(entry.resolved_path) == 0;
    });
    if (removed && *removed > 0) {
        spdlog::debug("Removed {} records from {}", *removed, log.string());
    }
}

std::size_t PersistenceStore::purge_by_fingerprint(const std::string& fingerprint) {
    if (!enabled_) {
        return 0;
    }
    std::lock_guard lock(mutex_);
    return purge_by_fingerprint(uploads_dir_, fingerprint);
}

std::size_t PersistenceStore::purge_by_fingerprint(const fs::path& uploads_dir,
                                                   const std::string& fingerprint) {
    std::error_code ec;
    if (!fs::is_directory(uploads_dir, ec)) {
        return 0;
    }

    std::vector<fs::path> logs;
    for (fs::directory_iterator it(uploads_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && has_log_suffix(it->path())) {
            logs.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::warn("Failed to list uploads directory {}: {}", uploads_dir.string(), ec.message());
    }

    std::size_t total_removed = 0;
    for (const auto& log : logs) {
        auto removed = rewrite_log(log, [&fingerprint](const PersistedEntry& entry) {
            return entry.fingerprint != fingerprint;
        });
        if (!removed) {
            spdlog::warn("Failed to purge fingerprint {} from {}", fingerprint, log.string());
            continue;
        }
        total_removed += *removed;
    }

    if (total_removed > 0) {
        spdlog::info("Purged {} upload records with fingerprint {}", total_removed, fingerprint);
    }
    return total_removed;
}

Result<std::string> PersistenceStore::log_name_for(const fs::path& local_root, const std::string& client_id) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::absolute(local_root, ec), ec);
    if (ec) {
        canonical = fs::absolute(local_root, ec).lexically_normal();
    }
    if (!canonical.has_filename() && canonical.has_relative_path()) {
        canonical = canonical.parent_path();
    }

    std::string key = canonical.string();
    if (!client_id.empty()) {
        key = client_id + "\n" + key;
    }

    auto digest = transfer::ContentFingerprinter("sha256").fingerprint_bytes(key);
    if (digest.is_error()) {
        return Err<std::string>(digest.error());
    }
    return Ok(digest.value().substr(0, kLogNameHexChars) + kLogSuffix);
}

} // namespace bulkup::persistence
