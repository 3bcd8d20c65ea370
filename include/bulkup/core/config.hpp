#pragma once

#include "bulkup/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace bulkup {

/**
 * @brief Tunables for one resumable upload run
 *
 * Defaults match what a fresh install uses; every field can be overridden
 * from a JSON file with the same key names (idle_backoff is spelled
 * idle_backoff_ms there).
 */
struct TransferConfig {
    static constexpr std::size_t kDefaultConcurrency = 5;
    static constexpr int kDefaultMaxResumeAgeDays = 30;
    static constexpr int kMaxResumeAgeDays = 36500;

    std::size_t max_concurrent_uploads = kDefaultConcurrency;
    bool persist_state = true;
    int max_resume_age_days = kDefaultMaxResumeAgeDays;
    std::filesystem::path state_dir;  ///< Empty means platform::default_uploads_dir()
    std::string client_id;            ///< Scopes upload logs when several accounts share a root
    bool warn_skipped = true;
    std::string digest = "sha256";    ///< Any OpenSSL EVP digest name
    std::chrono::milliseconds idle_backoff{10};
    std::vector<std::string> disallowed_media_types = default_disallowed_media_types();
    std::string log_level = "info";

    static std::vector<std::string> default_disallowed_media_types();

    /// Uploads directory after applying the platform default
    std::filesystem::path resolved_state_dir() const;

    std::chrono::hours max_resume_age() const {
        return std::chrono::hours(24) * max_resume_age_days;
    }
};

Result<TransferConfig> config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const TransferConfig& config);
Result<TransferConfig> load_config(const std::filesystem::path& path);

} // namespace bulkup
