#include "bulkup/core/config.hpp"

#include "bulkup/core/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>

namespace bulkup {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 7> kLogLevels{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

Result<void> type_error(const std::string& key, const char* expected) {
    return Err<void>(ErrorCode::InvalidArgument,
                     "Config key '" + key + "' must be " + expected);
}

template<typename T>
Result<void> read_field(const json& j, const std::string& key, T& out, const char* expected) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok();
    }
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        return type_error(key, expected);
    }
    return Ok();
}

} // namespace

std::vector<std::string> TransferConfig::default_disallowed_media_types() {
    return {
        "application/octet-stream",
        "application/x-msdownload",
        "application/x-msdos-program",
        "application/x-msi",
    };
}

fs::path TransferConfig::resolved_state_dir() const {
    return state_dir.empty() ? platform::default_uploads_dir() : state_dir;
}

Result<TransferConfig> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument, "Config root must be a JSON object");
    }

    TransferConfig config;
    std::string state_dir;
    std::int64_t concurrency = static_cast<std::int64_t>(config.max_concurrent_uploads);
    std::int64_t backoff_ms = config.idle_backoff.count();

    const Result<void> reads[] = {
        read_field(j, "max_concurrent_uploads", concurrency, "an integer"),
        read_field(j, "persist_state", config.persist_state, "a boolean"),
        read_field(j, "max_resume_age_days", config.max_resume_age_days, "an integer"),
        read_field(j, "state_dir", state_dir, "a string"),
        read_field(j, "client_id", config.client_id, "a string"),
        read_field(j, "warn_skipped", config.warn_skipped, "a boolean"),
        read_field(j, "digest", config.digest, "a string"),
        read_field(j, "idle_backoff_ms", backoff_ms, "an integer"),
        read_field(j, "disallowed_media_types", config.disallowed_media_types, "an array of strings"),
        read_field(j, "log_level", config.log_level, "a string"),
    };
    for (const auto& read : reads) {
        if (read.is_error()) {
            return Err<TransferConfig>(read.error());
        }
    }

    if (concurrency < 1) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument, "max_concurrent_uploads must be >= 1");
    }
    if (config.max_resume_age_days < 0 || config.max_resume_age_days > TransferConfig::kMaxResumeAgeDays) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument,
                                   "max_resume_age_days must be between 0 and " +
                                   std::to_string(TransferConfig::kMaxResumeAgeDays));
    }
    if (backoff_ms < 0) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument, "idle_backoff_ms must be >= 0");
    }
    if (config.digest.empty()) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument, "digest must not be empty");
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), config.log_level) == kLogLevels.end()) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument, "Unknown log_level: " + config.log_level);
    }

    config.max_concurrent_uploads = static_cast<std::size_t>(concurrency);
    config.idle_backoff = std::chrono::milliseconds(backoff_ms);
    config.state_dir = state_dir;
    return Ok(std::move(config));
}

json config_to_json(const TransferConfig& config) {
    json j;
    j["max_concurrent_uploads"] = config.max_concurrent_uploads;
    j["persist_state"] = config.persist_state;
    j["max_resume_age_days"] = config.max_resume_age_days;
    j["state_dir"] = config.state_dir.string();
    j["client_id"] = config.client_id;
    j["warn_skipped"] = config.warn_skipped;
    j["digest"] = config.digest;
    j["idle_backoff_ms"] = config.idle_backoff.count();
    j["disallowed_media_types"] = config.disallowed_media_types;
    j["log_level"] = config.log_level;
    return j;
}

Result<TransferConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<TransferConfig>(ErrorCode::Io, "Failed to open config file: " + path.string());
    }

    auto parsed = json::parse(input, nullptr, false);
    if (parsed.is_discarded()) {
        return Err<TransferConfig>(ErrorCode::Parse, "Config file is not valid JSON: " + path.string());
    }

    auto result = config_from_json(parsed);
    if (result.is_ok()) {
        spdlog::debug("Loaded config from {}", path.string());
    }
    return result;
}

} // namespace bulkup
