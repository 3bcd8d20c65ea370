#pragma once

#include <ctime>
#include <filesystem>

#ifdef _WIN32
    #define BULKUP_PLATFORM_WINDOWS
#else
    #define BULKUP_PLATFORM_LINUX
#endif

namespace bulkup::platform {

enum class Platform {
    Windows,
    Linux,
    Unknown
};

inline Platform get_platform() {
#ifdef BULKUP_PLATFORM_WINDOWS
    return Platform::Windows;
#elif defined(BULKUP_PLATFORM_LINUX)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

inline const char* platform_name() {
    switch (get_platform()) {
        case Platform::Windows: return "Windows";
        case Platform::Linux: return "Linux";
        default: return "Unknown";
    }
}

/**
 * @brief Per-user directory for application state
 *
 * $XDG_STATE_HOME when set and absolute, otherwise ~/.local/state.
 * On Windows %LOCALAPPDATA%. Falls back to the temp directory when no
 * home can be determined.
 */
std::filesystem::path state_home();

/**
 * @brief Directory holding the upload logs of every transfer root
 */
std::filesystem::path default_uploads_dir();

/// Thread-safe gmtime
std::tm utc_tm(std::time_t value);

/// Inverse of utc_tm (timegm/_mkgmtime)
std::time_t utc_time_t(std::tm value);

} // namespace bulkup::platform
