#include "bulkup/core/platform.hpp"

#include <cstdlib>
#include <system_error>

namespace bulkup::platform {
namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDirectory = "bulkup";

fs::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return {};
    }
    return fs::path(value);
}

} // namespace

fs::path state_home() {
#ifdef BULKUP_PLATFORM_WINDOWS
    if (auto local = env_path("LOCALAPPDATA"); !local.empty()) {
        return local;
    }
#else
    // XDG requires relative values to be ignored
    if (auto xdg = env_path("XDG_STATE_HOME"); !xdg.empty() && xdg.is_absolute()) {
        return xdg;
    }
    if (auto home = env_path("HOME"); !home.empty()) {
        return home / ".local" / "state";
    }
#endif
    std::error_code ec;
    auto temp = fs::temp_directory_path(ec);
    return ec ? fs::path(".") : temp;
}

fs::path default_uploads_dir() {
    return state_home() / kAppDirectory / "uploads";
}

std::tm utc_tm(std::time_t value) {
    std::tm out{};
#ifdef BULKUP_PLATFORM_WINDOWS
    gmtime_s(&out, &value);
#else
    gmtime_r(&value, &out);
#endif
    return out;
}

std::time_t utc_time_t(std::tm value) {
#ifdef BULKUP_PLATFORM_WINDOWS
    return _mkgmtime(&value);
#else
    return timegm(&value);
#endif
}

} // namespace bulkup::platform
