#include "processUtils.hpp"

#include <cstdlib>
#include <limits.h>
#include <pwd.h>
#include <system_error>
#include <unistd.h>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

std::uint32_t ProcessUtils::get_effective_uid() {
    return static_cast<std::uint32_t>(::geteuid());
}

#if defined(__linux__)
std::filesystem::path ProcessUtils::get_executable_path_impl() {
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len != -1) {
        buffer[len] = '\0';
        return std::filesystem::path(buffer);
    }
    return std::filesystem::current_path();
}
#elif defined(__APPLE__)
std::filesystem::path ProcessUtils::get_executable_path_impl() {
    char buffer[PATH_MAX];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        return std::filesystem::path(buffer);
    }
    return std::filesystem::current_path();
}
#else
std::filesystem::path ProcessUtils::get_executable_path_impl() {
    return std::filesystem::current_path();
}
#endif

std::filesystem::path ProcessUtils::get_executable_path() {
    static std::filesystem::path cached_path = get_executable_path_impl();
    return cached_path;
}

std::optional<std::filesystem::path> ProcessUtils::get_home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home);
    }
    long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(hint > 0 ? static_cast<size_t>(hint) : 16384);
    struct passwd pwd {};
    struct passwd* result = nullptr;
    if (::getpwuid_r(::geteuid(), &pwd, buf.data(), buf.size(), &result) == 0 && result && result->pw_dir) {
        return std::filesystem::path(result->pw_dir);
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> ProcessUtils::get_temp_dir() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec || dir.empty()) return std::nullopt;
    return dir;
}

std::optional<std::filesystem::path> ProcessUtils::get_user_cache_dir() {
#if defined(__APPLE__)
    auto home = get_home_dir();
    if (!home) return std::nullopt;
    return *home / "Library" / "Caches";
#else
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg && xdg[0] == '/') {
        return std::filesystem::path(xdg);
    }
    auto home = get_home_dir();
    if (!home) return std::nullopt;
    return *home / ".cache";
#endif
}

bool ProcessUtils::is_accessible_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || ec) return false;
    return ::access(dir.c_str(), W_OK | R_OK | X_OK) == 0;
}
