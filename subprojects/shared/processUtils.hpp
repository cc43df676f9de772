#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// Queries about the running process and the user it runs as.
// POSIX only; every lookup is best-effort and reports absence via std::optional.
class ProcessUtils {
public:
    // Effective user id (what the kernel checks permissions against)
    static std::uint32_t get_effective_uid();

    // Process path functionality
    static std::filesystem::path get_executable_path();

    // $HOME, falling back to the password database entry of the effective user
    static std::optional<std::filesystem::path> get_home_dir();

    // TMPDIR/TMP/TEMP/TEMPDIR or /tmp, as std::filesystem::temp_directory_path() resolves it
    static std::optional<std::filesystem::path> get_temp_dir();

    // Per-user cache directory (~/Library/Caches on macOS, $XDG_CACHE_HOME or ~/.cache elsewhere)
    static std::optional<std::filesystem::path> get_user_cache_dir();

    // True if `dir` is a directory the process can list, create entries in and traverse
    static bool is_accessible_dir(const std::filesystem::path& dir);

private:
    static std::filesystem::path get_executable_path_impl();
};
