/**
 * \file LockFile.hpp
 * \brief Owning descriptor for an advisory lock file.
 * \ingroup coordination
 */
#pragma once

#include <filesystem>
#include <system_error>

namespace coordination {

/** \brief Move-only owner of a lock-file descriptor.
 *  \ingroup coordination
 *  \details Uses whole-file `flock()` locks, which belong to the open file
 *  description: two opens of the same path conflict even inside one process, and
 *  the lock disappears with the last descriptor (including on a crash). Closing
 *  releases the lock but never unlinks the file.
 */
class LockFile {
public:
    LockFile() = default;
    ~LockFile();

    LockFile(LockFile&& other) noexcept;
    LockFile& operator=(LockFile&& other) noexcept;
    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;

    /** \brief Open \p path write-only, creating and truncating it, close-on-exec. */
    bool open(const std::filesystem::path& path, std::error_code& error);

    /** \brief Non-blocking exclusive lock; EWOULDBLOCK means another holder. */
    bool try_lock_exclusive(std::error_code& error);

    /** \brief Release the lock and close the descriptor; idempotent. */
    void close() noexcept;

    bool is_open() const noexcept { return fd_ >= 0; }
    bool is_locked() const noexcept { return locked_; }
    int get_handle() const noexcept { return fd_; }
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    int fd_ = -1;
    bool locked_ = false;
    std::filesystem::path path_;
};

} // namespace coordination
