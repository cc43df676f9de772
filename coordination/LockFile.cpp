#include "LockFile.hpp"
#include "transport/socket/posix/PosixErrnoCompat.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace coordination {

LockFile::~LockFile() {
    close();
}

LockFile::LockFile(LockFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      locked_(std::exchange(other.locked_, false)),
      path_(std::move(other.path_)) {}

LockFile& LockFile::operator=(LockFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        locked_ = std::exchange(other.locked_, false);
        path_ = std::move(other.path_);
    }
    return *this;
}

bool LockFile::open(const std::filesystem::path& path, std::error_code& error) {
    error.clear();
    close();
    int fd;
    do {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        error = PosixErrnoCompat::last_error();
        return false;
    }
    fd_ = fd;
    path_ = path;
    return true;
}

bool LockFile::try_lock_exclusive(std::error_code& error) {
    error.clear();
    if (fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    int rc;
    do {
        rc = ::flock(fd_, LOCK_EX | LOCK_NB);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        error = PosixErrnoCompat::last_error();
        return false;
    }
    locked_ = true;
    return true;
}

void LockFile::close() noexcept {
    if (fd_ < 0) return;
    // Closing the only descriptor drops the flock; no explicit LOCK_UN needed
    ::close(fd_);
    fd_ = -1;
    locked_ = false;
}

} // namespace coordination
