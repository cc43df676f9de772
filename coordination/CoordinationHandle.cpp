#include "CoordinationHandle.hpp"

#include <unistd.h>

namespace coordination {

CoordinationHandle::CoordinationHandle(PrivateTag, InstanceRole role, std::unique_ptr<transport::PosixSocket> socket,
                                       std::optional<std::filesystem::path> cleanup_path, LockFile lock)
    : role_(role), socket_(std::move(socket)), cleanup_path_(std::move(cleanup_path)),
      lock_(std::move(lock)), owner_pid_(::getpid()) {
    if (socket_) {
        endpoint_ = role_ == InstanceRole::Primary ? socket_->local_endpoint() : socket_->remote_endpoint();
    }
}

std::unique_ptr<CoordinationHandle> CoordinationHandle::primary(std::unique_ptr<transport::PosixSocket> listener,
                                                                std::optional<std::filesystem::path> cleanup_path,
                                                                LockFile lock) {
    return std::make_unique<CoordinationHandle>(PrivateTag{}, InstanceRole::Primary, std::move(listener),
                                                std::move(cleanup_path), std::move(lock));
}

std::unique_ptr<CoordinationHandle> CoordinationHandle::secondary(std::unique_ptr<transport::PosixSocket> connection) {
    return std::make_unique<CoordinationHandle>(PrivateTag{}, InstanceRole::Secondary, std::move(connection),
                                                std::nullopt, LockFile{});
}

CoordinationHandle::~CoordinationHandle() {
    release();
}

std::string CoordinationHandle::endpoint() const {
    return endpoint_;
}

int CoordinationHandle::native_handle() const noexcept {
    return socket_ ? socket_->get_handle() : -1;
}

std::shared_ptr<ISocketLifecycle> CoordinationHandle::accept(std::error_code& error,
                                                             std::chrono::milliseconds timeout) {
    if (released_ || !socket_ || role_ != InstanceRole::Primary) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return nullptr;
    }
    return socket_->blocking_accept(error, timeout);
}

void CoordinationHandle::release() noexcept {
    if (released_) return;
    released_ = true;

    if (socket_) socket_->close();

    if (cleanup_path_ && owner_pid_ == ::getpid()) {
        std::error_code ignored;
        std::filesystem::remove(*cleanup_path_, ignored);
    }

    lock_.close();
}

} // namespace coordination
