/**
 * \file PosixSocket.cpp
 * \brief Implementation of the BSD-socket backend.
 * \ingroup socket_backend
 */
#include "PosixSocket.hpp"
#include "PosixErrnoCompat.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace transport {

namespace {

int native_family(AddressFamily family) {
    switch (family) {
        case AddressFamily::Unix:  return AF_UNIX;
        case AddressFamily::TcpV4: return AF_INET;
        case AddressFamily::TcpV6: return AF_INET6;
    }
    return AF_UNSPEC;
}

/** \brief Fill \p storage for \p address.
 *  \details Abstract names are written after a leading NUL byte and the length covers
 *  exactly the name (no terminator), which is how the kernel distinguishes them.
 */
bool to_native(const EndpointAddress& address, sockaddr_storage& storage, socklen_t& length,
               std::error_code& error) {
    std::memset(&storage, 0, sizeof(storage));

    if (const auto* u = address.as_unix()) {
        auto* sun = reinterpret_cast<sockaddr_un*>(&storage);
        sun->sun_family = AF_UNIX;
        const size_t capacity = sizeof(sun->sun_path);
        if (u->is_abstract) {
            if (u->name.size() + 1 > capacity) {
                error = std::make_error_code(std::errc::filename_too_long);
                return false;
            }
            sun->sun_path[0] = '\0';
            std::memcpy(sun->sun_path + 1, u->name.data(), u->name.size());
            length = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + u->name.size());
        } else {
            if (u->name.size() + 1 > capacity) {
                error = std::make_error_code(std::errc::filename_too_long);
                return false;
            }
            std::memcpy(sun->sun_path, u->name.data(), u->name.size());
            length = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + u->name.size() + 1);
        }
        return true;
    }

    const auto* t = address.as_tcp();
    addrinfo hints{};
    hints.ai_family = native_family(address.family());
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV | (t->host.empty() ? AI_PASSIVE : 0);
    addrinfo* result = nullptr;
    const std::string port = std::to_string(t->port);
    int rc = ::getaddrinfo(t->host.empty() ? nullptr : t->host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        error = rc == EAI_SYSTEM ? PosixErrnoCompat::last_error()
                                 : std::make_error_code(std::errc::address_not_available);
        if (result) ::freeaddrinfo(result);
        return false;
    }
    std::memcpy(&storage, result->ai_addr, result->ai_addrlen);
    length = static_cast<socklen_t>(result->ai_addrlen);
    ::freeaddrinfo(result);
    return true;
}

/** \brief Render a peer address in address-spec form; empty for unnamed Unix peers. */
std::string from_native(const sockaddr_storage& storage, socklen_t length) {
    char host[INET6_ADDRSTRLEN] = {};
    switch (storage.ss_family) {
        case AF_UNIX: {
            const auto* sun = reinterpret_cast<const sockaddr_un*>(&storage);
            const size_t path_len = length > offsetof(sockaddr_un, sun_path)
                                        ? length - offsetof(sockaddr_un, sun_path) : 0;
            if (path_len == 0) return {};
            if (sun->sun_path[0] == '\0') {
                return "unix:@" + std::string(sun->sun_path + 1, path_len - 1);
            }
            return "unix:" + std::string(sun->sun_path, ::strnlen(sun->sun_path, path_len));
        }
        case AF_INET: {
            const auto* in = reinterpret_cast<const sockaddr_in*>(&storage);
            ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
            return "tcp:" + std::string(host) + ":" + std::to_string(ntohs(in->sin_port));
        }
        case AF_INET6: {
            const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&storage);
            ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
            return "tcp6:" + std::string(host) + ":" + std::to_string(ntohs(in6->sin6_port));
        }
        default:
            return {};
    }
}

bool set_cloexec(int fd, bool on) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0) return false;
    flags = on ? (flags | FD_CLOEXEC) : (flags & ~FD_CLOEXEC);
    return ::fcntl(fd, F_SETFD, flags) == 0;
}

/** \brief Complete a connect() that returned EINTR.
 *  \details A TCP connect keeps going after the interruption, and calling connect() again
 *  would only report EALREADY; wait for writability and read the outcome from SO_ERROR.
 *  A Unix-domain connect is abandoned instead (the socket stays unconnected), so it is
 *  issued again.
 */
void finish_interrupted_connect(int fd, const sockaddr* addr, socklen_t length, std::error_code& error) {
    for (;;) {
        pollfd pfd{fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            error = PosixErrnoCompat::last_error();
            return;
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
            error = PosixErrnoCompat::last_error();
            return;
        }
        if (so_error != 0) {
            error = std::error_code(PosixErrnoCompat::normalize_errno(so_error), std::generic_category());
            return;
        }

        sockaddr_storage peer{};
        socklen_t peer_len = sizeof(peer);
        if (::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &peer_len) == 0) return;
        if (errno != ENOTCONN) {
            error = PosixErrnoCompat::last_error();
            return;
        }

        // Nothing in flight: start over
        if (::connect(fd, addr, length) == 0) return;
        const int err = PosixErrnoCompat::normalize_errno(errno);
        if (err == EISCONN) return;
        if (err != EINTR && err != EALREADY && err != EINPROGRESS) {
            error = std::error_code(err, std::generic_category());
            return;
        }
    }
}

} // namespace

// === PosixSocket Implementation ===

PosixSocket::PosixSocket(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {
    // Descriptor is opened by the first bind/connect, once the family is known
}

PosixSocket::PosixSocket(int existing_fd, AddressFamily family, std::shared_ptr<Logger> logger)
    : socket_fd_(existing_fd), family_(family), logger_(std::move(logger)) {
    if (socket_fd_ >= 0) {
        set_cloexec(socket_fd_, true);
        sockaddr_storage peer{};
        socklen_t len = sizeof(peer);
        if (::getpeername(socket_fd_, reinterpret_cast<sockaddr*>(&peer), &len) == 0) {
            remote_endpoint_ = from_native(peer, len);
        }
    }
}

PosixSocket::~PosixSocket() {
    // Avoid virtual dispatch from the destructor
    PosixSocket::close();
}

bool PosixSocket::open_fd_if_needed(AddressFamily family, std::error_code& error) {
    if (socket_fd_ >= 0) {
        if (family != family_) {
            error = std::make_error_code(std::errc::address_family_not_supported);
            return false;
        }
        return true;
    }
#ifdef SOCK_CLOEXEC
    int fd = ::socket(native_family(family), SOCK_STREAM | SOCK_CLOEXEC, 0);
#else
    int fd = ::socket(native_family(family), SOCK_STREAM, 0);
    if (fd >= 0) set_cloexec(fd, true);
#endif
    if (fd < 0) {
        error = PosixErrnoCompat::last_error();
        if (logger_) logger_->error("socket() failed: " + PosixErrnoCompat::describe(error));
        return false;
    }
    socket_fd_ = fd;
    family_ = family;
    return true;
}

bool PosixSocket::start_listening(const EndpointAddress& address, int backlog, std::error_code& error) {
    error.clear();
    if (!open_fd_if_needed(address.family(), error)) return false;

    sockaddr_storage storage{};
    socklen_t length = 0;
    if (!to_native(address, storage, length, error)) {
        if (logger_) logger_->debug("Cannot encode " + address.to_string() + ": " + PosixErrnoCompat::describe(error));
        return false;
    }

    if (address.family() != AddressFamily::Unix) {
        int one = 1;
        ::setsockopt(socket_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    if (::bind(socket_fd_, reinterpret_cast<sockaddr*>(&storage), length) != 0) {
        error = PosixErrnoCompat::last_error();
        if (logger_) logger_->debug("bind(" + address.to_string() + ") failed: " + PosixErrnoCompat::describe(error));
        return false;
    }
    bound_address_ = address;

    if (::listen(socket_fd_, backlog) != 0) {
        error = PosixErrnoCompat::last_error();
        if (logger_) logger_->error("listen(" + address.to_string() + ") failed: " + PosixErrnoCompat::describe(error));
        return false;
    }
    is_server_socket_ = true;
    if (logger_) logger_->debug("Listening on " + address.to_string() + " (fd " + std::to_string(socket_fd_) + ")");
    return true;
}

std::shared_ptr<ISocketLifecycle> PosixSocket::try_accept(std::error_code& error) {
    error.clear();
    if (socket_fd_ < 0 || !is_server_socket_) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return nullptr;
    }

    pollfd pfd{socket_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, 0);
    if (ready < 0) {
        auto ec = PosixErrnoCompat::last_error();
        if (!PosixErrnoCompat::is_transient_accept_errno(ec.value())) error = ec;
        return nullptr;
    }
    if (ready == 0) return nullptr;

#if defined(__linux__)
    int client_fd = ::accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC);
#else
    int client_fd = ::accept(socket_fd_, nullptr, nullptr);
#endif
    if (client_fd < 0) {
        auto ec = PosixErrnoCompat::last_error();
        if (PosixErrnoCompat::is_transient_accept_errno(ec.value())) {
            return nullptr;
        }
        error = ec;
        if (logger_) logger_->error("accept() failed: " + PosixErrnoCompat::describe(error));
        return nullptr;
    }
    return std::make_shared<PosixSocket>(client_fd, family_, logger_);
}

void PosixSocket::connect(const EndpointAddress& address, std::error_code& error) {
    error.clear();
    if (!open_fd_if_needed(address.family(), error)) return;

    sockaddr_storage storage{};
    socklen_t length = 0;
    if (!to_native(address, storage, length, error)) return;

    if (::connect(socket_fd_, reinterpret_cast<sockaddr*>(&storage), length) != 0) {
        error = PosixErrnoCompat::last_error();
        if (error.value() == EINTR) {
            error.clear();
            finish_interrupted_connect(socket_fd_, reinterpret_cast<sockaddr*>(&storage), length, error);
        }
    }

    if (error) {
        if (logger_) logger_->debug("connect(" + address.to_string() + ") failed: " + PosixErrnoCompat::describe(error));
        return;
    }
    remote_endpoint_ = address.to_string();
}

void PosixSocket::close() noexcept {
    if (socket_fd_ < 0) return;
    // EBADF (already closed behind our back) and EINTR are deliberately ignored:
    // on Linux the descriptor is released either way.
    ::close(socket_fd_);
    socket_fd_ = -1;
    is_server_socket_ = false;
}

bool PosixSocket::is_open() const {
    return socket_fd_ >= 0;
}

int PosixSocket::get_handle() const {
    return socket_fd_;
}

std::string PosixSocket::local_endpoint() const {
    return bound_address_ ? bound_address_->to_string() : std::string{};
}

std::string PosixSocket::remote_endpoint() const {
    return remote_endpoint_;
}

std::string PosixSocket::socket_type() const {
    switch (family_) {
        case AddressFamily::Unix:  return "unix";
        case AddressFamily::TcpV4: return "tcp";
        case AddressFamily::TcpV6: return "tcp6";
    }
    return "unknown";
}

bool PosixSocket::set_inheritable(bool inheritable, std::error_code& error) {
    error.clear();
    if (socket_fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    if (!set_cloexec(socket_fd_, !inheritable)) {
        error = PosixErrnoCompat::last_error();
        return false;
    }
    return true;
}

bool PosixSocket::is_inheritable() const {
    if (socket_fd_ < 0) return false;
    int flags = ::fcntl(socket_fd_, F_GETFD);
    return flags >= 0 && (flags & FD_CLOEXEC) == 0;
}

} // namespace transport
