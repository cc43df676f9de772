/**
 * \file PosixSocket.hpp
 * \brief BSD-socket implementation of IServerSocket and IClientSocket.
 * \ingroup socket_backend
 * \details Stream socket over AF_UNIX (filesystem or abstract namespace), AF_INET
 *  and AF_INET6. Every descriptor is created close-on-exec. All operations report
 *  failures through std::error_code and never throw.
 */
#pragma once

#include "transport/socket/IServerSocket.hpp"
#include "transport/socket/IClientSocket.hpp"
#include "transport/address/EndpointAddress.hpp"
#include <memory>
#include <optional>
#include <string>
#include <system_error>

// Forward declare Logger to avoid pulling in logger header here
class Logger;

namespace transport {

/** \brief Owning wrapper around one BSD stream socket.
 *  \ingroup socket_backend
 *  \details The descriptor is opened lazily by the first bind/connect, with the
 *  family taken from the endpoint. Closing is idempotent; the destructor closes.
 */
class PosixSocket : public virtual IServerSocket, public virtual IClientSocket {
public:
    // === Construction & Lifecycle ===
    /** \brief Unopened socket with optional logger injection. */
    explicit PosixSocket(std::shared_ptr<Logger> logger = nullptr);

    /** \brief Wrap an already-connected descriptor (e.g. from accept).
     *  \param existing_fd Connected descriptor; ownership is transferred.
     *  \param family Family of the descriptor.
     *  \param logger Optional logger.
     */
    PosixSocket(int existing_fd, AddressFamily family, std::shared_ptr<Logger> logger = nullptr);

    ~PosixSocket() override;

    PosixSocket(const PosixSocket&) = delete;
    PosixSocket& operator=(const PosixSocket&) = delete;

    // === Starting a server ===
    /** \brief Bind to \p address and listen.
     *  \details On failure the OS error of the failing step is returned unchanged in
     *  \p error and the descriptor stays open and unbound if bind failed, so the caller
     *  may remove a stale filesystem path and call this again.
     */
    bool start_listening(const EndpointAddress& address, int backlog, std::error_code& error) override;

    /** \brief Accept a pending client without blocking.
     *  \return Connected socket, or nullptr if none is pending (error cleared) or on failure (error set).
     */
    std::shared_ptr<ISocketLifecycle> try_accept(std::error_code& error) override;

    // === Starting a client ===
    /** \brief Connect to \p address; completes or fails immediately for local sockets. */
    void connect(const EndpointAddress& address, std::error_code& error) override;

    // === Closing / teardown ===
    /** \brief Close the descriptor; EBADF and repeated calls are ignored. */
    void close() noexcept override;

    // === Status & information ===
    bool is_open() const override;
    int get_handle() const override;
    std::string local_endpoint() const override;
    std::string remote_endpoint() const override;
    std::string socket_type() const override;

    /** \brief Toggle close-on-exec (inheritable == !FD_CLOEXEC). */
    bool set_inheritable(bool inheritable, std::error_code& error);

    /** \brief True if the descriptor would survive exec(). */
    bool is_inheritable() const;

    /** \brief Address this socket was bound to, if any. */
    const std::optional<EndpointAddress>& bound_address() const noexcept { return bound_address_; }

private:
    /** \brief Lazily open the descriptor for \p family if not already open. */
    bool open_fd_if_needed(AddressFamily family, std::error_code& error);

    int socket_fd_{-1};
    AddressFamily family_{AddressFamily::Unix};
    bool is_server_socket_{};
    std::optional<EndpointAddress> bound_address_{};
    std::string remote_endpoint_{};

    // Optional logger (can be injected to trace socket operations)
    std::shared_ptr<Logger> logger_{};
};

} // namespace transport
