/**
 * \file CoordinationHandle.hpp
 * \brief Resources held by a process after the primary/secondary decision.
 * \ingroup coordination
 */
#pragma once

#include "LockFile.hpp"
#include "transport/socket/posix/PosixSocket.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <sys/types.h>

namespace coordination {

/** \brief Outcome of the election for one identity. */
enum class InstanceRole { Primary, Secondary };

inline const char* to_string(InstanceRole role) {
    return role == InstanceRole::Primary ? "primary" : "secondary";
}

/** \brief Owns the coordination socket and, for a filesystem-backed primary, the
 *  lock descriptor and the socket path to unlink.
 *  \ingroup coordination
 *  \details A primary holds a listening socket; a secondary holds a socket connected
 *  to the primary. Only \ref LifecycleCleanup (or the destructor, as a last resort)
 *  releases these resources, and it does so at most once.
 */
class CoordinationHandle {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /** \brief Handle for a primary. \p cleanup_path is set only for filesystem sockets. */
    static std::unique_ptr<CoordinationHandle> primary(std::unique_ptr<transport::PosixSocket> listener,
                                                       std::optional<std::filesystem::path> cleanup_path = std::nullopt,
                                                       LockFile lock = {});

    /** \brief Handle for a secondary connected to the primary. */
    static std::unique_ptr<CoordinationHandle> secondary(std::unique_ptr<transport::PosixSocket> connection);

    // Reachable only through primary()/secondary()
    CoordinationHandle(PrivateTag, InstanceRole role, std::unique_ptr<transport::PosixSocket> socket,
                       std::optional<std::filesystem::path> cleanup_path, LockFile lock);
    ~CoordinationHandle();

    CoordinationHandle(const CoordinationHandle&) = delete;
    CoordinationHandle& operator=(const CoordinationHandle&) = delete;

    InstanceRole role() const noexcept { return role_; }
    bool is_primary() const noexcept { return role_ == InstanceRole::Primary; }
    bool is_released() const noexcept { return released_; }

    /** \brief Listening address (primary) or primary's address (secondary), in address-spec form. */
    std::string endpoint() const;

    /** \brief Socket path unlinked on release; filesystem-backed primaries only. */
    const std::optional<std::filesystem::path>& cleanup_path() const noexcept { return cleanup_path_; }

    /** \brief Lock file path held by a filesystem-backed primary, empty otherwise. */
    const std::filesystem::path& lock_path() const noexcept { return lock_.path(); }

    /** \brief Native descriptor of the coordination socket (-1 once released). */
    int native_handle() const noexcept;

    /** \brief Primary only: wait up to \p timeout for a secondary to connect.
     *  \return Connected peer, or nullptr on timeout (error cleared) or failure (error set).
     */
    std::shared_ptr<ISocketLifecycle> accept(std::error_code& error,
                                             std::chrono::milliseconds timeout = std::chrono::milliseconds(500));

private:
    friend class LifecycleCleanup;

    /** \brief Close socket, unlink the cleanup path, then drop the lock. Idempotent, never throws.
     *  \details The lock goes last so no other process can become primary and bind a new
     *  socket at the same path before our unlink. A forked child never unlinks the
     *  parent's path.
     */
    void release() noexcept;

    InstanceRole role_;
    std::unique_ptr<transport::PosixSocket> socket_;
    std::optional<std::filesystem::path> cleanup_path_;
    LockFile lock_;
    std::string endpoint_;
    pid_t owner_pid_;
    bool released_ = false;
};

} // namespace coordination
