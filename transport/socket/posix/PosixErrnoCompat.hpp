/**
 * \file PosixErrnoCompat.hpp
 * \brief errno helpers shared by the POSIX socket backend.
 * \ingroup socket_backend
 * \details Normalizes errno aliases, identifies transient accept conditions
 *  and renders short human-readable strings for log lines.
 */
#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

/** \brief Interpret errno values returned by socket and file syscalls. */
class PosixErrnoCompat {
public:
    /** \brief Capture the calling thread's errno as a std::error_code. */
    static std::error_code last_error() {
        return std::error_code(normalize_errno(errno), std::generic_category());
    }

    /** \brief Fold platform aliases onto one canonical value.
     *  \details EWOULDBLOCK and EAGAIN may differ on some systems; ENOTSUP and
     *  EOPNOTSUPP likewise. Callers compare against the canonical value only.
     */
    static int normalize_errno(int errno_val) {
        if (errno_val == EWOULDBLOCK) return EAGAIN;
#if defined(ENOTSUP) && defined(EOPNOTSUPP) && (ENOTSUP != EOPNOTSUPP)
        if (errno_val == ENOTSUP) return EOPNOTSUPP;
#endif
        return errno_val;
    }

    /** \brief Accept failures that only mean "try again" (client went away, signal, ...). */
    static bool is_transient_accept_errno(int errno_val) {
        switch (normalize_errno(errno_val)) {
            case EAGAIN:
            case EINTR:
            case ECONNABORTED:
            case EPROTO:
            case EPERM:
                return true;
            default:
                return false;
        }
    }

    /** \brief Convert an error code to "message (errno N)". */
    static std::string describe(const std::error_code& ec) {
        return ec.message() + " (errno " + std::to_string(ec.value()) + ")";
    }
};
