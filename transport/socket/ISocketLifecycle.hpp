/**
 * \file ISocketLifecycle.hpp
 * \brief Common lifecycle and endpoint query interface for all socket roles.
 * \ingroup socket_backend
 * \details Provides handle, endpoint, and basic readiness queries shared by
 * listening and connected sockets. The coordination layer depends on this for
 * generic closure and endpoint reporting.
 */
#pragma once

#include <string>

/** \defgroup socket_backend Socket Backend
 *  \brief Role-based socket interfaces, the POSIX backend and endpoint addressing.
 */

/** \brief Base interface for common socket lifecycle and endpoint methods.
 *  \ingroup socket_backend
 */
struct ISocketLifecycle {
    virtual ~ISocketLifecycle() = default;

    /** \brief Close the underlying transport; idempotent and never throws. */
    virtual void close() noexcept = 0;
    /** \brief True if underlying transport is currently open. */
    virtual bool is_open() const = 0;
    /** \brief Native descriptor (or -1 once closed). */
    virtual int get_handle() const = 0;
    /** \brief Local endpoint in address-spec form, empty if unbound. */
    virtual std::string local_endpoint() const = 0;
    /** \brief Remote endpoint in address-spec form, empty if not connected. */
    virtual std::string remote_endpoint() const = 0;
    /** \brief Transport type identifier ("unix", "tcp", "tcp6"). */
    virtual std::string socket_type() const = 0;
};
