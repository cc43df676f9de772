/**
 * \file IClientSocket.hpp
 * \brief Client connection interface.
 * \ingroup socket_backend
 * \details Synchronous connect semantics; a connect either completes or fails immediately.
 */
#pragma once

#include <system_error>
#include "ISocketLifecycle.hpp"
#include "transport/address/EndpointAddress.hpp"

/** \brief Client socket role interface.
 *  \ingroup socket_backend
 */
struct IClientSocket : public virtual ISocketLifecycle {
    /** \brief Establish a blocking connection; sets `error` on failure (non-throwing). */
    virtual void connect(const transport::EndpointAddress& address, std::error_code& error) = 0;
};
