/**
 * \file IServerSocket.hpp
 * \brief Listening socket interface.
 * \ingroup socket_backend
 * \details Defines server startup and accept primitives over an \ref transport::EndpointAddress.
 */
#pragma once

#include <memory>
#include <system_error>
#include <thread>
#include <chrono>
#include "ISocketLifecycle.hpp"
#include "transport/address/EndpointAddress.hpp"

     /** \brief Server role interface (bind + listen + accept).
      *  \ingroup socket_backend
      */
struct IServerSocket : public virtual ISocketLifecycle {

        /** \brief Bind + listen convenience for server startup.
         *  \details Performs bind followed by listen. The first failing step's OS error
         *  is stored in \p error unchanged so callers can classify it (an address in use
         *  is an expected outcome for single-instance coordination, not a failure).
         *  Implementations never throw.
         *  \param address Endpoint to bind.
         *  \param backlog Hint for pending connection queue length (platform may clamp).
         *  \param error Receives the bind/listen error; cleared on success.
         *  \return true on success.
         */
        virtual bool start_listening(const transport::EndpointAddress& address, int backlog,
                                     std::error_code& error) = 0;

        /** \brief Attempt a non-blocking accept.
         *  \details Returns a connected socket if a pending client exists; otherwise returns
         *  nullptr. Sets \p error only on non-transient failure.
         */
        virtual std::shared_ptr<ISocketLifecycle> try_accept(std::error_code& error) = 0;

        /** \brief Timed accept supporting responsive shutdown.
         *  \details Polls \ref try_accept in short slices until \p timeout elapses, so an
         *  accept loop can check its own shutdown flag between calls.
         *  - Returns a connected socket on success (error cleared).
         *  - Returns nullptr with error cleared on timeout.
         *  - Returns nullptr with error set on non-transient failures.
         */
        virtual std::shared_ptr<ISocketLifecycle> blocking_accept(std::error_code& error,
                                                                  std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) {

            error.clear();
            const auto slice = std::chrono::milliseconds(5);
            auto elapsed = std::chrono::milliseconds(0);
            while (elapsed < timeout) {
                auto client = try_accept(error);
                if (client) {
                    error.clear();
                    return client;
                }
                if (error) {
                    return nullptr; // Non-transient failure
                }
                std::this_thread::sleep_for(slice);
                elapsed += slice;
            }
            error.clear();
            return nullptr;
        }
};
