/**
 * \file PrimaryConnector.hpp
 * \brief Secondary-side connect to the primary's rendezvous address.
 * \ingroup coordination
 */
#pragma once

#include "transport/address/EndpointAddress.hpp"
#include "transport/socket/posix/PosixSocket.hpp"

#include <chrono>
#include <memory>

class Logger;

namespace coordination {

/** \brief How persistently a secondary connects.
 *  \details A primary binds before it listens, and takes its lock before it binds, so
 *  a secondary can observe the address while connects are still refused. Refused
 *  connects are retried at most \ref attempts times, \ref retry_interval apart, so the
 *  default waits at most about 100 ms; every other failure is final.
 *  `attempts == 1` means a single connect with no retry and no sleep: the strictly
 *  synchronous, poll-free behaviour.
 */
struct ConnectPolicy {
    int attempts = 20;
    std::chrono::milliseconds retry_interval{5};
};

/** \brief Connect a fresh Unix socket to \p address.
 *  \throws AcquisitionError when the primary cannot be reached.
 */
std::unique_ptr<transport::PosixSocket> connect_to_primary(const transport::EndpointAddress& address,
                                                           const ConnectPolicy& policy,
                                                           const std::shared_ptr<Logger>& logger);

} // namespace coordination
