/**
 * \file AbstractSocketCoordinator.hpp
 * \brief Election through a Linux abstract-namespace Unix socket.
 * \ingroup coordination
 */
#pragma once

#include "AcquireOutcome.hpp"
#include "FilesystemLockCoordinator.hpp"
#include "InstanceIdentity.hpp"
#include "PrimaryConnector.hpp"

#include <functional>
#include <memory>
#include <optional>

class Logger;

namespace coordination {

/** \brief Abstract-namespace fast path.
 *  \ingroup coordination
 *  \details The kernel makes bind() on an abstract name atomic and drops the name with
 *  the last descriptor, so there is no lock file and nothing to clean up after a crash.
 *  - bind succeeds: Primary;
 *  - EADDRINUSE: connect to the same name, Secondary;
 *  - ENOENT (no abstract namespace on this platform): delegate to \p fallback;
 *  - anything else: \ref AcquisitionError.
 *
 *  Without a fallback, non-support is fatal as well.
 */
class AbstractSocketCoordinator {
public:
    /** \brief Creates the unopened socket used for the abstract bind. */
    using ListenerFactory = std::function<std::unique_ptr<transport::PosixSocket>(std::shared_ptr<Logger>)>;

    explicit AbstractSocketCoordinator(std::optional<FilesystemLockCoordinator> fallback = std::nullopt,
                                       std::shared_ptr<Logger> logger = nullptr,
                                       ConnectPolicy connect_policy = {},
                                       int backlog = 128);

    /** \throws AcquisitionError */
    AcquireOutcome acquire_or_connect(const InstanceIdentity& identity) const;

    /** \brief Replace the listener factory (defaults to a plain PosixSocket). */
    AbstractSocketCoordinator& with_listener_factory(ListenerFactory factory);

private:
    std::optional<FilesystemLockCoordinator> fallback_;
    std::shared_ptr<Logger> logger_;
    ConnectPolicy connect_policy_;
    int backlog_;
    ListenerFactory make_listener_;
};

} // namespace coordination
