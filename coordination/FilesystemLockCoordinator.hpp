/**
 * \file FilesystemLockCoordinator.hpp
 * \brief Election through a lock file plus a filesystem rendezvous socket.
 * \ingroup coordination
 */
#pragma once

#include "AcquireOutcome.hpp"
#include "CandidateDirectories.hpp"
#include "InstanceIdentity.hpp"
#include "PrimaryConnector.hpp"

#include <memory>
#include <optional>
#include <system_error>

class Logger;

namespace coordination {

/** \brief Filesystem election, used when abstract-namespace sockets are unavailable.
 *  \ingroup coordination
 *  \details For each live candidate directory, in order:
 *  1. open `[.]<name>.lock` (create, truncate, close-on-exec);
 *  2. try an exclusive non-blocking lock. If another process holds it, connect to
 *     `[.]<name>.sock` and return Secondary; later directories are not consulted;
 *  3. otherwise bind a listening socket at `[.]<name>.sock`. A path left behind by a
 *     crashed primary is unlinked and the bind retried once;
 *  4. listen, mark non-inheritable and return Primary.
 *
 *  Permission or path problems in a directory move on to the next one. Running out
 *  of directories, or a second bind failure after removing a stale path, raises
 *  \ref AcquisitionError.
 */
class FilesystemLockCoordinator {
public:
    explicit FilesystemLockCoordinator(CandidateDirectories candidates,
                                       std::shared_ptr<Logger> logger = nullptr,
                                       ConnectPolicy connect_policy = {},
                                       int backlog = 128);

    /** \throws AcquisitionError */
    AcquireOutcome acquire_or_connect(const InstanceIdentity& identity) const;

    const CandidateDirectories& candidates() const noexcept { return candidates_; }

private:
    /** \brief One directory; nullopt with \p unusable set means "try the next one". */
    std::optional<AcquireOutcome> try_directory(const CandidateDirectory& dir, const std::string& name,
                                                std::error_code& unusable) const;

    CandidateDirectories candidates_;
    std::shared_ptr<Logger> logger_;
    ConnectPolicy connect_policy_;
    int backlog_;
};

} // namespace coordination
