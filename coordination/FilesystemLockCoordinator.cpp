#include "FilesystemLockCoordinator.hpp"
#include "CoordinationErrors.hpp"
#include "LockFile.hpp"
#include "logger.hpp"

#include <filesystem>
#include <utility>

namespace coordination {

FilesystemLockCoordinator::FilesystemLockCoordinator(CandidateDirectories candidates,
                                                     std::shared_ptr<Logger> logger,
                                                     ConnectPolicy connect_policy,
                                                     int backlog)
    : candidates_(std::move(candidates)),
      logger_(std::move(logger)),
      connect_policy_(connect_policy),
      backlog_(backlog) {}

AcquireOutcome FilesystemLockCoordinator::acquire_or_connect(const InstanceIdentity& identity) const {
    const std::string& name = identity.coordination_name();
    std::error_code last_unusable;
    for (const auto& dir : candidates_) {
        std::error_code unusable;
        auto outcome = try_directory(dir, name, unusable);
        if (outcome) return std::move(*outcome);
        last_unusable = unusable;
        if (logger_) logger_->warning("Skipping " + dir.path.string() + ": " + unusable.message());
    }

    if (logger_) logger_->error("No usable directory for lock file of " + name);
    throw AcquisitionError("no usable candidate directory for " + name,
                           last_unusable ? last_unusable : make_error_code(CoordinationErrc::candidate_directory_unusable));
}

std::optional<AcquireOutcome> FilesystemLockCoordinator::try_directory(const CandidateDirectory& dir,
                                                                       const std::string& name,
                                                                       std::error_code& unusable) const {
    const auto lock_path = dir.lock_path(name);
    const auto socket_path = dir.socket_path(name);
    std::error_code ec;

    // --- Step 1: lock file ---
    LockFile lock;
    if (!lock.open(lock_path, ec)) {
        if (classify_lock_open(ec) == CoordinationErrc::candidate_directory_unusable) {
            unusable = ec;
            return std::nullopt;
        }
        throw AcquisitionError("cannot open lock file " + lock_path.string(), ec);
    }

    // --- Step 2: election ---
    if (!lock.try_lock_exclusive(ec)) {
        switch (classify_lock(ec)) {
        case CoordinationErrc::lock_held: {
            // The holder is the primary; its socket lives next to the lock
            lock.close();
            if (logger_) logger_->debug("Lock " + lock_path.string() + " is held, connecting as secondary");
            auto connection = connect_to_primary(transport::EndpointAddress::unix_path(socket_path),
                                                 connect_policy_, logger_);
            return AcquireOutcome{InstanceRole::Secondary, CoordinationHandle::secondary(std::move(connection))};
        }
        case CoordinationErrc::candidate_directory_unusable:
            unusable = ec;
            return std::nullopt;
        default:
            throw AcquisitionError("cannot lock " + lock_path.string(), ec);
        }
    }

    // --- Step 3: rendezvous socket (we hold the lock) ---
    const auto address = transport::EndpointAddress::unix_path(socket_path);
    auto listener = std::make_unique<transport::PosixSocket>(logger_);
    bool stale_removed = false;
    while (!listener->start_listening(address, backlog_, ec)) {
        const auto kind = classify_path_bind(ec);
        if (kind == CoordinationErrc::stale_resource && !stale_removed) {
            if (logger_) logger_->info("Removing stale socket " + socket_path.string());
            std::error_code rm_ec;
            std::filesystem::remove(socket_path, rm_ec);
            stale_removed = true;
            // Rebinding an already-bound descriptor fails; start over with a fresh one
            listener = std::make_unique<transport::PosixSocket>(logger_);
            continue;
        }
        if (kind == CoordinationErrc::candidate_directory_unusable) {
            unusable = ec;
            return std::nullopt;
        }
        throw AcquisitionError("cannot bind " + socket_path.string(), ec);
    }

    // --- Step 4: primary ---
    if (!listener->set_inheritable(false, ec)) {
        throw AcquisitionError("cannot mark " + socket_path.string() + " non-inheritable", ec);
    }
    if (logger_) logger_->info("Primary instance listening on " + address.to_string());
    return AcquireOutcome{InstanceRole::Primary,
                          CoordinationHandle::primary(std::move(listener), socket_path, std::move(lock))};
}

} // namespace coordination
