#include "AbstractSocketCoordinator.hpp"
#include "CoordinationErrors.hpp"
#include "logger.hpp"

#include <utility>

namespace coordination {

AbstractSocketCoordinator::AbstractSocketCoordinator(std::optional<FilesystemLockCoordinator> fallback,
                                                     std::shared_ptr<Logger> logger,
                                                     ConnectPolicy connect_policy,
                                                     int backlog)
    : fallback_(std::move(fallback)),
      logger_(std::move(logger)),
      connect_policy_(connect_policy),
      backlog_(backlog),
      make_listener_([](std::shared_ptr<Logger> logger) {
          return std::make_unique<transport::PosixSocket>(std::move(logger));
      }) {}

AbstractSocketCoordinator& AbstractSocketCoordinator::with_listener_factory(ListenerFactory factory) {
    make_listener_ = std::move(factory);
    return *this;
}

AcquireOutcome AbstractSocketCoordinator::acquire_or_connect(const InstanceIdentity& identity) const {
    const auto address = transport::EndpointAddress::unix_abstract(identity.coordination_name());
    auto listener = make_listener_(logger_);

    std::error_code ec;
    if (listener->start_listening(address, backlog_, ec)) {
        if (!listener->set_inheritable(false, ec)) {
            throw AcquisitionError("cannot mark " + address.to_string() + " non-inheritable", ec);
        }
        if (logger_) logger_->info("Primary instance listening on " + address.to_string());
        return AcquireOutcome{InstanceRole::Primary, CoordinationHandle::primary(std::move(listener))};
    }
    listener->close();

    switch (classify_abstract_bind(ec)) {
    case CoordinationErrc::address_in_use: {
        if (logger_) logger_->debug(address.to_string() + " is taken, connecting as secondary");
        auto connection = connect_to_primary(address, connect_policy_, logger_);
        return AcquireOutcome{InstanceRole::Secondary, CoordinationHandle::secondary(std::move(connection))};
    }
    case CoordinationErrc::unsupported_addressing_mode:
        if (fallback_) {
            if (logger_) logger_->info("Abstract sockets unavailable, falling back to lock files");
            return fallback_->acquire_or_connect(identity);
        }
        throw AcquisitionError("abstract-namespace sockets are not supported", ec);
    default:
        if (logger_) logger_->error("bind(" + address.to_string() + ") failed: " + ec.message());
        throw AcquisitionError("cannot bind " + address.to_string(), ec);
    }
}

} // namespace coordination
