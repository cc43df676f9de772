#include "PrimaryConnector.hpp"
#include "CoordinationErrors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <thread>

namespace coordination {

std::unique_ptr<transport::PosixSocket> connect_to_primary(const transport::EndpointAddress& address,
                                                           const ConnectPolicy& policy,
                                                           const std::shared_ptr<Logger>& logger) {
    const int attempts = std::max(1, policy.attempts);
    std::error_code ec;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto socket = std::make_unique<transport::PosixSocket>(logger);
        socket->connect(address, ec);
        const auto kind = classify_connect(ec);
        if (kind == CoordinationErrc::success) {
            if (logger) logger->debug("Connected to primary at " + address.to_string() +
                                      (attempt > 1 ? " after " + std::to_string(attempt) + " attempts" : std::string{}));
            return socket;
        }
        if (kind != CoordinationErrc::peer_not_listening) break;
        if (attempt < attempts) std::this_thread::sleep_for(policy.retry_interval);
    }
    if (logger) logger->error("Cannot reach primary at " + address.to_string() + ": " + ec.message());
    throw AcquisitionError("cannot connect to primary instance at " + address.to_string(), ec);
}

} // namespace coordination
