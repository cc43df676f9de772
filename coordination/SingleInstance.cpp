#include "SingleInstance.hpp"
#include "AbstractSocketCoordinator.hpp"
#include "FilesystemLockCoordinator.hpp"
#include "logger.hpp"

#include <utility>

namespace coordination {

const char* to_string(CoordinationMode mode) {
    switch (mode) {
        case CoordinationMode::Auto:       return "auto";
        case CoordinationMode::Abstract:   return "abstract";
        case CoordinationMode::Filesystem: return "filesystem";
    }
    return "unknown";
}

std::optional<CoordinationMode> parse_coordination_mode(const std::string& text) {
    if (text == "auto") return CoordinationMode::Auto;
    if (text == "abstract") return CoordinationMode::Abstract;
    if (text == "filesystem") return CoordinationMode::Filesystem;
    return std::nullopt;
}

SingleInstance::SingleInstance(std::shared_ptr<Logger> logger, CoordinatorSettings settings)
    : logger_(std::move(logger)), settings_(std::move(settings)) {}

CandidateDirectories SingleInstance::candidates() const {
    return settings_.lock_dirs.empty() ? CandidateDirectories::platform_default()
                                       : CandidateDirectories::from_paths(settings_.lock_dirs);
}

AcquisitionResult SingleInstance::acquire(const InstanceIdentity& identity) const {
    if (logger_) logger_->debug("Acquiring " + identity.coordination_name() + " (mode " +
                                to_string(settings_.mode) + ")");

    AcquireOutcome outcome;
    switch (settings_.mode) {
    case CoordinationMode::Filesystem:
        outcome = FilesystemLockCoordinator(candidates(), logger_, settings_.connect, settings_.backlog)
                      .acquire_or_connect(identity);
        break;
    case CoordinationMode::Abstract:
        outcome = AbstractSocketCoordinator(std::nullopt, logger_, settings_.connect, settings_.backlog)
                      .acquire_or_connect(identity);
        break;
    case CoordinationMode::Auto:
    default:
        outcome = AbstractSocketCoordinator(
                      FilesystemLockCoordinator(candidates(), logger_, settings_.connect, settings_.backlog),
                      logger_, settings_.connect, settings_.backlog)
                      .acquire_or_connect(identity);
        break;
    }

    if (logger_) logger_->info(std::string("Running as ") + to_string(outcome.role) + " for " +
                               identity.coordination_name());
    return AcquisitionResult{outcome.role, LifecycleCleanup(std::move(outcome.handle), logger_)};
}

} // namespace coordination
