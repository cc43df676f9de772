/**
 * \file SingleInstance.hpp
 * \brief Entry point: pick the coordination mode, elect, and hand back an owned result.
 * \ingroup coordination
 */
#pragma once

#include "CandidateDirectories.hpp"
#include "CoordinationHandle.hpp"
#include "InstanceIdentity.hpp"
#include "LifecycleCleanup.hpp"
#include "PrimaryConnector.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class Logger;

namespace coordination {

/** \brief Which coordinators run. */
enum class CoordinationMode {
    Auto,        ///< Abstract namespace, falling back to lock files when unsupported
    Abstract,    ///< Abstract namespace only; non-support is fatal
    Filesystem,  ///< Lock files only
};

const char* to_string(CoordinationMode mode);

/** \brief "auto", "abstract" or "filesystem"; nullopt for anything else. */
std::optional<CoordinationMode> parse_coordination_mode(const std::string& text);

struct CoordinatorSettings {
    CoordinationMode mode = CoordinationMode::Auto;
    /// Replaces the platform candidate directories when non-empty
    std::vector<std::filesystem::path> lock_dirs;
    ConnectPolicy connect;
    int backlog = 128;
};

/** \brief Role plus the cleanup object that owns the coordination resources. */
struct AcquisitionResult {
    InstanceRole role;
    LifecycleCleanup cleanup;

    bool is_primary() const noexcept { return role == InstanceRole::Primary; }
};

/** \brief Primary/secondary election for one application.
 *  \ingroup coordination
 *  \details Keep the returned \ref AcquisitionResult alive for as long as the process
 *  is primary; its \ref LifecycleCleanup releases the socket, the socket path and the
 *  lock on every exit path.
 *
 *  \code
 *  coordination::SingleInstance instance(logger);
 *  auto result = instance.acquire(coordination::InstanceIdentity::for_current_user("myapp"));
 *  if (!result.is_primary()) return 0;   // forward work to the primary over result.cleanup->native_handle()
 *  \endcode
 */
class SingleInstance {
public:
    explicit SingleInstance(std::shared_ptr<Logger> logger = nullptr, CoordinatorSettings settings = {});

    /** \throws AcquisitionError when the role cannot be determined. */
    AcquisitionResult acquire(const InstanceIdentity& identity) const;

    const CoordinatorSettings& settings() const noexcept { return settings_; }

private:
    CandidateDirectories candidates() const;

    std::shared_ptr<Logger> logger_;
    CoordinatorSettings settings_;
};

} // namespace coordination
