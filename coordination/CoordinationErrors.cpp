/**
 * \file CoordinationErrors.cpp
 * \brief Error category and errno classification tables.
 * \ingroup coordination
 */
#include "CoordinationErrors.hpp"
#include "transport/socket/posix/PosixErrnoCompat.hpp"

#include <cerrno>

namespace coordination {

namespace {

class CoordinationCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "coordination"; }

    std::string message(int value) const override {
        switch (static_cast<CoordinationErrc>(value)) {
            case CoordinationErrc::success:                      return "success";
            case CoordinationErrc::address_in_use:               return "coordination address already in use";
            case CoordinationErrc::unsupported_addressing_mode:  return "abstract socket namespace not supported";
            case CoordinationErrc::stale_resource:               return "stale socket path without a listener";
            case CoordinationErrc::lock_held:                    return "lock file held by another process";
            case CoordinationErrc::candidate_directory_unusable: return "candidate directory unusable";
            case CoordinationErrc::peer_not_listening:           return "primary instance not accepting connections";
            case CoordinationErrc::fatal_acquisition_failure:    return "cannot determine primary/secondary status";
        }
        return "unknown coordination error";
    }
};

bool is_errno(const std::error_code& ec) noexcept {
    return ec.category() == std::generic_category() || ec.category() == std::system_category();
}

// Permission and path problems local to one directory
bool is_directory_local_errno(int value) noexcept {
    switch (value) {
        case EACCES:
        case EPERM:
        case EROFS:
        case ENOENT:
        case ENOTDIR:
        case ENAMETOOLONG:
        case ELOOP:
        case EISDIR:
        case ENOSPC:
        case EDQUOT:
        case ENXIO:
        case ETXTBSY:
            return true;
        default:
            return false;
    }
}

} // namespace

const std::error_category& coordination_category() noexcept {
    static const CoordinationCategory category;
    return category;
}

CoordinationErrc classify_abstract_bind(const std::error_code& ec) noexcept {
    if (!ec) return CoordinationErrc::success;
    if (!is_errno(ec)) return CoordinationErrc::fatal_acquisition_failure;
    switch (PosixErrnoCompat::normalize_errno(ec.value())) {
        case EADDRINUSE: return CoordinationErrc::address_in_use;
        case ENOENT:     return CoordinationErrc::unsupported_addressing_mode;
        default:         return CoordinationErrc::fatal_acquisition_failure;
    }
}

CoordinationErrc classify_path_bind(const std::error_code& ec) noexcept {
    if (!ec) return CoordinationErrc::success;
    if (!is_errno(ec)) return CoordinationErrc::fatal_acquisition_failure;
    const int value = PosixErrnoCompat::normalize_errno(ec.value());
    if (value == EADDRINUSE || value == EEXIST) return CoordinationErrc::stale_resource;
    if (is_directory_local_errno(value)) return CoordinationErrc::candidate_directory_unusable;
    return CoordinationErrc::fatal_acquisition_failure;
}

CoordinationErrc classify_lock(const std::error_code& ec) noexcept {
    if (!ec) return CoordinationErrc::success;
    if (!is_errno(ec)) return CoordinationErrc::fatal_acquisition_failure;
    const int value = PosixErrnoCompat::normalize_errno(ec.value());
    if (value == EAGAIN || value == EACCES) return CoordinationErrc::lock_held;
    // Filesystems without lock support (some network mounts)
    if (value == ENOLCK || value == EOPNOTSUPP || value == EINVAL) return CoordinationErrc::candidate_directory_unusable;
    return CoordinationErrc::fatal_acquisition_failure;
}

CoordinationErrc classify_lock_open(const std::error_code& ec) noexcept {
    if (!ec) return CoordinationErrc::success;
    if (!is_errno(ec)) return CoordinationErrc::fatal_acquisition_failure;
    if (is_directory_local_errno(PosixErrnoCompat::normalize_errno(ec.value()))) {
        return CoordinationErrc::candidate_directory_unusable;
    }
    return CoordinationErrc::fatal_acquisition_failure;
}

CoordinationErrc classify_connect(const std::error_code& ec) noexcept {
    if (!ec) return CoordinationErrc::success;
    if (!is_errno(ec)) return CoordinationErrc::fatal_acquisition_failure;
    switch (PosixErrnoCompat::normalize_errno(ec.value())) {
        case ECONNREFUSED:
        case ENOENT:
        case EAGAIN:
            return CoordinationErrc::peer_not_listening;
        default:
            return CoordinationErrc::fatal_acquisition_failure;
    }
}

} // namespace coordination
