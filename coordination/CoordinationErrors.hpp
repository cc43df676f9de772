/**
 * \file CoordinationErrors.hpp
 * \brief Error taxonomy for single-instance coordination and errno classifiers.
 * \ingroup coordination
 * \details Each fallible step (open, lock, bind, connect) hands its raw OS error to
 *  one classify_* function right after the call; the coordinators branch on the
 *  returned kind, never on raw errno values.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

/** \defgroup coordination Instance Coordination
 *  \brief Primary/secondary election between processes of one application and user.
 */

namespace coordination {

/** \brief Kinds of outcome a coordination step can have. */
enum class CoordinationErrc {
    success = 0,
    /// Another process is bound to the address: take the secondary branch.
    address_in_use,
    /// Abstract-namespace sockets are not available: use the filesystem coordinator.
    unsupported_addressing_mode,
    /// A socket path exists with no listener behind it: unlink and bind again.
    stale_resource,
    /// Another process holds the advisory lock: connect as secondary.
    lock_held,
    /// Permission or path problems in one candidate directory: try the next.
    candidate_directory_unusable,
    /// The rendezvous address exists but nobody listens yet (primary still starting).
    peer_not_listening,
    /// Primary/secondary status cannot be determined.
    fatal_acquisition_failure,
};

const std::error_category& coordination_category() noexcept;

inline std::error_code make_error_code(CoordinationErrc e) noexcept {
    return {static_cast<int>(e), coordination_category()};
}

/** \brief Kind of a failed bind on an abstract-namespace address. */
CoordinationErrc classify_abstract_bind(const std::error_code& ec) noexcept;

/** \brief Kind of a failed bind on a filesystem socket path (we hold the lock). */
CoordinationErrc classify_path_bind(const std::error_code& ec) noexcept;

/** \brief Kind of a failed non-blocking exclusive lock attempt. */
CoordinationErrc classify_lock(const std::error_code& ec) noexcept;

/** \brief Kind of a failed open/create of the lock file. */
CoordinationErrc classify_lock_open(const std::error_code& ec) noexcept;

/** \brief Kind of a failed connect to the primary's rendezvous address. */
CoordinationErrc classify_connect(const std::error_code& ec) noexcept;

/** \brief Thrown when the process cannot tell whether it is primary or secondary.
 *  \details \ref cause() holds the OS error of the step that failed (or a
 *  \ref CoordinationErrc when no OS error applies).
 */
class AcquisitionError : public std::runtime_error {
public:
    AcquisitionError(const std::string& what, std::error_code cause)
        : std::runtime_error(what + ": " + cause.message()), cause_(cause) {}

    const std::error_code& cause() const noexcept { return cause_; }

private:
    std::error_code cause_;
};

} // namespace coordination

namespace std {
template <>
struct is_error_code_enum<coordination::CoordinationErrc> : true_type {};
} // namespace std
