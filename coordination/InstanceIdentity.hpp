/**
 * \file InstanceIdentity.hpp
 * \brief Who competes for primary status: application, effective user, optional group.
 * \ingroup coordination
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace coordination {

/** \brief Immutable identity shared by every process that competes for one primary slot.
 *  \ingroup coordination
 *  \details Derives the coordination name `<app>-ipc-<uid>[-<group>]`, which is
 *  used verbatim as the abstract socket name and as the stem of the lock/socket
 *  file names.
 */
class InstanceIdentity {
public:
    /** \throws std::invalid_argument if the application name is empty, or the name or
     *  group contains '/' or NUL (both end up in file names).
     */
    InstanceIdentity(std::string application_name, std::uint32_t effective_user_id,
                     std::optional<std::string> group_qualifier = std::nullopt);

    /** \brief Identity for the calling process's effective user. */
    static InstanceIdentity for_current_user(std::string application_name,
                                             std::optional<std::string> group_qualifier = std::nullopt);

    const std::string& application_name() const noexcept { return application_name_; }
    std::uint32_t effective_user_id() const noexcept { return effective_user_id_; }
    const std::optional<std::string>& group_qualifier() const noexcept { return group_qualifier_; }

    /** \brief `<app>-ipc-<uid>` plus `-<group>` when a group is set. */
    const std::string& coordination_name() const noexcept { return coordination_name_; }

    bool operator==(const InstanceIdentity&) const = default;

private:
    std::string application_name_;
    std::uint32_t effective_user_id_;
    std::optional<std::string> group_qualifier_;
    std::string coordination_name_;
};

} // namespace coordination
