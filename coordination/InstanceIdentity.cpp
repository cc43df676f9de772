#include "InstanceIdentity.hpp"
#include "processUtils.hpp"

#include <stdexcept>

namespace coordination {

namespace {

void check_component(const std::string& value, const char* what) {
    if (value.find('/') != std::string::npos || value.find('\0') != std::string::npos) {
        throw std::invalid_argument(std::string(what) + " must not contain '/' or NUL: " + value);
    }
}

} // namespace

InstanceIdentity::InstanceIdentity(std::string application_name, std::uint32_t effective_user_id,
                                   std::optional<std::string> group_qualifier)
    : application_name_(std::move(application_name)),
      effective_user_id_(effective_user_id),
      group_qualifier_(std::move(group_qualifier)) {
    if (application_name_.empty()) {
        throw std::invalid_argument("application name must not be empty");
    }
    check_component(application_name_, "application name");

    // An empty group is the same as no group
    if (group_qualifier_ && group_qualifier_->empty()) group_qualifier_.reset();
    if (group_qualifier_) check_component(*group_qualifier_, "group qualifier");

    coordination_name_ = application_name_ + "-ipc-" + std::to_string(effective_user_id_);
    if (group_qualifier_) coordination_name_ += "-" + *group_qualifier_;
}

InstanceIdentity InstanceIdentity::for_current_user(std::string application_name,
                                                    std::optional<std::string> group_qualifier) {
    return InstanceIdentity(std::move(application_name), ProcessUtils::get_effective_uid(),
                            std::move(group_qualifier));
}

} // namespace coordination
