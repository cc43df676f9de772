#pragma once

#include "CoordinationHandle.hpp"

#include <memory>

namespace coordination {

/** \brief What a coordinator hands back: the role and the resources backing it. */
struct AcquireOutcome {
    InstanceRole role;
    std::unique_ptr<CoordinationHandle> handle;
};

} // namespace coordination
