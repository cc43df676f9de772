/**
 * \file LifecycleCleanup.hpp
 * \brief Scoped, exit-safe release of a CoordinationHandle.
 * \ingroup coordination
 */
#pragma once

#include "CoordinationHandle.hpp"

#include <memory>

class Logger;

namespace coordination {

/** \brief Owns a CoordinationHandle and releases it exactly once.
 *  \ingroup coordination
 *  \details Release runs at whichever comes first:
 *  - an explicit \ref release() call (the application's shutdown hook),
 *  - destruction of this object (normal return, early return, exception unwind),
 *  - process termination through `std::exit()`, which skips automatic objects: every
 *    live instance is tracked and released from a single `atexit` hook.
 *
 *  Release never throws and tolerates resources that are already gone.
 */
class LifecycleCleanup {
public:
    LifecycleCleanup() = default;
    explicit LifecycleCleanup(std::unique_ptr<CoordinationHandle> handle, std::shared_ptr<Logger> logger = nullptr);
    ~LifecycleCleanup();

    LifecycleCleanup(LifecycleCleanup&& other) noexcept;
    LifecycleCleanup& operator=(LifecycleCleanup&& other) noexcept;
    LifecycleCleanup(const LifecycleCleanup&) = delete;
    LifecycleCleanup& operator=(const LifecycleCleanup&) = delete;

    /** \brief Release now; later calls (and the exit hook) do nothing. */
    void release() noexcept;

    /** \brief True once released, or if no handle was ever attached. */
    bool released() const noexcept { return !handle_ || handle_->is_released(); }

    CoordinationHandle* handle() noexcept { return handle_.get(); }
    const CoordinationHandle* handle() const noexcept { return handle_.get(); }
    CoordinationHandle* operator->() noexcept { return handle_.get(); }
    const CoordinationHandle* operator->() const noexcept { return handle_.get(); }

private:
    /** \brief atexit hook: releases every handle whose owner never ran. */
    static void on_process_exit() noexcept;

    std::unique_ptr<CoordinationHandle> handle_;
    std::shared_ptr<Logger> logger_;
};

} // namespace coordination
