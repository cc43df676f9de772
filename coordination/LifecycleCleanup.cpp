#include "LifecycleCleanup.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <vector>

namespace coordination {

namespace {

// Handles still awaiting release when the process calls std::exit().
// Constructed before the atexit hook is registered, so the hook runs before it is destroyed.
struct ExitRegistry {
    std::mutex mtx;
    std::vector<CoordinationHandle*> handles;
};

ExitRegistry& exit_registry() {
    static ExitRegistry registry;
    return registry;
}

void track(CoordinationHandle* handle) {
    auto& reg = exit_registry();
    std::lock_guard<std::mutex> lk(reg.mtx);
    reg.handles.push_back(handle);
}

void untrack(CoordinationHandle* handle) noexcept {
    auto& reg = exit_registry();
    std::lock_guard<std::mutex> lk(reg.mtx);
    reg.handles.erase(std::remove(reg.handles.begin(), reg.handles.end(), handle), reg.handles.end());
}

} // namespace

LifecycleCleanup::LifecycleCleanup(std::unique_ptr<CoordinationHandle> handle, std::shared_ptr<Logger> logger)
    : handle_(std::move(handle)), logger_(std::move(logger)) {
    static std::once_flag hook_installed;
    std::call_once(hook_installed, [] {
        exit_registry();
        std::atexit(&LifecycleCleanup::on_process_exit);
    });

    if (handle_ && !handle_->is_released()) {
        track(handle_.get());
        if (logger_) logger_->debug(std::string("Registered cleanup for ") + to_string(handle_->role()) +
                                    " handle " + handle_->endpoint());
    }
}

LifecycleCleanup::~LifecycleCleanup() {
    release();
}

LifecycleCleanup::LifecycleCleanup(LifecycleCleanup&& other) noexcept
    : handle_(std::move(other.handle_)), logger_(std::move(other.logger_)) {}

LifecycleCleanup& LifecycleCleanup::operator=(LifecycleCleanup&& other) noexcept {
    if (this != &other) {
        release();
        handle_ = std::move(other.handle_);
        logger_ = std::move(other.logger_);
    }
    return *this;
}

void LifecycleCleanup::release() noexcept {
    if (!handle_ || handle_->is_released()) return;
    untrack(handle_.get());
    handle_->release();
    if (logger_) {
        try {
            std::string msg = std::string("Released ") + to_string(handle_->role()) + " handle " + handle_->endpoint();
            if (handle_->cleanup_path()) msg += " and removed " + handle_->cleanup_path()->string();
            logger_->debug(msg);
        } catch (const std::exception&) {
            // Logging must not turn teardown into a failure
        }
    }
}

void LifecycleCleanup::on_process_exit() noexcept {
    auto& reg = exit_registry();
    std::vector<CoordinationHandle*> pending;
    {
        std::lock_guard<std::mutex> lk(reg.mtx);
        pending.swap(reg.handles);
    }
    for (auto* handle : pending) {
        handle->release();
    }
}

} // namespace coordination
