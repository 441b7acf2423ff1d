#include "ChangeSignal.hpp"
#include <trantor/utils/Logger.h>

void ChangeSignal::notify() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return;
        }
        ++version_;
    }
    cv_.notify_all();
}

ChangeSignal::HandlePtr ChangeSignal::subscribe() {
    std::lock_guard lock(mutex_);
    auto handle = std::make_shared<Handle>(Handle::Key(), nextHandleId_++, version_ - 1);
    if (shutdown_) {
        handle->cancelled_ = true;
        return handle;
    }
    registered_.insert(handle->id_);
    LOG_DEBUG << "change signal: handle " << handle->id_ << " subscribed at version " << version_;
    return handle;
}

void ChangeSignal::unsubscribe(const HandlePtr& handle) {
    if (!handle) return;
    {
        std::lock_guard lock(mutex_);
        handle->cancelled_ = true;
        if (registered_.erase(handle->id_) > 0) {
            LOG_DEBUG << "change signal: handle " << handle->id_ << " unsubscribed";
        }
    }
    cv_.notify_all();
}

bool ChangeSignal::readyLocked(const Handle& handle) const {
    return handle.cancelled_ || shutdown_ || version_ > handle.seen_;
}

std::optional<ChangeSignal::Version> ChangeSignal::waitNext(const HandlePtr& handle) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return readyLocked(*handle); });
    if (handle->cancelled_ || shutdown_) {
        return std::nullopt;
    }
    handle->seen_ = version_;
    return version_;
}

ChangeSignal::WaitResult ChangeSignal::waitNextFor(const HandlePtr& handle, std::chrono::milliseconds timeout, Version& version) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [&] { return readyLocked(*handle); })) {
        return WaitResult::TimedOut;
    }
    if (handle->cancelled_ || shutdown_) {
        return WaitResult::Closed;
    }
    handle->seen_ = version_;
    version = version_;
    return WaitResult::Changed;
}

void ChangeSignal::cancel(const HandlePtr& handle) {
    if (!handle) return;
    {
        std::lock_guard lock(mutex_);
        handle->cancelled_ = true;
    }
    cv_.notify_all();
}

void ChangeSignal::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) return;
        shutdown_ = true;
        LOG_INFO << "change signal: shutting down with " << registered_.size() << " subscriber(s)";
    }
    cv_.notify_all();
}

ChangeSignal::Version ChangeSignal::version() const {
    std::lock_guard lock(mutex_);
    return version_;
}

size_t ChangeSignal::subscriberCount() const {
    std::lock_guard lock(mutex_);
    return registered_.size();
}

bool ChangeSignal::isShutdown() const {
    std::lock_guard lock(mutex_);
    return shutdown_;
}
