#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>

// Broadcast "something changed" cell. Carries only a version number; readers
// re-read the store for data. Several notify() calls between two waits of the
// same handle collapse into one wake-up that reports the latest version.
class ChangeSignal {
public:
    using Version = uint64_t;

    enum class WaitResult { Changed, TimedOut, Closed };

    class Handle {
        // only ChangeSignal can name the key, so only it can build handles
        struct Key {
            explicit Key() = default;
        };

    public:
        Handle(Key, uint64_t id, Version seen) : id_(id), seen_(seen) {}

        uint64_t id() const { return id_; }

    private:
        friend class ChangeSignal;

        // guarded by ChangeSignal::mutex_
        uint64_t id_;
        Version seen_;
        bool cancelled_ = false;
    };
    using HandlePtr = std::shared_ptr<Handle>;

    ChangeSignal() = default;
    ChangeSignal(const ChangeSignal&) = delete;
    ChangeSignal& operator=(const ChangeSignal&) = delete;

    // Bumps the version and wakes every waiter. No-op after shutdown().
    void notify();

    // The new handle has not observed the current version yet, so the first
    // waitNext() returns immediately.
    HandlePtr subscribe();
    void unsubscribe(const HandlePtr& handle);

    // Blocks until the version moves past what the handle last saw.
    // std::nullopt once the handle is cancelled or the signal is shut down.
    std::optional<Version> waitNext(const HandlePtr& handle);
    WaitResult waitNextFor(const HandlePtr& handle, std::chrono::milliseconds timeout, Version& version);

    // Wakes a blocked waitNext() on this handle with Closed. Safe from any thread.
    void cancel(const HandlePtr& handle);
    // Cancels every handle, present and future.
    void shutdown();

    Version version() const;
    size_t subscriberCount() const;
    bool isShutdown() const;

private:
    bool readyLocked(const Handle& handle) const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Version version_ = 1;
    uint64_t nextHandleId_ = 1;
    bool shutdown_ = false;
    std::unordered_set<uint64_t> registered_;
};
