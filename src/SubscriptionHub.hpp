#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include "EventSink.hpp"
#include "PostStore.hpp"
#include "Subscription.hpp"

// Runs each Subscription on its own thread and tears all of them down on shutdown.
class SubscriptionHub {
public:
    SubscriptionHub(std::shared_ptr<PostStore> store,
                    Subscription::Render render,
                    std::chrono::milliseconds keepalive = std::chrono::seconds(15));
    ~SubscriptionHub();

    SubscriptionHub(const SubscriptionHub&) = delete;
    SubscriptionHub& operator=(const SubscriptionHub&) = delete;

    // Starts streaming to the sink. Throws std::runtime_error after shutdown().
    uint64_t open(std::shared_ptr<EventSink> sink);
    // false if the id is unknown or already finished.
    bool close(uint64_t id);

    size_t activeCount() const;
    // Entries still held, finished or not; finished ones go on the next open().
    size_t trackedCount() const;
    // Shuts the change signal down, closes every subscription and joins its thread.
    void shutdown();

private:
    struct Entry {
        std::shared_ptr<Subscription> subscription;
        std::thread thread;
    };

    void reapFinishedLocked();

    std::shared_ptr<PostStore> store_;
    Subscription::Render render_;
    std::chrono::milliseconds keepalive_;

    std::unordered_map<uint64_t, Entry> entries;
    uint64_t nextId = 1;
    bool stopped = false;
    mutable std::mutex mtx;
};
