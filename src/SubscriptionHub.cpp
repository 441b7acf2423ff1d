#include "SubscriptionHub.hpp"
#include <stdexcept>
#include <trantor/utils/Logger.h>

SubscriptionHub::SubscriptionHub(std::shared_ptr<PostStore> store,
                                 Subscription::Render render,
                                 std::chrono::milliseconds keepalive)
    : store_(std::move(store)), render_(std::move(render)), keepalive_(keepalive) {
    if (!store_) {
        throw std::invalid_argument("SubscriptionHub requires a post store");
    }
}

SubscriptionHub::~SubscriptionHub() {
    shutdown();
}

uint64_t SubscriptionHub::open(std::shared_ptr<EventSink> sink) {
    std::lock_guard lock(mtx);
    if (stopped) {
        throw std::runtime_error("subscription hub is shut down");
    }
    reapFinishedLocked();

    uint64_t id = nextId++;
    auto subscription = std::make_shared<Subscription>(id, store_, std::move(sink), render_, keepalive_);
    Entry entry;
    entry.subscription = subscription;
    entry.thread = std::thread([subscription] { subscription->run(); });
    entries.emplace(id, std::move(entry));
    LOG_DEBUG << "subscription hub: " << entries.size() << " subscription(s) tracked";
    return id;
}

bool SubscriptionHub::close(uint64_t id) {
    std::lock_guard lock(mtx);
    auto it = entries.find(id);
    if (it == entries.end() || it->second.subscription->state() == Subscription::State::Closed) {
        return false;
    }
    it->second.subscription->close();
    return true;
}

size_t SubscriptionHub::activeCount() const {
    std::lock_guard lock(mtx);
    size_t count = 0;
    for (const auto& [id, entry] : entries) {
        if (entry.subscription->state() != Subscription::State::Closed) {
            ++count;
        }
    }
    return count;
}

size_t SubscriptionHub::trackedCount() const {
    std::lock_guard lock(mtx);
    return entries.size();
}

void SubscriptionHub::shutdown() {
    std::unordered_map<uint64_t, Entry> remaining;
    {
        std::lock_guard lock(mtx);
        if (stopped) {
            return;
        }
        stopped = true;
        remaining.swap(entries);
    }

    LOG_INFO << "subscription hub: shutting down " << remaining.size() << " subscription(s)";
    store_->signal()->shutdown();
    for (auto& [id, entry] : remaining) {
        entry.subscription->close();
    }
    for (auto& [id, entry] : remaining) {
        if (entry.thread.joinable()) {
            entry.thread.join();
        }
    }
}

void SubscriptionHub::reapFinishedLocked() {
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second.subscription->state() == Subscription::State::Closed) {
            if (it->second.thread.joinable()) {
                it->second.thread.join();
            }
            it = entries.erase(it);
        } else {
            ++it;
        }
    }
}
