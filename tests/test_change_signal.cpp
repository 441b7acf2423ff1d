#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>
#include "../src/ChangeSignal.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

using namespace std::chrono_literals;

static int testFirstWaitReturnsImmediately() {
    ChangeSignal signal;
    signal.notify();
    signal.notify();
    auto handle = signal.subscribe();
    ChangeSignal::Version version = 0;
    // no notify after subscribe, yet the first wait must not block
    ASSERT_TRUE(signal.waitNextFor(handle, 0ms, version) == ChangeSignal::WaitResult::Changed);
    ASSERT_TRUE(version == signal.version());

    auto late = signal.subscribe();
    auto seen = signal.waitNext(late);
    ASSERT_TRUE(seen.has_value());
    ASSERT_TRUE(*seen == 3);
    return 0;
}

static int testSingleNotifyWakesEveryWaiter() {
    ChangeSignal signal;
    const int waiters = 8;
    std::atomic<int> ready{0};
    std::vector<ChangeSignal::Version> results(waiters, 0);
    std::vector<std::thread> threads;

    for (int i = 0; i < waiters; ++i) {
        threads.emplace_back([&, i] {
            auto handle = signal.subscribe();
            signal.waitNext(handle); // initial version
            ++ready;
            auto next = signal.waitNext(handle);
            results[i] = next.value_or(0);
            signal.unsubscribe(handle);
        });
    }
    while (ready.load() < waiters) {
        std::this_thread::sleep_for(1ms);
    }
    signal.notify();
    for (auto& t : threads) t.join();

    for (auto v : results) {
        ASSERT_TRUE(v == 2);
    }
    ASSERT_TRUE(signal.subscriberCount() == 0);
    return 0;
}

static int testNotifiesCoalesce() {
    ChangeSignal signal;
    auto handle = signal.subscribe();
    ASSERT_TRUE(signal.waitNext(handle).has_value());

    for (int i = 0; i < 5; ++i) {
        signal.notify();
    }
    ChangeSignal::Version version = 0;
    ASSERT_TRUE(signal.waitNextFor(handle, 0ms, version) == ChangeSignal::WaitResult::Changed);
    ASSERT_TRUE(version == 6);
    // the five notifies were delivered as a single wake-up
    ASSERT_TRUE(signal.waitNextFor(handle, 30ms, version) == ChangeSignal::WaitResult::TimedOut);
    ASSERT_TRUE(version == 6);
    return 0;
}

static int testCancelWakesBlockedWaiter() {
    ChangeSignal signal;
    auto handle = signal.subscribe();
    ASSERT_TRUE(signal.waitNext(handle).has_value());

    std::atomic<bool> returned{false};
    bool gotValue = true;
    std::thread waiter([&] {
        gotValue = signal.waitNext(handle).has_value();
        returned = true;
    });
    std::this_thread::sleep_for(20ms);
    ASSERT_TRUE(!returned.load());
    signal.cancel(handle);
    waiter.join();
    ASSERT_TRUE(!gotValue);

    // cancelled handles stay closed even when the version moves on
    signal.notify();
    ChangeSignal::Version version = 0;
    ASSERT_TRUE(signal.waitNextFor(handle, 0ms, version) == ChangeSignal::WaitResult::Closed);
    signal.unsubscribe(handle);
    ASSERT_TRUE(signal.subscriberCount() == 0);
    return 0;
}

static int testShutdownReleasesEveryone() {
    ChangeSignal signal;
    std::vector<std::thread> threads;
    std::atomic<int> closed{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            auto handle = signal.subscribe();
            signal.waitNext(handle);
            if (!signal.waitNext(handle)) ++closed;
            signal.unsubscribe(handle);
        });
    }
    while (signal.subscriberCount() < 4) {
        std::this_thread::sleep_for(1ms);
    }
    signal.shutdown();
    for (auto& t : threads) t.join();
    ASSERT_TRUE(closed.load() == 4);
    ASSERT_TRUE(signal.subscriberCount() == 0);
    ASSERT_TRUE(signal.isShutdown());

    auto version = signal.version();
    signal.notify();
    ASSERT_TRUE(signal.version() == version);

    auto late = signal.subscribe();
    ASSERT_TRUE(!signal.waitNext(late).has_value());
    ASSERT_TRUE(signal.subscriberCount() == 0);
    return 0;
}

int main() {
    try {
        if (testFirstWaitReturnsImmediately()) return 1;
        if (testSingleNotifyWakesEveryWaiter()) return 1;
        if (testNotifiesCoalesce()) return 1;
        if (testCancelWakesBlockedWaiter()) return 1;
        if (testShutdownReleasesEveryone()) return 1;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All change signal tests passed" << std::endl;
    return 0;
}
