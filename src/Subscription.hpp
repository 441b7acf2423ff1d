#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ChangeSignal.hpp"
#include "EventSink.hpp"
#include "PostStore.hpp"

// One streaming client. run() loops Waiting -> Emitting -> Waiting until the
// client goes away, a write fails, close() is called or the signal shuts down.
// Every exit path goes through Closed, which unsubscribes and closes the sink.
class Subscription {
public:
    enum class State { Init, Waiting, Emitting, Closed };

    // Turns a snapshot into the data of one "message" event.
    using Render = std::function<std::string(const std::vector<Post>&)>;

    Subscription(uint64_t id,
                 std::shared_ptr<PostStore> store,
                 std::shared_ptr<EventSink> sink,
                 Render render,
                 std::chrono::milliseconds keepalive = std::chrono::seconds(15));
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Blocks the calling thread until Closed. Any other error closes only this
    // subscription; InvariantViolation is rethrown after closing.
    void run();

    // Thread-safe; wakes a blocked run() which then closes.
    void close();

    uint64_t id() const { return id_; }
    State state() const { return state_.load(); }
    size_t emittedCount() const { return emitted_.load(); }

private:
    bool emitSnapshot();
    void enterClosed(const char* reason);

    uint64_t id_;
    std::shared_ptr<PostStore> store_;
    std::shared_ptr<ChangeSignal> signal_;
    std::shared_ptr<EventSink> sink_;
    Render render_;
    std::chrono::milliseconds keepalive_;

    std::atomic<State> state_{State::Init};
    std::atomic<size_t> emitted_{0};
    size_t lastEmittedSize_ = 0;

    std::mutex mutex_; // guards handle_, closeRequested_
    ChangeSignal::HandlePtr handle_;
    bool closeRequested_ = false;
};

const char* toString(Subscription::State state);
