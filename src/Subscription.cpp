#include "Subscription.hpp"
#include <stdexcept>
#include <trantor/utils/Logger.h>
#include "FeedErrors.hpp"
#include "SseFormat.hpp"

Subscription::Subscription(uint64_t id,
                           std::shared_ptr<PostStore> store,
                           std::shared_ptr<EventSink> sink,
                           Render render,
                           std::chrono::milliseconds keepalive)
    : id_(id),
      store_(std::move(store)),
      sink_(std::move(sink)),
      render_(std::move(render)),
      keepalive_(keepalive) {
    if (!store_ || !sink_ || !render_) {
        throw std::invalid_argument("Subscription requires a store, a sink and a renderer");
    }
    if (keepalive_.count() <= 0) {
        throw std::invalid_argument("Subscription keep-alive must be positive");
    }
    signal_ = store_->signal();
}

Subscription::~Subscription() {
    enterClosed("destroyed");
}

void Subscription::run() {
    {
        std::lock_guard lock(mutex_);
        if (state_.load() != State::Init) {
            throw std::logic_error("Subscription::run called twice");
        }
        handle_ = signal_->subscribe();
        if (closeRequested_) {
            signal_->cancel(handle_);
        }
        state_ = State::Waiting;
    }
    LOG_INFO << "subscription " << id_ << ": opened";

    try {
        for (;;) {
            ChangeSignal::Version version = 0;
            auto result = signal_->waitNextFor(handle_, keepalive_, version);
            if (result == ChangeSignal::WaitResult::Closed) {
                enterClosed("closed");
                return;
            }
            if (result == ChangeSignal::WaitResult::TimedOut) {
                if (!sink_->send(formatSseComment("keepalive"))) {
                    enterClosed("client gone (keep-alive write failed)");
                    return;
                }
                continue;
            }

            state_ = State::Emitting;
            LOG_DEBUG << "subscription " << id_ << ": woke at version " << version;
            if (!emitSnapshot()) {
                enterClosed("write failed");
                return;
            }
            state_ = State::Waiting;
        }
    } catch (const InvariantViolation&) {
        enterClosed("invariant violated");
        throw;
    } catch (const std::exception& e) {
        // ends this client only; the store and other subscriptions keep going
        LOG_ERROR << "subscription " << id_ << ": " << e.what();
        enterClosed("error");
    }
}

bool Subscription::emitSnapshot() {
    // Re-read the store on every wake-up so an emission is never older than the last one.
    std::vector<Post> posts = store_->snapshot();
    const bool first = emitted_.load() == 0;
    if (!first && posts.size() < lastEmittedSize_) {
        LOG_FATAL << "subscription " << id_ << ": snapshot shrank from " << lastEmittedSize_ << " to " << posts.size();
        throw InvariantViolation("post store snapshot went backward");
    }
    if (!first && posts.size() == lastEmittedSize_) {
        return true;
    }

    if (!sink_->send(formatSseEvent("message", render_(posts)))) {
        return false;
    }
    lastEmittedSize_ = posts.size();
    ++emitted_;
    return true;
}

void Subscription::close() {
    std::lock_guard lock(mutex_);
    closeRequested_ = true;
    if (handle_) {
        signal_->cancel(handle_);
    }
}

void Subscription::enterClosed(const char* reason) {
    if (state_.exchange(State::Closed) == State::Closed) {
        return;
    }
    ChangeSignal::HandlePtr handle;
    {
        std::lock_guard lock(mutex_);
        handle = handle_;
    }
    signal_->unsubscribe(handle);
    sink_->close();
    LOG_INFO << "subscription " << id_ << ": " << reason << " after " << emitted_.load() << " event(s)";
}

const char* toString(Subscription::State state) {
    switch (state) {
    case Subscription::State::Init: return "init";
    case Subscription::State::Waiting: return "waiting";
    case Subscription::State::Emitting: return "emitting";
    case Subscription::State::Closed: return "closed";
    }
    return "unknown";
}
