#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include "../src/EventSink.hpp"

// In-memory EventSink for tests. "message" events are decoded back to their data.
class RecordingSink : public EventSink {
public:
    bool send(const std::string& chunk) override {
        std::lock_guard lock(mtx);
        if (failing || closed) {
            ++rejected;
            cv.notify_all();
            return false;
        }
        chunks.push_back(chunk);
        const std::string prefix = "event: message\ndata: ";
        if (chunk.compare(0, prefix.size(), prefix) == 0) {
            std::string data = chunk.substr(prefix.size());
            while (!data.empty() && data.back() == '\n') data.pop_back();
            messages.push_back(data);
        } else if (chunk.compare(0, 2, ": ") == 0) {
            ++keepalives;
        }
        cv.notify_all();
        return true;
    }

    void close() override {
        std::lock_guard lock(mtx);
        closed = true;
        cv.notify_all();
    }

    void setFailing(bool value) {
        std::lock_guard lock(mtx);
        failing = value;
    }

    bool waitForMessages(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mtx);
        return cv.wait_for(lock, timeout, [&] { return messages.size() >= count; });
    }

    bool waitForLastMessage(const std::string& data, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mtx);
        return cv.wait_for(lock, timeout, [&] { return !messages.empty() && messages.back() == data; });
    }

    bool waitForKeepalives(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mtx);
        return cv.wait_for(lock, timeout, [&] { return keepalives >= count; });
    }

    bool waitClosed(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mtx);
        return cv.wait_for(lock, timeout, [&] { return closed; });
    }

    std::vector<std::string> messageList() {
        std::lock_guard lock(mtx);
        return messages;
    }

    bool isClosed() {
        std::lock_guard lock(mtx);
        return closed;
    }

private:
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::string> chunks;
    std::vector<std::string> messages;
    size_t keepalives = 0;
    size_t rejected = 0;
    bool failing = false;
    bool closed = false;
};
