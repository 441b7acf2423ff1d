#pragma once
#include <atomic>
#include <drogon/drogon.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "EventSink.hpp"
#include "FeedConfig.hpp"
#include "PostStore.hpp"
#include "Publisher.hpp"
#include "SubscriptionHub.hpp"

// EventSink over a drogon async stream response.
class DrogonEventSink : public EventSink {
public:
    explicit DrogonEventSink(drogon::ResponseStreamPtr stream);
    ~DrogonEventSink() override;

    bool send(const std::string& chunk) override;
    void close() override;

    // The client stopped reading and its output buffer passed the high-water
    // mark. Every later send() fails.
    void markOverflowed();
    bool overflowed() const;

private:
    std::mutex mtx;
    drogon::ResponseStreamPtr stream_;
    std::atomic<bool> overflowed_{false};
};

// HTTP surface of the feed: page, SSE stream, submit and JSON list.
class FeedController {
public:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    FeedController(FeedConfig config,
                   std::shared_ptr<PostStore> store,
                   std::shared_ptr<Publisher> publisher,
                   std::shared_ptr<SubscriptionHub> hub);

    void registerRoutes(drogon::HttpAppFramework& app);

    void handlePage(const drogon::HttpRequestPtr& req, Callback&& callback);
    void handleEvents(const drogon::HttpRequestPtr& req, Callback&& callback);
    void handleSubmit(const drogon::HttpRequestPtr& req, Callback&& callback);
    void handleList(const drogon::HttpRequestPtr& req, Callback&& callback);

    static drogon::HttpResponsePtr errorResponse(drogon::HttpStatusCode status, const std::string& code, const std::string& message);

private:
    FeedConfig config_;
    std::shared_ptr<PostStore> store_;
    std::shared_ptr<Publisher> publisher_;
    std::shared_ptr<SubscriptionHub> hub_;
};
