#include "FeedController.hpp"
#include <initializer_list>
#include <trantor/net/TcpConnection.h>
#include <trantor/utils/Logger.h>
#include "FeedErrors.hpp"
#include "FeedRenderer.hpp"

DrogonEventSink::DrogonEventSink(drogon::ResponseStreamPtr stream) : stream_(std::move(stream)) {}

DrogonEventSink::~DrogonEventSink() {
    close();
}

bool DrogonEventSink::send(const std::string& chunk) {
    std::lock_guard lock(mtx);
    if (!stream_ || overflowed_) {
        return false;
    }
    // queued on the connection's event loop; false once the client is gone
    return stream_->send(chunk);
}

void DrogonEventSink::close() {
    std::lock_guard lock(mtx);
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
}

void DrogonEventSink::markOverflowed() {
    overflowed_ = true;
}

bool DrogonEventSink::overflowed() const {
    return overflowed_;
}

namespace {
// First non-empty value among the given field names, from a JSON body or form parameters.
std::string submittedField(const drogon::HttpRequestPtr& req, std::initializer_list<const char*> names) {
    auto json = req->getJsonObject();
    for (const char* name : names) {
        if (json && json->isMember(name) && (*json)[name].isString()) {
            return (*json)[name].asString();
        }
        const std::string& value = req->getParameter(name);
        if (!value.empty()) {
            return value;
        }
    }
    return std::string();
}
}

FeedController::FeedController(FeedConfig config,
                               std::shared_ptr<PostStore> store,
                               std::shared_ptr<Publisher> publisher,
                               std::shared_ptr<SubscriptionHub> hub)
    : config_(std::move(config)), store_(std::move(store)), publisher_(std::move(publisher)), hub_(std::move(hub)) {}

drogon::HttpResponsePtr FeedController::errorResponse(drogon::HttpStatusCode status, const std::string& code, const std::string& message) {
    Json::Value body;
    body["error"]["code"] = code;
    body["error"]["message"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(status);
    return resp;
}

void FeedController::handlePage(const drogon::HttpRequestPtr&, Callback&& callback) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setContentTypeCode(drogon::CT_TEXT_HTML);
    resp->setBody(renderPage(store_->snapshot(), config_));
    callback(resp);
}

void FeedController::handleEvents(const drogon::HttpRequestPtr& req, Callback&& callback) {
    auto hub = hub_;
    std::string peer = req->peerAddr().toIpPort();
    std::weak_ptr<trantor::TcpConnection> weakConn = req->getConnectionPtr();
    size_t highWaterMark = config_.highWaterMarkBytes;
    auto resp = drogon::HttpResponse::newAsyncStreamResponse(
        [hub, peer, weakConn, highWaterMark](drogon::ResponseStreamPtr stream) {
            auto sink = std::make_shared<DrogonEventSink>(std::move(stream));
            // A client that stays connected but stops reading never fails a write;
            // drop it once its unsent output passes the mark.
            if (auto conn = weakConn.lock()) {
                std::weak_ptr<DrogonEventSink> weakSink = sink;
                conn->setHighWaterMarkCallback(
                    [weakSink, peer](const trantor::TcpConnectionPtr& c, size_t queued) {
                        LOG_WARN << "events: " << peer << " stalled with " << queued << " unsent bytes, dropping";
                        if (auto s = weakSink.lock()) {
                            s->markOverflowed();
                        }
                        c->forceClose();
                    },
                    highWaterMark);
            }
            try {
                uint64_t id = hub->open(sink);
                LOG_INFO << "events: subscription " << id << " for " << peer;
            } catch (const std::runtime_error& e) {
                LOG_WARN << "events: rejecting " << peer << ": " << e.what();
                sink->close();
            }
        },
        true);

    resp->setContentTypeCodeAndCustomString(drogon::CT_CUSTOM, "text/event-stream");
    resp->addHeader("Cache-Control", "no-cache");
    resp->addHeader("Connection", "keep-alive");
    resp->addHeader("X-Accel-Buffering", "no");
    callback(resp);
}

void FeedController::handleSubmit(const drogon::HttpRequestPtr& req, Callback&& callback) {
    std::string author = submittedField(req, {"author", "username"});
    std::string content = submittedField(req, {"content", "message"});
    std::string avatar = submittedField(req, {"avatar_ref", "avatar"});

    try {
        Post post = publisher_->createPost(author, content, avatar);
        auto resp = drogon::HttpResponse::newHttpJsonResponse(postToJson(post));
        resp->setStatusCode(drogon::k201Created);
        callback(resp);
    } catch (const ValidationError& e) {
        LOG_DEBUG << "submit: rejected from " << req->peerAddr().toIpPort() << ": " << e.what();
        callback(errorResponse(drogon::k400BadRequest, "validation_error", e.what()));
    } catch (const StoreFullError& e) {
        callback(errorResponse(drogon::k503ServiceUnavailable, "store_full", e.what()));
    }
}

void FeedController::handleList(const drogon::HttpRequestPtr&, Callback&& callback) {
    callback(drogon::HttpResponse::newHttpJsonResponse(postsToJson(store_->snapshot())));
}

void FeedController::registerRoutes(drogon::HttpAppFramework& app) {
    // qualified: drogon::Post would clash with ::Post
    auto route = [this](void (FeedController::*handler)(const drogon::HttpRequestPtr&, Callback&&)) {
        return [this, handler](const drogon::HttpRequestPtr& req, std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            (this->*handler)(req, std::move(callback));
        };
    };

    app.registerHandler("/", route(&FeedController::handlePage), {drogon::Get});
    app.registerHandler("/home", route(&FeedController::handlePage), {drogon::Get});
    app.registerHandler(config_.eventsUrl, route(&FeedController::handleEvents), {drogon::Get});
    if (config_.eventsUrl != "/home/sse") {
        app.registerHandler("/home/sse", route(&FeedController::handleEvents), {drogon::Get});
    }
    app.registerHandler("/posts", route(&FeedController::handleSubmit), {drogon::Post});
    app.registerHandler("/home", route(&FeedController::handleSubmit), {drogon::Post});
    app.registerHandler("/posts", route(&FeedController::handleList), {drogon::Get});
}
