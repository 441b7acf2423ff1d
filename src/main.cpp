#include <drogon/drogon.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include "ChangeSignal.hpp"
#include "FeedConfig.hpp"
#include "FeedController.hpp"
#include "FeedRenderer.hpp"
#include "PostStore.hpp"
#include "Publisher.hpp"
#include "SubscriptionHub.hpp"

int main(int argc, char* argv[]) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    if (std::filesystem::exists(configPath)) {
        app().loadConfigFile(configPath);
        LOG_INFO << "Loaded config " << configPath;
    } else {
        LOG_WARN << "No config file at " << configPath << ", listening on 0.0.0.0:8080 with defaults";
        app().addListener("0.0.0.0", 8080);
    }

    FeedConfig config;
    try {
        config = FeedConfig::fromJson(app().getCustomConfig()["feed"]);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR << "Invalid feed config: " << e.what();
        return 1;
    }
    LOG_INFO << "Feed limits: author " << config.limits.maxAuthorBytes << " B, content " << config.limits.maxContentBytes
             << " B, " << config.maxPosts << " posts, keep-alive " << config.keepalive.count() << " s";

    auto signal = std::make_shared<ChangeSignal>();
    auto store = std::make_shared<PostStore>(signal, config.limits, config.maxPosts);
    auto publisher = std::make_shared<Publisher>(store);
    auto hub = std::make_shared<SubscriptionHub>(store, &renderFeed, std::chrono::duration_cast<std::chrono::milliseconds>(config.keepalive));
    auto controller = std::make_shared<FeedController>(config, store, publisher, hub);
    controller->registerRoutes(app());

    // CORS support
    app().registerPreHandlingAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    // Wake and join every streaming subscription before the event loops stop.
    auto stop = [hub] {
        LOG_INFO << "Shutting down";
        hub->shutdown();
        app().quit();
    };
    app().setTermSignalHandler(stop);
    app().setIntSignalHandler(stop);

    LOG_INFO << "livefeed starting";
    LOG_INFO << "  page:   GET  /";
    LOG_INFO << "  events: GET  " << config.eventsUrl;
    LOG_INFO << "  submit: POST /posts";
    app().run();

    hub->shutdown();
    return 0;
}
