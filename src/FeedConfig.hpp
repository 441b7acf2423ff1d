#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <json/json.h>
#include "Post.hpp"

// custom_config.feed section of the drogon config file.
struct FeedConfig {
    PostLimits limits;
    size_t maxPosts = 10000;
    std::chrono::seconds keepalive{15};
    std::string pageTitle = "livefeed";
    std::string eventsUrl = "/events";
    // unsent bytes one SSE connection may queue before it is dropped
    size_t highWaterMarkBytes = 4 * 1024 * 1024;

    // Missing keys keep their defaults. Throws std::invalid_argument on bad values.
    static FeedConfig fromJson(const Json::Value& feed);
};
