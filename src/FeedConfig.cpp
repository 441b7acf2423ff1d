#include "FeedConfig.hpp"
#include <stdexcept>

namespace {
size_t readPositive(const Json::Value& feed, const char* key, size_t fallback) {
    if (!feed.isMember(key)) {
        return fallback;
    }
    const Json::Value& value = feed[key];
    if (!value.isIntegral() || (value.isInt64() && value.asInt64() <= 0)) {
        throw std::invalid_argument(std::string("feed.") + key + " must be a positive integer");
    }
    return static_cast<size_t>(value.asUInt64());
}

std::string readString(const Json::Value& feed, const char* key, const std::string& fallback) {
    if (!feed.isMember(key)) {
        return fallback;
    }
    if (!feed[key].isString() || feed[key].asString().empty()) {
        throw std::invalid_argument(std::string("feed.") + key + " must be a non-empty string");
    }
    return feed[key].asString();
}
}

FeedConfig FeedConfig::fromJson(const Json::Value& feed) {
    FeedConfig config;
    if (feed.isNull()) {
        return config;
    }
    if (!feed.isObject()) {
        throw std::invalid_argument("feed config must be an object");
    }

    config.limits.maxAuthorBytes = readPositive(feed, "max_author_bytes", config.limits.maxAuthorBytes);
    config.limits.maxContentBytes = readPositive(feed, "max_content_bytes", config.limits.maxContentBytes);
    config.limits.maxAvatarBytes = readPositive(feed, "max_avatar_bytes", config.limits.maxAvatarBytes);
    config.maxPosts = readPositive(feed, "max_posts", config.maxPosts);
    config.keepalive = std::chrono::seconds(readPositive(feed, "keepalive_seconds", config.keepalive.count()));
    config.pageTitle = readString(feed, "page_title", config.pageTitle);
    config.eventsUrl = readString(feed, "events_url", config.eventsUrl);
    config.highWaterMarkBytes = readPositive(feed, "high_water_mark_bytes", config.highWaterMarkBytes);
    return config;
}
