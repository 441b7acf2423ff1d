#pragma once
#include <functional>
#include <memory>
#include <string>
#include <trantor/utils/Date.h>
#include "PostStore.hpp"

// Write path: builds a post from a submission and appends it to the store.
class Publisher {
public:
    using Clock = std::function<trantor::Date()>;

    explicit Publisher(std::shared_ptr<PostStore> store, Clock clock = &trantor::Date::now);

    // Throws ValidationError / StoreFullError from PostStore::append.
    Post createPost(const std::string& author, const std::string& content, const std::string& avatarRef = "");

    static std::string defaultAvatar(const std::string& author);

private:
    std::shared_ptr<PostStore> store_;
    Clock clock_;
};
