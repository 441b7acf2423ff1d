#include "Publisher.hpp"
#include <stdexcept>
#include "TextUtils.hpp"

Publisher::Publisher(std::shared_ptr<PostStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("Publisher requires a post store");
    }
}

Post Publisher::createPost(const std::string& author, const std::string& content, const std::string& avatarRef) {
    Post post;
    post.author = author;
    post.content = content;
    post.createdAt = clock_();
    std::string avatar = trim(avatarRef);
    post.avatarRef = avatar.empty() ? defaultAvatar(trim(author)) : avatar;
    return store_->append(std::move(post));
}

std::string Publisher::defaultAvatar(const std::string& author) {
    return "https://ui-avatars.com/api/?background=random&rounded=true&name=" + percentEncode(author);
}
