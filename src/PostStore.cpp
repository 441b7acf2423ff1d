#include "PostStore.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <trantor/utils/Logger.h>
#include "FeedErrors.hpp"

PostStore::PostStore(std::shared_ptr<ChangeSignal> signal, PostLimits limits, size_t maxPosts)
    : signal_(std::move(signal)), limits_(limits), maxPosts_(maxPosts) {
    if (!signal_) {
        throw std::invalid_argument("PostStore requires a change signal");
    }
    posts_.reserve(std::min<size_t>(maxPosts_, 1024));
}

Post PostStore::append(Post post) {
    validatePost(post, limits_);

    {
        std::unique_lock lock(mutex_);
        if (posts_.size() >= maxPosts_) {
            LOG_WARN << "post store: rejecting post from '" << post.author << "', limit of " << maxPosts_ << " reached";
            throw StoreFullError("post limit of " + std::to_string(maxPosts_) + " reached");
        }
        // created_at never goes backward, even if the wall clock does
        if (!posts_.empty() && post.createdAt < posts_.back().createdAt) {
            post.createdAt = posts_.back().createdAt;
        }
        post.id = posts_.size() + 1;
        posts_.push_back(post);
    }

    LOG_DEBUG << "post store: appended post " << post.id << " by '" << post.author << "'";
    signal_->notify();
    return post;
}

std::vector<Post> PostStore::snapshot() const {
    std::shared_lock lock(mutex_);
    return posts_;
}

size_t PostStore::size() const {
    std::shared_lock lock(mutex_);
    return posts_.size();
}
