#pragma once
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <vector>
#include "ChangeSignal.hpp"
#include "Post.hpp"

// Append-only, in-memory list of posts. Every successful append notifies the
// change signal after the post is visible to snapshot().
class PostStore {
public:
    PostStore(std::shared_ptr<ChangeSignal> signal, PostLimits limits = PostLimits(), size_t maxPosts = 10000);

    // Validates, assigns id and timestamp, stores and notifies. Returns the stored post.
    // Throws ValidationError or StoreFullError; the store is unchanged in both cases.
    Post append(Post post);

    std::vector<Post> snapshot() const;
    size_t size() const;

    const PostLimits& limits() const { return limits_; }
    size_t maxPosts() const { return maxPosts_; }
    const std::shared_ptr<ChangeSignal>& signal() const { return signal_; }

private:
    std::shared_ptr<ChangeSignal> signal_;
    PostLimits limits_;
    size_t maxPosts_;
    std::vector<Post> posts_;
    mutable std::shared_mutex mutex_;
};
