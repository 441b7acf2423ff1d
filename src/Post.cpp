#include "Post.hpp"
#include "FeedErrors.hpp"
#include "TextUtils.hpp"

void validatePost(Post& post, const PostLimits& limits) {
    post.author = trim(post.author);
    post.content = trim(post.content);

    if (post.author.empty()) {
        throw ValidationError("author must not be empty");
    }
    if (post.author.size() > limits.maxAuthorBytes) {
        throw ValidationError("author exceeds " + std::to_string(limits.maxAuthorBytes) + " bytes");
    }
    if (post.content.size() > limits.maxContentBytes) {
        throw ValidationError("content exceeds " + std::to_string(limits.maxContentBytes) + " bytes");
    }
    if (post.avatarRef.size() > limits.maxAvatarBytes) {
        throw ValidationError("avatar_ref exceeds " + std::to_string(limits.maxAvatarBytes) + " bytes");
    }
}

std::string formatTimestamp(const trantor::Date& date) {
    return date.toCustomFormattedString("%Y-%m-%dT%H:%M:%SZ", false);
}
