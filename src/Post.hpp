#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <trantor/utils/Date.h>

struct Post {
    uint64_t id = 0; // assigned by PostStore, 1-based
    std::string author;
    std::string content;
    trantor::Date createdAt;
    std::string avatarRef;
};

struct PostLimits {
    size_t maxAuthorBytes = 64;
    size_t maxContentBytes = 1000;
    size_t maxAvatarBytes = 2048;
};

// Trims author and content in place, then checks them against the limits.
// Throws ValidationError without touching anything else.
void validatePost(Post& post, const PostLimits& limits);

// ISO-8601 UTC, e.g. 2024-05-01T12:30:00Z
std::string formatTimestamp(const trantor::Date& date);
