#pragma once
#include <string>
#include <vector>
#include <json/json.h>
#include "FeedConfig.hpp"
#include "Post.hpp"

// HTML fragment swapped into the page by every SSE "message" event.
std::string renderFeed(const std::vector<Post>& posts);

// Full page: layout, submit form and the current feed inside the SSE container.
std::string renderPage(const std::vector<Post>& posts, const FeedConfig& config);

Json::Value postToJson(const Post& post);
Json::Value postsToJson(const std::vector<Post>& posts);
