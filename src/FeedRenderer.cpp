#include "FeedRenderer.hpp"
#include "TextUtils.hpp"

namespace {
std::string renderCard(const Post& post) {
    std::string id = std::to_string(post.id);
    std::string html;
    html += "<div class=\"card mb-2 shadow-sm\" id=\"post-" + id + "\">\n";
    html += "<div class=\"card-body\">\n";
    html += "<div class=\"d-flex\">\n";
    html += "<img class=\"me-4\" src=\"" + htmlEscape(post.avatarRef) + "\" width=\"108\" />\n";
    html += "<div>\n";
    html += "<h5 class=\"card-title text-muted\">" + htmlEscape(post.author) + ": <small>" +
            formatTimestamp(post.createdAt) + "</small></h5>\n";
    html += "<div class=\"card-text lead mb-2\">" + htmlEscape(post.content) + "</div>\n";
    html += "</div>\n</div>\n</div>\n</div>\n";
    return html;
}
}

std::string renderFeed(const std::vector<Post>& posts) {
    std::string html = "<div class=\"feed\" data-count=\"" + std::to_string(posts.size()) + "\">\n";
    for (const auto& post : posts) {
        html += renderCard(post);
    }
    html += "</div>";
    return html;
}

std::string renderPage(const std::vector<Post>& posts, const FeedConfig& config) {
    std::string title = htmlEscape(config.pageTitle);
    std::string html;
    html += "<!DOCTYPE html>\n<html>\n<head>\n";
    html += "<meta charset=\"utf-8\" />\n";
    html += "<title>" + title + "</title>\n";
    html += "<link href=\"https://cdn.jsdelivr.net/npm/bootstrap@5.0.0-beta2/dist/css/bootstrap.min.css\" rel=\"stylesheet\" />\n";
    html += "<script src=\"https://unpkg.com/htmx.org@1.9.12\"></script>\n";
    html += "<script src=\"https://unpkg.com/htmx.org@1.9.12/dist/ext/sse.js\"></script>\n";
    html += "</head>\n<body>\n";
    html += "<nav class=\"navbar navbar-dark bg-dark shadow-sm py-0\"><span class=\"navbar-brand\">" + title + "</span></nav>\n";
    html += "<div class=\"container\">\n<main class=\"col-10 mx-auto\">\n";
    html += "<form hx-post=\"/posts\" hx-swap=\"none\" class=\"mt-3\">\n";
    html += "<input class=\"form-control mb-2\" name=\"author\" placeholder=\"Name\" maxlength=\"" +
            std::to_string(config.limits.maxAuthorBytes) + "\" required />\n";
    html += "<textarea class=\"form-control mb-2\" rows=\"3\" name=\"content\" maxlength=\"" +
            std::to_string(config.limits.maxContentBytes) + "\"></textarea>\n";
    html += "<button type=\"submit\" class=\"btn btn-primary mb-3\">Post</button>\n";
    html += "</form>\n";
    html += "<div hx-ext=\"sse\" sse-connect=\"" + htmlEscape(config.eventsUrl) + "\" sse-swap=\"message\">\n";
    html += renderFeed(posts);
    html += "\n</div>\n";
    html += "</main>\n</div>\n</body>\n</html>\n";
    return html;
}

Json::Value postToJson(const Post& post) {
    Json::Value value;
    value["id"] = static_cast<Json::UInt64>(post.id);
    value["author"] = post.author;
    value["content"] = post.content;
    value["created_at"] = formatTimestamp(post.createdAt);
    value["created_at_us"] = static_cast<Json::Int64>(post.createdAt.microSecondsSinceEpoch());
    value["avatar_ref"] = post.avatarRef;
    return value;
}

Json::Value postsToJson(const std::vector<Post>& posts) {
    Json::Value result(Json::arrayValue);
    for (const auto& post : posts) {
        result.append(postToJson(post));
    }
    return result;
}
