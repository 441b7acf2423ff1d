#include "SseFormat.hpp"
#include "TextUtils.hpp"

std::string formatSseEvent(const std::string& type, const std::string& data) {
    std::string event = "event: " + type + "\n";
    for (const auto& line : splitLines(data)) {
        event += "data: " + line + "\n";
    }
    event += "\n";
    return event;
}

std::string formatSseComment(const std::string& text) {
    std::string comment;
    for (const auto& line : splitLines(text)) {
        comment += ": " + line + "\n";
    }
    comment += "\n";
    return comment;
}
