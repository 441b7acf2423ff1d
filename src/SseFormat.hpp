#pragma once
#include <string>

// "event: <type>\n" followed by one "data: " line per line of data and a blank line.
std::string formatSseEvent(const std::string& type, const std::string& data);

// ": <text>\n\n", ignored by EventSource clients; used as keep-alive.
std::string formatSseComment(const std::string& text);
