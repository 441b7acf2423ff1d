#pragma once
#include <string>
#include <vector>

// Strips leading and trailing spaces, tabs, CR and LF.
std::string trim(const std::string& s);

// Escapes &, <, >, " and ' for use in HTML text and attribute values.
std::string htmlEscape(const std::string& s);

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string percentEncode(const std::string& s);

// Splits on \n, \r, \r\n and \n\r. A trailing newline does not produce an extra empty line.
std::vector<std::string> splitLines(const std::string& s);
