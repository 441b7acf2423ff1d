#include <iostream>
#include <string>
#include "../src/SseFormat.hpp"
#include "../src/TextUtils.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        // 1) trim
        ASSERT_TRUE(trim("") == "");
        ASSERT_TRUE(trim(" \t\r\n") == "");
        ASSERT_TRUE(trim("  alice ") == "alice");
        ASSERT_TRUE(trim("a b") == "a b");

        // 2) html escaping
        ASSERT_TRUE(htmlEscape("<b>\"Tom\" & 'Jerry'</b>") == "&lt;b&gt;&quot;Tom&quot; &amp; &#39;Jerry&#39;&lt;/b&gt;");
        ASSERT_TRUE(htmlEscape("plain") == "plain");

        // 3) percent encoding keeps unreserved characters only
        ASSERT_TRUE(percentEncode("bob smith") == "bob%20smith");
        ASSERT_TRUE(percentEncode("a-b_c.d~e") == "a-b_c.d~e");
        ASSERT_TRUE(percentEncode("\xC3\xA9") == "%C3%A9");

        // 4) mixed newline sequences
        auto lines = splitLines("A\nB\r\nC\rD\n");
        ASSERT_TRUE(lines.size() == 4);
        ASSERT_TRUE(lines[0] == "A" && lines[1] == "B" && lines[2] == "C" && lines[3] == "D");

        // 5) blank lines in the middle survive
        lines = splitLines("a\n\nb");
        ASSERT_TRUE(lines.size() == 3);
        ASSERT_TRUE(lines[1].empty());

        // 6) empty input is one empty line
        lines = splitLines("");
        ASSERT_TRUE(lines.size() == 1 && lines[0].empty());

        // 7) SSE framing: one data line per input line
        ASSERT_TRUE(formatSseEvent("message", "<div>\n<p>hi</p>\n</div>") ==
                    "event: message\ndata: <div>\ndata: <p>hi</p>\ndata: </div>\n\n");
        ASSERT_TRUE(formatSseEvent("message", "") == "event: message\ndata: \n\n");
        ASSERT_TRUE(formatSseComment("keepalive") == ": keepalive\n\n");

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All text utils tests passed" << std::endl;
    return 0;
}
