#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "../src/LineUtils.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

struct LineSpan {
    size_t start;
    size_t textLength;   // without terminator
    size_t totalLength;  // with terminator
};

// Straightforward reference splitter: \n, \r, \r\n and \n\r each end one line.
static std::vector<LineSpan> reference_lines(const std::string& s) {
    std::vector<LineSpan> spans;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t start = pos;
        while (pos < s.size() && s[pos] != '\n' && s[pos] != '\r') ++pos;
        size_t textEnd = pos;
        if (pos < s.size()) {
            char first = s[pos++];
            if (pos < s.size() && (s[pos] == '\n' || s[pos] == '\r') && s[pos] != first) ++pos;
        }
        spans.push_back({start, textEnd - start, pos - start});
    }
    return spans;
}

static std::string random_text(std::mt19937& rng, int length) {
    std::uniform_int_distribution<int> pick(0, 99);
    std::string s;
    s.reserve(length);
    for (int i = 0; i < length; ++i) {
        int r = pick(rng);
        if (r < 3) {
            s.push_back('\n');
        } else if (r < 6) {
            s.push_back('\r');
        } else {
            s.push_back(static_cast<char>(' ' + (r % 95)));
        }
    }
    return s;
}

int main() {
    try {
        std::mt19937 rng(123456);
        std::uniform_int_distribution<int> lengths(0, 2048);

        for (int iter = 0; iter < 2000; ++iter) {
            std::string s = random_text(rng, lengths(rng));
            auto spans = reference_lines(s);

            ASSERT_TRUE(count_lines(s.data(), s.size()) == spans.size());

            auto lines = split_lines(s.data(), s.size());
            ASSERT_TRUE(lines.size() == spans.size());
            for (size_t i = 0; i < lines.size(); ++i) {
                ASSERT_TRUE(lines[i] == s.substr(spans[i].start, spans[i].textLength));
            }

            size_t terminated = std::count_if(spans.begin(), spans.end(),
                                              [](const LineSpan& l) { return l.totalLength > l.textLength; });
            ASSERT_TRUE(count_line_breaks(s.data(), s.size()) == terminated);

            size_t skip = skip_partial_line(s.data(), s.size());
            if (terminated == 0) {
                ASSERT_TRUE(skip == std::string::npos);
            } else {
                ASSERT_TRUE(skip == spans[0].totalLength);
            }

            for (int trial = 0; trial < 20; ++trial) {
                size_t start_line = rng() % (spans.size() + 2);
                size_t max_lines = rng() % (spans.size() + 1);
                size_t start_byte = 0, bytes_len = 0;
                bool ok = compute_line_byte_range(s.data(), s.size(), start_line, max_lines, start_byte, bytes_len);
                if (start_line > spans.size()) {
                    ASSERT_TRUE(!ok);
                    continue;
                }
                ASSERT_TRUE(ok);
                size_t expected_start = start_line == spans.size() ? s.size() : spans[start_line].start;
                size_t end_line = std::min(start_line + max_lines, spans.size());
                size_t expected_end = end_line == start_line ? expected_start
                                                             : spans[end_line - 1].start + spans[end_line - 1].totalLength;
                if (start_byte != expected_start || bytes_len != expected_end - expected_start) {
                    std::cerr << "Mismatch at iter=" << iter << " start_line=" << start_line << " max_lines=" << max_lines
                              << " expected (" << expected_start << ", " << expected_end - expected_start << ")"
                              << " got (" << start_byte << ", " << bytes_len << ")" << std::endl;
                    return 1;
                }
            }
        }

        std::string crlf = "L1\r\nL2\r\nL3\r\n";
        size_t sb = 0, bl = 0;
        ASSERT_TRUE(compute_line_byte_range(crlf.data(), crlf.size(), 1, 2, sb, bl));
        ASSERT_TRUE(crlf.substr(sb, bl) == "L2\r\nL3\r\n");

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All line utils fuzz tests passed" << std::endl;
    return 0;
}
