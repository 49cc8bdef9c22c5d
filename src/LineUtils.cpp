#include "LineUtils.hpp"

namespace {

inline bool is_break(char c) {
    return c == '\n' || c == '\r';
}

// Length of the terminator at 'pos' (0, 1 or 2 bytes).
inline size_t terminator_length(const char* data, size_t total_size, size_t pos) {
    if (pos >= total_size || !is_break(data[pos])) return 0;
    char ch = data[pos];
    // handle mixed \r\n or \n\r
    if (pos + 1 < total_size && is_break(data[pos + 1]) && data[pos + 1] != ch) return 2;
    return 1;
}

}  // namespace

size_t next_line_end(const char* data, size_t total_size, size_t pos) {
    while (pos < total_size && !is_break(data[pos])) ++pos;
    return pos + terminator_length(data, total_size, pos);
}

bool compute_line_byte_range(const char* data, size_t total_size, size_t start_line, size_t max_lines, size_t &start_byte, size_t &bytes_len) {
    start_byte = 0;
    bytes_len = 0;
    size_t pos = 0;
    size_t current_line = 0;

    // Find the byte index for the start_line
    while (pos < total_size && current_line < start_line) {
        pos = next_line_end(data, total_size, pos);
        ++current_line;
    }

    if (current_line < start_line) {
        // start_line beyond EOF
        return false;
    }
    start_byte = pos;

    if (max_lines == 0) {
        return true;
    }

    size_t lines_read = 0;
    size_t end_pos = pos;
    while (end_pos < total_size && lines_read < max_lines) {
        end_pos = next_line_end(data, total_size, end_pos);
        ++lines_read;
    }

    bytes_len = end_pos - start_byte;
    return true;
}

size_t count_line_breaks(const char* data, size_t total_size) {
    size_t breaks = 0;
    size_t pos = 0;
    while (pos < total_size) {
        if (!is_break(data[pos])) {
            ++pos;
            continue;
        }
        pos += terminator_length(data, total_size, pos);
        ++breaks;
    }
    return breaks;
}

size_t count_lines(const char* data, size_t total_size) {
    size_t lines = 0;
    size_t pos = 0;
    while (pos < total_size) {
        pos = next_line_end(data, total_size, pos);
        ++lines;
    }
    return lines;
}

size_t skip_partial_line(const char* data, size_t total_size) {
    size_t pos = 0;
    while (pos < total_size && !is_break(data[pos])) ++pos;
    if (pos == total_size) return std::string::npos;
    return pos + terminator_length(data, total_size, pos);
}

std::vector<std::string> split_lines(const char* data, size_t total_size) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < total_size) {
        size_t text_end = pos;
        while (text_end < total_size && !is_break(data[text_end])) ++text_end;
        lines.emplace_back(data + pos, text_end - pos);
        pos = text_end + terminator_length(data, total_size, text_end);
    }
    return lines;
}
