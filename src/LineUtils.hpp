#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Line rules shared by every helper here: CR, LF, CRLF and LFCR each end one
// line; a trailing run of text without a terminator is a line of its own.

// Returns the position just past the line that starts at 'pos' (including its
// terminator). Returns total_size when the line runs to the end of the data.
size_t next_line_end(const char* data, size_t total_size, size_t pos);

// Helper: compute byte range for 'lines' format. Returns false if start_line is beyond EOF.
bool compute_line_byte_range(const char* data, size_t total_size, size_t start_line, size_t max_lines, size_t &start_byte, size_t &bytes_len);

// Number of line terminators in the data.
size_t count_line_breaks(const char* data, size_t total_size);

// Number of lines, counting an unterminated trailing line.
size_t count_lines(const char* data, size_t total_size);

// Position just past the first line terminator, or npos if the data has none.
size_t skip_partial_line(const char* data, size_t total_size);

// Splits into lines with terminators removed.
std::vector<std::string> split_lines(const char* data, size_t total_size);
