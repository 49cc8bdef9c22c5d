#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

enum class Encoding {
    Utf8,
    Utf8Bom,
    Utf16LE,
    Utf16BE,
    Latin1
};

// Charset name understood by Boost.Locale ("UTF-8", "UTF-16LE", ...).
const char* encoding_name(Encoding encoding);

size_t bom_length(Encoding encoding);

// Bytes per code unit: 2 for UTF-16, 1 otherwise.
size_t code_unit_size(Encoding encoding);

// Detects the encoding of a file from a prefix sample (BOM, UTF-16 NUL
// heuristic, UTF-8 validity, Latin-1 otherwise).
Encoding detect_encoding(const char* data, size_t size);

// Byte range [begin, end) within a buffer whose first byte sits at file offset
// 'base'. 'available' is how many bytes of the buffer may be used when an end
// has to be extended.
struct ByteWindow {
    size_t begin;
    size_t end;
};

// Moves 'begin' forward and 'end' forward or back so the window neither starts
// nor ends inside a character. For single-byte-unit encodings a trailing CR
// followed by LF is pulled into the window.
ByteWindow adjust_to_char_boundaries(Encoding encoding, const char* data, size_t available,
                                     uint64_t base, size_t begin, size_t end);

// Converts raw bytes in 'encoding' to UTF-8. Throws std::runtime_error when
// the charset conversion is unavailable.
std::string decode_to_utf8(Encoding encoding, const char* data, size_t size);

// Converts a UTF-8 string into the raw byte form it takes in 'encoding'.
// Throws std::runtime_error for characters the encoding cannot represent.
std::string encode_from_utf8(Encoding encoding, const std::string& text);

// Replaces CRLF and lone CR with LF.
std::string normalize_line_endings(const std::string& text);
