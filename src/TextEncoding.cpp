#include "TextEncoding.hpp"
#include <boost/locale/encoding.hpp>

namespace {

inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Sequence length announced by a UTF-8 lead byte; 1 for ASCII and for bytes
// that cannot start a sequence.
inline size_t utf8_sequence_length(unsigned char c) {
    if (c >= 0xF0 && c <= 0xF4) return 4;
    if (c >= 0xE0) return c <= 0xEF ? 3 : 1;
    if (c >= 0xC2) return 2;
    return 1;
}

bool is_valid_utf8(const unsigned char* data, size_t size) {
    size_t pos = 0;
    while (pos < size) {
        unsigned char c = data[pos];
        if (c < 0x80) {
            ++pos;
            continue;
        }
        size_t need = utf8_sequence_length(c);
        if (need == 1) return false;
        for (size_t i = 1; i < need; ++i) {
            if (pos + i >= size) return true;  // sample cut mid-sequence
            if (!is_continuation(data[pos + i])) return false;
        }
        pos += need;
    }
    return true;
}

inline uint16_t utf16_unit(Encoding encoding, const char* data, size_t pos) {
    auto lo = static_cast<unsigned char>(data[pos]);
    auto hi = static_cast<unsigned char>(data[pos + 1]);
    if (encoding == Encoding::Utf16BE) std::swap(lo, hi);
    return static_cast<uint16_t>(lo | (hi << 8));
}

inline bool is_high_surrogate(uint16_t unit) { return unit >= 0xD800 && unit <= 0xDBFF; }
inline bool is_low_surrogate(uint16_t unit) { return unit >= 0xDC00 && unit <= 0xDFFF; }

ByteWindow adjust_utf8(const char* data, size_t available, size_t begin, size_t end) {
    size_t skipped = 0;
    while (begin < available && skipped < 3 && is_continuation(static_cast<unsigned char>(data[begin]))) {
        ++begin;
        ++skipped;
    }
    // A window inside one character collapses to the next character start.
    if (end < begin) end = begin;
    // A lead byte within the last three bytes may announce a sequence that
    // runs past 'end'.
    size_t p = end;
    for (size_t back = 0; p > begin && back < 3; ++back) {
        --p;
        auto c = static_cast<unsigned char>(data[p]);
        if (is_continuation(c)) continue;
        size_t need = utf8_sequence_length(c);
        if (p + need > end) {
            if (p + need <= available) {
                end = p + need;
            } else if (p > begin) {
                end = p;
            }
        }
        break;
    }
    return {begin, end};
}

ByteWindow adjust_utf16(Encoding encoding, const char* data, size_t available, uint64_t base,
                        size_t begin, size_t end) {
    if ((base + begin) % 2 != 0) ++begin;
    if (begin + 2 <= end && is_low_surrogate(utf16_unit(encoding, data, begin))) begin += 2;
    if (end < begin) end = begin;

    if ((base + end) % 2 != 0) {
        if (end + 1 <= available) {
            ++end;
        } else {
            --end;
        }
    }
    if (end >= begin + 2 && is_high_surrogate(utf16_unit(encoding, data, end - 2))) {
        if (end + 2 <= available) {
            end += 2;
        } else {
            end -= 2;
        }
    }
    if (end < begin) end = begin;
    return {begin, end};
}

}  // namespace

const char* encoding_name(Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8: return "UTF-8";
        case Encoding::Utf8Bom: return "UTF-8";
        case Encoding::Utf16LE: return "UTF-16LE";
        case Encoding::Utf16BE: return "UTF-16BE";
        case Encoding::Latin1: return "ISO-8859-1";
    }
    return "UTF-8";
}

size_t bom_length(Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8Bom: return 3;
        case Encoding::Utf16LE:
        case Encoding::Utf16BE: return 2;
        default: return 0;
    }
}

size_t code_unit_size(Encoding encoding) {
    return (encoding == Encoding::Utf16LE || encoding == Encoding::Utf16BE) ? 2 : 1;
}

Encoding detect_encoding(const char* data, size_t size) {
    auto bytes = reinterpret_cast<const unsigned char*>(data);
    if (size >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF) {
        return Encoding::Utf8Bom;
    }
    if (size >= 2 && bytes[0] == 0xFF && bytes[1] == 0xFE) {
        return Encoding::Utf16LE;
    }
    if (size >= 2 && bytes[0] == 0xFE && bytes[1] == 0xFF) {
        return Encoding::Utf16BE;
    }

    // ASCII text stored as UTF-16 has a NUL in every other byte.
    if (size >= 4) {
        size_t nulOdd = 0;
        size_t nulEven = 0;
        for (size_t i = 0; i + 1 < size; i += 2) {
            if (bytes[i] == 0) ++nulEven;
            if (bytes[i + 1] == 0) ++nulOdd;
        }
        size_t pairs = size / 2;
        if (nulOdd * 4 > pairs && nulEven * 4 <= pairs) return Encoding::Utf16LE;
        if (nulEven * 4 > pairs && nulOdd * 4 <= pairs) return Encoding::Utf16BE;
    }

    return is_valid_utf8(bytes, size) ? Encoding::Utf8 : Encoding::Latin1;
}

ByteWindow adjust_to_char_boundaries(Encoding encoding, const char* data, size_t available,
                                     uint64_t base, size_t begin, size_t end) {
    if (end > available) end = available;
    if (begin > end) begin = end;

    ByteWindow window{begin, end};
    switch (encoding) {
        case Encoding::Utf8:
        case Encoding::Utf8Bom:
            window = adjust_utf8(data, available, begin, end);
            break;
        case Encoding::Utf16LE:
        case Encoding::Utf16BE:
            return adjust_utf16(encoding, data, available, base, begin, end);
        case Encoding::Latin1:
            break;
    }

    if (window.end > window.begin && window.end < available &&
        data[window.end - 1] == '\r' && data[window.end] == '\n') {
        ++window.end;
    }
    return window;
}

std::string decode_to_utf8(Encoding encoding, const char* data, size_t size) {
    switch (encoding) {
        case Encoding::Utf8:
        case Encoding::Utf8Bom:
            return std::string(data, size);
        default:
            return boost::locale::conv::to_utf<char>(data, data + size, encoding_name(encoding));
    }
}

std::string encode_from_utf8(Encoding encoding, const std::string& text) {
    switch (encoding) {
        case Encoding::Utf8:
        case Encoding::Utf8Bom:
            return text;
        default:
            return boost::locale::conv::from_utf<char>(text, encoding_name(encoding), boost::locale::conv::stop);
    }
}

std::string normalize_line_endings(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out.push_back(c);
        }
    }
    return out;
}
