#include "SearchEngine.hpp"
#include <algorithm>
#include <cstring>
#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/locale/generator.hpp>

namespace {

namespace utf = boost::locale::utf;

// Simple case fold of one code point. Folds that expand to several code
// points (German sharp s to "ss") leave the character unchanged.
utf::code_point fold_code_point(utf::code_point cp, const std::locale& locale) {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + ('a' - 'A') : cp;
    }
    std::string one = boost::locale::conv::utf_to_utf<char>(std::u32string(1, static_cast<char32_t>(cp)));
    std::u32string folded = boost::locale::conv::utf_to_utf<char32_t>(boost::locale::fold_case(one, locale));
    return folded.size() == 1 ? static_cast<utf::code_point>(folded[0]) : cp;
}

}  // namespace

SearchCursor::SearchCursor(std::shared_ptr<SegmentLoader> loader, std::string pattern, std::u32string foldedPattern,
                           std::locale foldLocale, CancelToken token, size_t segmentBytes,
                           std::shared_ptr<PerformanceMetrics> metrics, StatusSink* status)
    : loader_(std::move(loader)),
      pattern_(std::move(pattern)),
      foldedPattern_(std::move(foldedPattern)),
      foldLocale_(std::move(foldLocale)),
      token_(std::move(token)),
      segmentBytes_(segmentBytes),
      encoding_(loader_->encoding()),
      unit_(code_unit_size(encoding_)),
      bigEndian_(encoding_ == Encoding::Utf16BE),
      metrics_(std::move(metrics)),
      status_(status) {}

utf::code_point SearchCursor::decodeAt(size_t index, size_t& length) const {
    const char* begin = buffer_.data() + index;
    const char* end = buffer_.data() + buffer_.size();
    if (begin >= end) return utf::incomplete;
    switch (encoding_) {
        case Encoding::Latin1:
            length = 1;
            return static_cast<unsigned char>(*begin);
        case Encoding::Utf16LE:
        case Encoding::Utf16BE: {
            char16_t units[2];
            size_t count = 0;
            for (; count < 2 && begin + 2 * count + 1 < end; ++count) {
                auto first = static_cast<unsigned char>(begin[2 * count]);
                auto second = static_cast<unsigned char>(begin[2 * count + 1]);
                units[count] = bigEndian_ ? static_cast<char16_t>((first << 8) | second)
                                          : static_cast<char16_t>((second << 8) | first);
            }
            const char16_t* p = units;
            utf::code_point cp = utf::utf_traits<char16_t>::decode(p, static_cast<const char16_t*>(units + count));
            length = static_cast<size_t>(p - units) * 2;
            return cp;
        }
        default: {
            const char* p = begin;
            utf::code_point cp = utf::utf_traits<char>::decode(p, end);
            length = static_cast<size_t>(p - begin);
            return cp;
        }
    }
}

utf::code_point SearchCursor::fold(utf::code_point cp) {
    if (cp < 0x80) return fold_code_point(cp, foldLocale_);
    auto it = folded_.find(cp);
    if (it != folded_.end()) return it->second;
    utf::code_point result = fold_code_point(cp, foldLocale_);
    folded_.emplace(cp, result);
    return result;
}

SearchCursor::Match SearchCursor::matchAt(size_t index, bool lastSegment, size_t& matched) {
    if (foldedPattern_.empty()) {
        if (index + pattern_.size() > buffer_.size()) {
            return lastSegment ? Match::No : Match::NeedMore;
        }
        if (std::memcmp(buffer_.data() + index, pattern_.data(), pattern_.size()) != 0) return Match::No;
        matched = pattern_.size();
        return Match::Yes;
    }
    size_t pos = index;
    for (char32_t wanted : foldedPattern_) {
        size_t length = 0;
        utf::code_point cp = decodeAt(pos, length);
        if (cp == utf::incomplete) {
            return lastSegment ? Match::No : Match::NeedMore;
        }
        if (cp == utf::illegal || fold(cp) != static_cast<utf::code_point>(wanted)) return Match::No;
        pos += length;
    }
    matched = pos - index;
    return Match::Yes;
}

void SearchCursor::countLinesUpTo(uint64_t absolute) {
    size_t from = static_cast<size_t>(countedUpTo_ - bufferStart_);
    size_t to = static_cast<size_t>(absolute - bufferStart_);
    for (size_t i = from; i + unit_ <= to; i += unit_) {
        if (unit_ == 1) {
            if (buffer_[i] == '\n') ++linesBefore_;
        } else {
            size_t lo = bigEndian_ ? i + 1 : i;
            size_t hi = bigEndian_ ? i : i + 1;
            if (buffer_[lo] == '\n' && buffer_[hi] == 0) ++linesBefore_;
        }
    }
    countedUpTo_ = absolute;
}

Result<bool> SearchCursor::fill() {
    uint64_t size = loader_->fileSize();
    if (nextRead_ >= size) {
        return false;
    }
    // Keep only the candidates not yet checked; they are shorter than the
    // pattern and may complete with the next segment.
    countLinesUpTo(bufferStart_ + scanPos_);
    buffer_.erase(0, scanPos_);
    bufferStart_ += scanPos_;
    scanPos_ = 0;

    auto raw = loader_->loadRaw(nextRead_, segmentBytes_, token_);
    if (!raw) {
        return raw.error();
    }
    if (!raw.value()) {
        return make_error(ErrorKind::Cancelled, "Search cancelled");
    }
    const std::string& bytes = *raw.value();
    buffer_ += bytes;
    nextRead_ += bytes.size();
    metrics_->recordSearchBytes(bytes.size());

    int percent = static_cast<int>(nextRead_ * 100 / size);
    if (status_ && percent != lastPercent_) {
        status_->reportProgress(percent, "Searching...");
        lastPercent_ = percent;
    }
    return true;
}

Result<std::optional<SearchResult>> SearchCursor::next() {
    using NextResult = Result<std::optional<SearchResult>>;
    while (true) {
        if (token_.cancelled()) {
            return make_error(ErrorKind::Cancelled, "Search cancelled");
        }
        bool lastSegment = nextRead_ >= loader_->fileSize();
        while (scanPos_ < buffer_.size()) {
            size_t matched = 0;
            Match match = matchAt(scanPos_, lastSegment, matched);
            if (match == Match::NeedMore) break;
            if (match == Match::Yes) {
                uint64_t position = bufferStart_ + scanPos_;
                countLinesUpTo(position);
                SearchResult result{position, matched, linesBefore_};
                scanPos_ += matched;
                metrics_->recordSearchMatch();
                return NextResult(result);
            }
            scanPos_ += unit_;
        }
        auto more = fill();
        if (!more) {
            return more.error();
        }
        if (!more.value()) {
            return NextResult(std::nullopt);
        }
    }
}

SearchEngine::SearchEngine(std::shared_ptr<SegmentLoader> loader, ViewerConfig config,
                           std::shared_ptr<spdlog::logger> logger, std::shared_ptr<PerformanceMetrics> metrics)
    : loader_(std::move(loader)),
      config_(std::move(config)),
      logger_(std::move(logger)),
      metrics_(std::move(metrics)),
      foldLocale_(boost::locale::generator()("en_US.UTF-8")) {}

Result<SearchCursor> SearchEngine::search(const std::string& term, bool caseSensitive, const CancelToken& token,
                                          StatusSink* status) const {
    if (term.empty()) {
        return make_error(ErrorKind::InvalidArgument, "Search term must not be empty");
    }
    Encoding encoding = loader_->encoding();
    std::string pattern;
    try {
        pattern = encode_from_utf8(encoding, term);
    } catch (const std::exception& e) {
        return make_error(ErrorKind::InvalidArgument,
                          std::string("Search term cannot be represented in ") + encoding_name(encoding) + ": " + e.what());
    }
    if (pattern.empty()) {
        return make_error(ErrorKind::InvalidArgument, "Search term must not be empty");
    }
    size_t unit = code_unit_size(encoding);
    std::u32string foldedPattern;
    if (!caseSensitive) {
        for (char32_t cp : boost::locale::conv::utf_to_utf<char32_t>(term)) {
            foldedPattern.push_back(static_cast<char32_t>(fold_code_point(cp, foldLocale_)));
        }
    }

    // Segments hold whole code units so scanning stays aligned.
    size_t segmentBytes = static_cast<size_t>(std::max<uint64_t>(config_.searchSegmentBytes, unit));
    segmentBytes -= segmentBytes % unit;

    metrics_->recordSearch();
    logger_->debug("Search for {} bytes (case {}) over {} bytes", pattern.size(),
                   caseSensitive ? "sensitive" : "insensitive", loader_->fileSize());
    return SearchCursor(loader_, std::move(pattern), std::move(foldedPattern), foldLocale_, token, segmentBytes,
                        metrics_, status);
}

Result<std::vector<SearchResult>> SearchEngine::findAll(const std::string& term, bool caseSensitive,
                                                        const CancelToken& token, size_t limit,
                                                        StatusSink* status) const {
    auto cursor = search(term, caseSensitive, token, status);
    if (!cursor) {
        return cursor.error();
    }
    size_t cap = limit == 0 ? static_cast<size_t>(config_.maxSearchResults) : limit;
    std::vector<SearchResult> results;
    while (results.size() < cap) {
        auto match = cursor.value().next();
        if (!match) {
            return match.error();
        }
        if (!match.value()) break;
        results.push_back(*match.value());
    }
    if (results.size() == cap) {
        logger_->info("Search stopped at {} results", cap);
    }
    return results;
}
