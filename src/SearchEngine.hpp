#pragma once
#include <cstdint>
#include <locale>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/locale/utf.hpp>
#include <spdlog/logger.h>
#include "CancelToken.hpp"
#include "Collaborators.hpp"
#include "PerformanceMetrics.hpp"
#include "Result.hpp"
#include "SegmentLoader.hpp"

struct SearchResult {
    uint64_t position = 0;    // absolute byte offset of the match
    uint64_t length = 0;      // match length in file bytes (case folding may change it)
    uint64_t lineNumber = 0;  // zero-based, counted from LF code units
};

// One pass over the file. Results come out in ascending position order; a
// new pass needs a new cursor.
class SearchCursor {
public:
    // A value is the next match, nullopt is end of file. Cancelled when the
    // token fires; read errors are passed through.
    Result<std::optional<SearchResult>> next();

    // Bytes of the file read so far.
    uint64_t scanned() const { return nextRead_; }

private:
    friend class SearchEngine;
    SearchCursor(std::shared_ptr<SegmentLoader> loader, std::string pattern, std::u32string foldedPattern,
                 std::locale foldLocale, CancelToken token, size_t segmentBytes,
                 std::shared_ptr<PerformanceMetrics> metrics, StatusSink* status);

    enum class Match { No, Yes, NeedMore };

    // NeedMore when the buffer ends before the comparison is decided and more
    // of the file remains; 'matched' receives the match length in bytes.
    Match matchAt(size_t index, bool lastSegment, size_t& matched);
    // Code point at buffer_[index]; utf::incomplete past the buffer end.
    boost::locale::utf::code_point decodeAt(size_t index, size_t& length) const;
    boost::locale::utf::code_point fold(boost::locale::utf::code_point cp);
    void countLinesUpTo(uint64_t absolute);
    Result<bool> fill();

    std::shared_ptr<SegmentLoader> loader_;
    std::string pattern_;          // encoded term, matched byte for byte when case-sensitive
    std::u32string foldedPattern_;  // case-folded code points, empty when case-sensitive
    std::locale foldLocale_;
    std::unordered_map<boost::locale::utf::code_point, boost::locale::utf::code_point> folded_;
    CancelToken token_;
    size_t segmentBytes_;
    Encoding encoding_;
    size_t unit_;
    bool bigEndian_;
    std::shared_ptr<PerformanceMetrics> metrics_;
    StatusSink* status_;

    std::string buffer_;        // unscanned bytes starting at bufferStart_
    uint64_t bufferStart_ = 0;
    size_t scanPos_ = 0;
    uint64_t nextRead_ = 0;
    uint64_t countedUpTo_ = 0;
    uint64_t linesBefore_ = 0;
    int lastPercent_ = -1;
};

class SearchEngine {
public:
    SearchEngine(std::shared_ptr<SegmentLoader> loader, ViewerConfig config,
                 std::shared_ptr<spdlog::logger> logger, std::shared_ptr<PerformanceMetrics> metrics);

    // Starts a pass from position 0. InvalidArgument for an empty term or one
    // that cannot be expressed in the file's encoding. Case-insensitive passes
    // compare Unicode simple case folds of decoded characters.
    Result<SearchCursor> search(const std::string& term, bool caseSensitive, const CancelToken& token,
                                StatusSink* status = nullptr) const;

    // Drains a cursor, stopping after 'limit' matches (0 uses max_search_results).
    Result<std::vector<SearchResult>> findAll(const std::string& term, bool caseSensitive,
                                              const CancelToken& token, size_t limit = 0,
                                              StatusSink* status = nullptr) const;

private:
    std::shared_ptr<SegmentLoader> loader_;
    ViewerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PerformanceMetrics> metrics_;
    std::locale foldLocale_;
};
