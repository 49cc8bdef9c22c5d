#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>
#include "CancelToken.hpp"
#include "MappedFile.hpp"
#include "PerformanceMetrics.hpp"
#include "ReadGate.hpp"
#include "Result.hpp"
#include "TextEncoding.hpp"
#include "ViewerConfig.hpp"

struct TextSegment {
    int64_t startPosition = 0;  // file offset of the first consumed byte
    int64_t length = 0;         // bytes consumed from the file
    std::string content;        // decoded UTF-8
};

// A value is a loaded segment; nullopt means the load was cancelled.
using LoadResult = Result<std::optional<TextSegment>>;
using RawResult = Result<std::optional<std::string>>;

// Where the viewport controller gets its text from.
class SegmentSource {
public:
    virtual ~SegmentSource() = default;

    virtual LoadResult load(int64_t startPosition, int64_t length, const CancelToken& token) = 0;
    virtual uint64_t fileSize() const = 0;
    virtual Encoding encoding() const = 0;
};

class SegmentLoader : public SegmentSource {
public:
    SegmentLoader(std::shared_ptr<MappedFile> file, Encoding encoding, ViewerConfig config,
                  std::shared_ptr<spdlog::logger> logger, std::shared_ptr<PerformanceMetrics> metrics,
                  std::shared_ptr<ReadGate> gate);

    // Loads [startPosition, startPosition + length) clamped to the end of the
    // file and to max_segment_bytes, moved to character boundaries, decoded
    // and (optionally) with line endings normalized.
    LoadResult load(int64_t startPosition, int64_t length, const CancelToken& token) override;

    // Raw bytes of [offset, offset + length) clamped to the end of the file,
    // without boundary adjustment or decoding.
    RawResult loadRaw(uint64_t offset, size_t length, const CancelToken& token);

    uint64_t fileSize() const override;
    Encoding encoding() const override;

private:
    RawResult readBytes(uint64_t offset, size_t length, const CancelToken& token);
    LoadResult cancelled(uint64_t offset);

    std::shared_ptr<MappedFile> file_;
    Encoding encoding_;
    ViewerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PerformanceMetrics> metrics_;
    std::shared_ptr<ReadGate> gate_;
};
