#include "SegmentLoader.hpp"
#include <algorithm>
#include <chrono>
#include <new>
#include <boost/interprocess/exceptions.hpp>

SegmentLoader::SegmentLoader(std::shared_ptr<MappedFile> file, Encoding encoding, ViewerConfig config,
                             std::shared_ptr<spdlog::logger> logger, std::shared_ptr<PerformanceMetrics> metrics,
                             std::shared_ptr<ReadGate> gate)
    : file_(std::move(file)),
      encoding_(encoding),
      config_(std::move(config)),
      logger_(std::move(logger)),
      metrics_(std::move(metrics)),
      gate_(std::move(gate)) {}

uint64_t SegmentLoader::fileSize() const {
    return file_->size();
}

Encoding SegmentLoader::encoding() const {
    return encoding_;
}

LoadResult SegmentLoader::cancelled(uint64_t offset) {
    metrics_->recordCancelledLoad();
    logger_->debug("Segment load at {} cancelled, partial read discarded", offset);
    return LoadResult(std::nullopt);
}

RawResult SegmentLoader::readBytes(uint64_t offset, size_t length, const CancelToken& token) {
    auto permit = gate_->acquire(token);
    if (!permit) {
        return RawResult(std::nullopt);
    }
    try {
        auto region = file_->map(offset, length);
        const char* base = static_cast<const char*>(region.get_address());
        size_t chunk = static_cast<size_t>(std::max<uint64_t>(1, config_.readChunkBytes));
        std::string bytes;
        bytes.reserve(length);
        for (size_t pos = 0; pos < length; pos += chunk) {
            if (token.cancelled()) {
                return RawResult(std::nullopt);
            }
            bytes.append(base + pos, std::min(chunk, length - pos));
        }
        return RawResult(std::move(bytes));
    } catch (const boost::interprocess::interprocess_exception& e) {
        metrics_->recordLoadFailure();
        return make_error(ErrorKind::IO, std::string("Read failed at offset ") + std::to_string(offset) + ": " + e.what());
    } catch (const std::bad_alloc&) {
        metrics_->recordLoadFailure();
        return make_error(ErrorKind::MemoryPressure, "Out of memory reading " + std::to_string(length) + " bytes");
    }
}

LoadResult SegmentLoader::load(int64_t startPosition, int64_t length, const CancelToken& token) {
    uint64_t size = file_->size();
    if (startPosition < 0) {
        return make_error(ErrorKind::OutOfRange, "Negative start position " + std::to_string(startPosition));
    }
    uint64_t begin = static_cast<uint64_t>(startPosition);
    if (begin >= size) {
        return make_error(ErrorKind::OutOfRange,
                          "Start position " + std::to_string(begin) + " is at or beyond end of file (" +
                          std::to_string(size) + " bytes)");
    }
    if (length <= 0) {
        return make_error(ErrorKind::OutOfRange, "Segment length must be positive");
    }

    uint64_t want = static_cast<uint64_t>(length);
    if (want > size - begin) {
        logger_->debug("Segment at {} clamped to end of file: {} -> {} bytes", begin, want, size - begin);
        want = size - begin;
    }
    if (want > config_.maxSegmentBytes) {
        logger_->warn("Segment at {} clamped to max segment size: {} -> {} bytes", begin, want, config_.maxSegmentBytes);
        metrics_->recordClamp();
        want = config_.maxSegmentBytes;
    }
    if (token.cancelled()) {
        return cancelled(begin);
    }

    // A few bytes past the request let a split character be completed, but
    // never past the end of the file or the segment ceiling.
    uint64_t limit = std::min<uint64_t>(size - begin, config_.maxSegmentBytes);
    size_t mapped = static_cast<size_t>(std::min<uint64_t>(limit, want + 4));

    auto started = std::chrono::steady_clock::now();
    auto raw = readBytes(begin, mapped, token);
    if (!raw) {
        return raw.error();
    }
    if (!raw.value()) {
        return cancelled(begin);
    }
    std::string bytes = std::move(*raw.value());

    size_t bom = bom_length(encoding_);
    size_t head = begin < bom ? static_cast<size_t>(bom - begin) : 0;
    // A request ending inside the BOM still consumes all of it.
    size_t end = std::max(static_cast<size_t>(want), head);
    ByteWindow window = adjust_to_char_boundaries(encoding_, bytes.data(), bytes.size(), begin, head, end);

    TextSegment segment;
    // A leading BOM is consumed but never part of the content.
    size_t consumedFrom = head > 0 ? 0 : window.begin;
    segment.startPosition = static_cast<int64_t>(begin + consumedFrom);
    segment.length = static_cast<int64_t>(window.end - consumedFrom);
    try {
        segment.content = decode_to_utf8(encoding_, bytes.data() + window.begin, window.end - window.begin);
        if (config_.normalizeLineEndings) {
            segment.content = normalize_line_endings(segment.content);
        }
    } catch (const std::bad_alloc&) {
        metrics_->recordLoadFailure();
        return make_error(ErrorKind::MemoryPressure, "Out of memory decoding segment at " + std::to_string(begin));
    } catch (const std::exception& e) {
        metrics_->recordLoadFailure();
        return make_error(ErrorKind::IO, std::string("Cannot decode segment at ") + std::to_string(begin) + ": " + e.what());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    metrics_->recordSegmentLoad(static_cast<uint64_t>(segment.length), elapsed);
    return LoadResult(std::move(segment));
}

RawResult SegmentLoader::loadRaw(uint64_t offset, size_t length, const CancelToken& token) {
    uint64_t size = file_->size();
    if (offset >= size) {
        return make_error(ErrorKind::OutOfRange, "Offset " + std::to_string(offset) + " is beyond end of file");
    }
    if (length == 0) {
        return RawResult(std::string());
    }
    size_t clamped = static_cast<size_t>(std::min<uint64_t>(length, size - offset));
    return readBytes(offset, clamped, token);
}
