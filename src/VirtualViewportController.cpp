#include "VirtualViewportController.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include "LineUtils.hpp"

namespace {

std::string join_lines(const std::vector<std::string>& lines, size_t from, size_t count) {
    std::string out;
    size_t end = std::min(lines.size(), from + count);
    for (size_t i = from; i < end; ++i) {
        if (i > from) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

inline bool ends_with_break(const std::string& text) {
    return !text.empty() && (text.back() == '\n' || text.back() == '\r');
}

}  // namespace

const char* to_string(ViewerStatus status) {
    switch (status) {
        case ViewerStatus::Idle: return "idle";
        case ViewerStatus::Loading: return "loading";
        case ViewerStatus::Loaded: return "loaded";
        case ViewerStatus::Error: return "error";
        case ViewerStatus::Disposed: return "disposed";
    }
    return "idle";
}

VirtualViewportController::VirtualViewportController(FileStreamInfo info, std::shared_ptr<SegmentSource> source,
                                                     DisplaySurface& display, StatusSink* status,
                                                     ErrorDialog* dialog, ViewerConfig config,
                                                     std::shared_ptr<spdlog::logger> logger,
                                                     std::shared_ptr<PerformanceMetrics> metrics)
    : info_(std::move(info)),
      source_(std::move(source)),
      display_(display),
      status_sink_(status),
      dialog_(dialog),
      config_(std::move(config)),
      logger_(std::move(logger)),
      metrics_(std::move(metrics)),
      policy_(std::make_shared<ErrorRecoveryPolicy>(logger_, metrics_)),
      cache_(static_cast<size_t>(config_.maxCachedLines), metrics_),
      inbox_(std::make_shared<HandoffQueue<Message>>()),
      pool_(std::make_unique<boost::asio::thread_pool>(static_cast<size_t>(std::max<uint64_t>(1, config_.workerThreads)))) {
    state_.visibleLineCount = std::max<uint64_t>(1, config_.defaultVisibleLines);
    state_.bufferLines = config_.bufferLines;
    state_.totalLines = info_.estimatedLineCount;
    subscription_ = display_.events().subscribe([this](const DisplayEvent& event) { onDisplayEvent(event); });
}

VirtualViewportController::~VirtualViewportController() {
    dispose();
}

uint64_t VirtualViewportController::estimatedBytesPerLine() const {
    uint64_t bytesPerLine = source_->fileSize() / std::max<uint64_t>(1, state_.totalLines);
    return std::max<uint64_t>(1, bytesPerLine);
}

uint64_t VirtualViewportController::clampTop(uint64_t topLine) const {
    uint64_t maxTop = state_.totalLines > state_.visibleLineCount ? state_.totalLines - state_.visibleLineCount : 0;
    return std::min(topLine, maxTop);
}

void VirtualViewportController::onDisplayEvent(const DisplayEvent& event) {
    switch (event.kind) {
        case DisplayEvent::Kind::Scrolled:
            scrollTo(event.value);
            break;
        case DisplayEvent::Kind::Resized:
            resize(event.value);
            break;
    }
}

void VirtualViewportController::setViewport(uint64_t topLine, uint64_t visibleLineCount) {
    if (status_ == ViewerStatus::Disposed) return;
    state_.visibleLineCount = std::max<uint64_t>(1, visibleLineCount);
    state_.topLine = clampTop(topLine);
    startLoad();
}

void VirtualViewportController::goToLine(uint64_t line) {
    if (status_ == ViewerStatus::Disposed) return;
    uint64_t target = state_.totalLines == 0 ? 0 : std::min(line, state_.totalLines - 1);
    uint64_t half = state_.visibleLineCount / 2;
    state_.topLine = clampTop(target > half ? target - half : 0);
    startLoad();
}

void VirtualViewportController::resize(uint64_t visibleLineCount) {
    if (status_ == ViewerStatus::Disposed) return;
    uint64_t count = std::max<uint64_t>(1, visibleLineCount);
    if (count == state_.visibleLineCount) return;
    state_.visibleLineCount = count;
    state_.topLine = clampTop(state_.topLine);
    startLoad();
}

void VirtualViewportController::scrollTo(uint64_t topLine) {
    if (status_ == ViewerStatus::Disposed) return;
    uint64_t next = clampTop(topLine);
    if (next == state_.topLine) return;
    state_.topLine = next;
    startLoad();
}

void VirtualViewportController::scrollBy(int64_t delta) {
    if (delta < 0) {
        // -(delta + 1) + 1 stays representable for INT64_MIN
        uint64_t up = static_cast<uint64_t>(-(delta + 1)) + 1;
        scrollTo(up >= state_.topLine ? 0 : state_.topLine - up);
    } else {
        scrollTo(state_.topLine + static_cast<uint64_t>(delta));
    }
}

void VirtualViewportController::refresh() {
    if (status_ == ViewerStatus::Disposed) return;
    startLoad();
}

void VirtualViewportController::reloadFile(FileStreamInfo info, std::shared_ptr<SegmentSource> source) {
    if (status_ == ViewerStatus::Disposed) return;
    info_ = std::move(info);
    source_ = std::move(source);
    cache_.clear();
    state_.totalLines = info_.estimatedLineCount;
    state_.topLine = clampTop(state_.topLine);
    logger_->info("Reloaded {} ({} bytes, ~{} lines)", info_.path, info_.size, info_.estimatedLineCount);
    startLoad();
}

void VirtualViewportController::startLoad() {
    // Newest request wins: whatever is still running belongs to an older generation.
    inFlight_.cancel();
    ++generation_;

    uint64_t size = source_->fileSize();
    if (size == 0) {
        status_ = ViewerStatus::Loaded;
        lastError_.reset();
        show(std::string());
        return;
    }
    if (serveFromCache()) {
        return;
    }

    uint64_t firstLine = state_.topLine > state_.bufferLines ? state_.topLine - state_.bufferLines : 0;
    uint64_t lastLine = state_.topLine + state_.visibleLineCount + state_.bufferLines;
    uint64_t bytesPerLine = estimatedBytesPerLine();
    uint64_t start = firstLine * bytesPerLine;
    uint64_t length = (lastLine - firstLine) * bytesPerLine;
    // Read from one code unit early: when 'start' is a line start, the partial
    // line skipped in applySegment is just the previous terminator.
    Encoding encoding = source_->encoding();
    uint64_t unit = code_unit_size(encoding);
    if (start <= unit + bom_length(encoding)) {
        length += start;
        start = 0;
        firstLine = 0;
    } else {
        start -= unit;
        length += unit;
    }
    start = std::min(start, size - 1);
    length = std::min(length, size - start);
    length = std::min(length, config_.maxSegmentBytes);
    uint64_t fallbackLength = std::max<uint64_t>(1, std::min(length / 2, config_.fallbackSegmentBytes));

    status_ = ViewerStatus::Loading;
    if (status_sink_) status_sink_->reportProgress(0, "Rendering large content...");

    inFlight_ = CancelSource();
    CancelToken token = inFlight_.token();
    uint64_t generation = generation_;
    auto source = source_;
    auto policy = policy_;
    auto inbox = inbox_;
    logger_->debug("Load #{}: lines {}-{} -> bytes [{}, +{})", generation, firstLine, lastLine, start, length);

    boost::asio::post(*pool_, [=]() {
        auto outcome = policy->run<std::optional<TextSegment>>(
            "Segment load",
            [&]() { return source->load(static_cast<int64_t>(start), static_cast<int64_t>(length), token); },
            [&]() { return source->load(static_cast<int64_t>(start), static_cast<int64_t>(fallbackLength), token); });
        inbox->push(LoadCompletion{generation, firstLine, lastLine, std::move(outcome.result), outcome.strategy});
    });
}

bool VirtualViewportController::serveFromCache() {
    uint64_t end = std::min(state_.totalLines, state_.topLine + state_.visibleLineCount);
    if (end <= state_.topLine) return false;
    // Every visible line must come from the same segment; keys cached from
    // segments read at other offsets may name different file lines.
    std::optional<uint64_t> anchor = cache_.anchorOf(state_.topLine);
    for (uint64_t line = state_.topLine; line < end; ++line) {
        if (!anchor || cache_.anchorOf(line) != anchor) {
            if (metrics_) metrics_->recordCacheMiss();
            return false;
        }
    }
    std::string text;
    for (uint64_t line = state_.topLine; line < end; ++line) {
        if (line > state_.topLine) text.push_back('\n');
        text += *cache_.get(line);
    }
    status_ = ViewerStatus::Loaded;
    lastError_.reset();
    show(std::move(text));
    return true;
}

size_t VirtualViewportController::dispatchPending() {
    size_t handled = 0;
    while (auto message = inbox_->tryPop()) {
        handle(*message);
        ++handled;
    }
    return handled;
}

bool VirtualViewportController::waitAndDispatch(std::chrono::milliseconds timeout) {
    auto message = inbox_->waitPop(timeout);
    if (!message) return false;
    handle(*message);
    dispatchPending();
    return true;
}

bool VirtualViewportController::waitUntilSettled(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    dispatchPending();
    while (status_ == ViewerStatus::Loading) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        waitAndDispatch(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
    dispatchPending();
    return status_ != ViewerStatus::Loading;
}

void VirtualViewportController::handle(Message& message) {
    if (status_ == ViewerStatus::Disposed) return;

    if (auto* answer = std::get_if<DialogAnswer>(&message)) {
        if (answer->generation != generation_) return;
        if (answer->choice == ErrorChoice::Retry) {
            logger_->info("Retrying load after error");
            startLoad();
        } else {
            logger_->info("Load error ignored");
        }
        return;
    }

    auto& done = std::get<LoadCompletion>(message);
    if (done.generation != generation_) {
        logger_->debug("Discarding stale load #{} (current #{})", done.generation, generation_);
        return;
    }
    if (!done.result.ok()) {
        fail(done.result.error());
        return;
    }
    if (!done.result.value()) {
        logger_->debug("Load #{} was cancelled", done.generation);
        return;
    }
    if (done.strategy == RecoveryStrategy::Fallback) {
        logger_->info("Load #{} succeeded with a smaller segment", done.generation);
    }
    applySegment(*done.result.value(), done.firstLine, done.lastLine);
}

void VirtualViewportController::applySegment(const TextSegment& segment, uint64_t firstLine, uint64_t lastLine) {
    const std::string& text = segment.content;
    bool atStart = segment.startPosition == 0;
    bool atEof = static_cast<uint64_t>(segment.startPosition + segment.length) >= source_->fileSize();

    size_t begin = 0;
    if (!atStart) {
        size_t skip = skip_partial_line(text.data(), text.size());
        if (skip != std::string::npos) begin = skip;
    }
    std::vector<std::string> lines = split_lines(text.data() + begin, text.size() - begin);
    if (!atEof && !ends_with_break(text) && lines.size() > 1) {
        lines.pop_back();
    }
    if (atStart && atEof) {
        state_.totalLines = lines.size();
        state_.topLine = clampTop(state_.topLine);
    }

    // Past the requested window the estimated keys drift further from the
    // real lines, so only a whole-file read is cached beyond it.
    size_t cached = lines.size();
    if (!(atStart && atEof)) {
        cached = static_cast<size_t>(std::min<uint64_t>(cached, lastLine - firstLine));
    }
    uint64_t anchor = static_cast<uint64_t>(segment.startPosition);
    for (size_t i = 0; i < cached; ++i) {
        cache_.put(firstLine + i, lines[i], anchor);
    }

    size_t offset = static_cast<size_t>(state_.topLine - std::min(state_.topLine, firstLine));
    if (offset >= lines.size()) {
        // The byte estimate overshot; show the tail of what was read.
        offset = lines.size() > state_.visibleLineCount ? lines.size() - state_.visibleLineCount : 0;
    }

    status_ = ViewerStatus::Loaded;
    lastError_.reset();
    show(join_lines(lines, offset, static_cast<size_t>(state_.visibleLineCount)));
}

void VirtualViewportController::fail(const Error& error) {
    RecoverableError surfaced = policy_->surface("Loading lines at " + std::to_string(state_.topLine), error);
    status_ = ViewerStatus::Error;
    lastError_ = surfaced;
    logger_->error("{}", surfaced.message);
    if (status_sink_) status_sink_->reportProgress(0, "Load failed");
    if (error.kind == ErrorKind::MemoryPressure) {
        cache_.clearAndTrim();
    }
    if (dialog_) {
        uint64_t generation = generation_;
        auto inbox = inbox_;
        dialog_->present(surfaced, [inbox, generation](ErrorChoice choice) {
            inbox->push(DialogAnswer{generation, choice});
        });
    }
}

void VirtualViewportController::show(std::string text) {
    visibleContent_ = std::move(text);
    display_.setVisibleContent(visibleContent_);
    if (status_sink_) status_sink_->reportProgress(100, "Ready");
}

void VirtualViewportController::dispose() {
    if (status_ == ViewerStatus::Disposed) return;
    status_ = ViewerStatus::Disposed;
    inFlight_.cancel();
    ++generation_;
    display_.events().unsubscribe(subscription_);
    pool_->join();
    inbox_->clear();
    cache_.clearAndTrim();
    logger_->debug("Viewport for {} disposed", info_.path);
}
