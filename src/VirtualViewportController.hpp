#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/logger.h>
#include "CancelToken.hpp"
#include "Collaborators.hpp"
#include "ErrorRecoveryPolicy.hpp"
#include "FileAnalyzer.hpp"
#include "HandoffQueue.hpp"
#include "PerformanceMetrics.hpp"
#include "SegmentLoader.hpp"
#include "ViewerConfig.hpp"
#include "ViewportCache.hpp"

enum class ViewerStatus {
    Idle,
    Loading,
    Loaded,
    Error,
    Disposed
};

const char* to_string(ViewerStatus status);

struct ViewportState {
    uint64_t topLine = 0;
    uint64_t visibleLineCount = 25;
    uint64_t bufferLines = 50;  // prefetch margin above and below
    uint64_t totalLines = 0;
};

// Owns the viewport of one open file. Every public method must be called from
// the owning context; segment reads run on an internal worker pool and their
// results come back through a handoff queue that the owner drains with
// dispatchPending(), waitAndDispatch() or waitUntilSettled().
class VirtualViewportController {
public:
    VirtualViewportController(FileStreamInfo info, std::shared_ptr<SegmentSource> source,
                              DisplaySurface& display, StatusSink* status, ErrorDialog* dialog,
                              ViewerConfig config, std::shared_ptr<spdlog::logger> logger,
                              std::shared_ptr<PerformanceMetrics> metrics);
    ~VirtualViewportController();

    VirtualViewportController(const VirtualViewportController&) = delete;
    VirtualViewportController& operator=(const VirtualViewportController&) = delete;

    void setViewport(uint64_t topLine, uint64_t visibleLineCount);
    // Centers 'line' (clamped into the file) in the viewport.
    void goToLine(uint64_t line);
    void resize(uint64_t visibleLineCount);
    void scrollTo(uint64_t topLine);
    void scrollBy(int64_t delta);
    // Reloads the current viewport unconditionally.
    void refresh();
    // Swaps in a new description and source for the same view, dropping cached lines.
    void reloadFile(FileStreamInfo info, std::shared_ptr<SegmentSource> source);
    // Cancels pending work, unsubscribes from the display and releases the cache.
    void dispose();

    // Applies queued results; returns how many messages were handled.
    size_t dispatchPending();
    // Waits up to 'timeout' for one message, then drains the queue. False on timeout.
    bool waitAndDispatch(std::chrono::milliseconds timeout);
    // Dispatches until the controller leaves Loading. False on timeout.
    bool waitUntilSettled(std::chrono::milliseconds timeout);

    ViewerStatus status() const { return status_; }
    const ViewportState& state() const { return state_; }
    const ViewportCache& cache() const { return cache_; }
    const FileStreamInfo& fileInfo() const { return info_; }
    const std::optional<RecoverableError>& lastError() const { return lastError_; }
    const std::string& visibleContent() const { return visibleContent_; }
    uint64_t estimatedBytesPerLine() const;

private:
    struct LoadCompletion {
        uint64_t generation;
        uint64_t firstLine;
        uint64_t lastLine;
        LoadResult result;
        RecoveryStrategy strategy;
    };
    struct DialogAnswer {
        uint64_t generation;
        ErrorChoice choice;
    };
    using Message = std::variant<LoadCompletion, DialogAnswer>;

    void onDisplayEvent(const DisplayEvent& event);
    uint64_t clampTop(uint64_t topLine) const;
    void startLoad();
    bool serveFromCache();
    void handle(Message& message);
    void applySegment(const TextSegment& segment, uint64_t firstLine, uint64_t lastLine);
    void fail(const Error& error);
    void show(std::string text);

    FileStreamInfo info_;
    std::shared_ptr<SegmentSource> source_;
    DisplaySurface& display_;
    StatusSink* status_sink_;
    ErrorDialog* dialog_;
    ViewerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PerformanceMetrics> metrics_;
    std::shared_ptr<ErrorRecoveryPolicy> policy_;

    ViewportState state_;
    ViewportCache cache_;
    ViewerStatus status_ = ViewerStatus::Idle;
    std::optional<RecoverableError> lastError_;
    std::string visibleContent_;

    uint64_t generation_ = 0;
    CancelSource inFlight_;
    std::shared_ptr<HandoffQueue<Message>> inbox_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    EventBroadcaster<DisplayEvent>::SubscriptionId subscription_ = 0;
};
