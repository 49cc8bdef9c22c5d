#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <limits>
#include <string>
#include <thread>
#include <vector>
#include "../src/Logging.hpp"
#include "../src/VirtualViewportController.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

using namespace std::chrono_literals;

struct RecordingDisplay : DisplaySurface {
    std::vector<std::string> shown;
    EventBroadcaster<DisplayEvent> bus;

    void setVisibleContent(const std::string& text) override { shown.push_back(text); }
    EventBroadcaster<DisplayEvent>& events() override { return bus; }
};

struct RecordingStatus : StatusSink {
    std::vector<std::string> labels;
    void reportProgress(int, const std::string& label) override { labels.push_back(label); }
};

struct ScriptedDialog : ErrorDialog {
    ErrorChoice answer = ErrorChoice::Ignore;
    int presented = 0;
    RecoverableError last;

    void present(const RecoverableError& error, std::function<void(ErrorChoice)> respond) override {
        ++presented;
        last = error;
        respond(answer);
    }
};

// In-memory source. Loads can be made to fail, or to block until cancelled.
struct MemorySource : SegmentSource {
    std::string text;
    std::atomic<int> calls{0};
    std::atomic<int> failuresLeft{0};
    ErrorKind failure = ErrorKind::IO;
    int64_t failAbove = -1;              // fail any load longer than this
    std::atomic<bool> blockFirst{false};

    explicit MemorySource(std::string content) : text(std::move(content)) {}

    LoadResult load(int64_t startPosition, int64_t length, const CancelToken& token) override {
        int call = ++calls;
        if (call == 1 && blockFirst) {
            auto deadline = std::chrono::steady_clock::now() + 2s;
            while (!token.cancelled() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(1ms);
            }
            return LoadResult(std::nullopt);
        }
        if (failuresLeft > 0) {
            --failuresLeft;
            return make_error(failure, "scripted failure");
        }
        if (failAbove >= 0 && length > failAbove) {
            return make_error(failure, "segment too large");
        }
        if (startPosition < 0 || static_cast<uint64_t>(startPosition) >= text.size() || length <= 0) {
            return make_error(ErrorKind::OutOfRange, "bad range");
        }
        TextSegment segment;
        segment.startPosition = startPosition;
        segment.content = text.substr(static_cast<size_t>(startPosition), static_cast<size_t>(length));
        segment.length = static_cast<int64_t>(segment.content.size());
        return LoadResult(std::move(segment));
    }

    uint64_t fileSize() const override { return text.size(); }
    Encoding encoding() const override { return Encoding::Utf8; }
};

static std::string numbered_lines(int count) {
    std::string out;
    char buf[16];
    for (int i = 0; i < count; ++i) {
        std::snprintf(buf, sizeof(buf), "line%04d\n", i);
        out += buf;
    }
    return out;
}

// 'wide' lines of 190 bytes followed by 'narrow' lines of 10 bytes ("n%08d\n"
// holding the real line index).
static std::string uneven_lines(int wide, int narrow) {
    std::string out;
    for (int i = 0; i < wide; ++i) {
        out += std::string(189, 'w');
        out += '\n';
    }
    char buf[16];
    for (int i = 0; i < narrow; ++i) {
        std::snprintf(buf, sizeof(buf), "n%08d\n", wide + i);
        out += buf;
    }
    return out;
}

// True when every row of 'text' is the narrow line following the previous row.
static bool rows_are_consecutive(const std::string& text) {
    long previous = -1;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) end = text.size();
        std::string row = text.substr(pos, end - pos);
        if (row.size() != 9 || row[0] != 'n') return false;
        long index = std::stol(row.substr(1));
        if (previous >= 0 && index != previous + 1) return false;
        previous = index;
        pos = end + 1;
    }
    return true;
}

static FileStreamInfo info_for(const MemorySource& source, uint64_t lines) {
    FileStreamInfo info;
    info.path = "memory";
    info.size = source.fileSize();
    info.estimatedLineCount = lines;
    return info;
}

static ViewerConfig tight_config() {
    ViewerConfig config;
    config.bufferLines = 0;
    config.defaultVisibleLines = 3;
    config.workerThreads = 2;
    return config;
}

int main() {
    try {
        auto logger = make_null_logger("viewport");

        // Small file: one load covers it, then the cache serves scrolling
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(10));
            RecordingDisplay display;
            RecordingStatus status;
            auto metrics = std::make_shared<PerformanceMetrics>();
            ViewerConfig config;
            config.defaultVisibleLines = 3;
            VirtualViewportController controller(info_for(*source, 8), source, display, &status, nullptr, config,
                                                 logger, metrics);
            ASSERT_TRUE(controller.status() == ViewerStatus::Idle);
            ASSERT_TRUE(display.bus.subscriberCount() == 1);

            controller.setViewport(0, 3);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.status() == ViewerStatus::Loaded);
            ASSERT_TRUE(controller.visibleContent() == "line0000\nline0001\nline0002");
            ASSERT_TRUE(controller.state().totalLines == 10);
            ASSERT_TRUE(status.labels.front() == "Rendering large content...");
            ASSERT_TRUE(status.labels.back() == "Ready");

            int loadsSoFar = source->calls;
            controller.scrollTo(2);
            ASSERT_TRUE(controller.status() == ViewerStatus::Loaded);
            ASSERT_TRUE(controller.visibleContent() == "line0002\nline0003\nline0004");
            ASSERT_TRUE(source->calls == loadsSoFar);
            ASSERT_TRUE(metrics->cacheHits() >= 3);

            // Scrolling to where we already are does nothing
            size_t shownBefore = display.shown.size();
            controller.scrollTo(2);
            ASSERT_TRUE(display.shown.size() == shownBefore);

            // Display events drive the viewport
            display.bus.broadcast(DisplayEvent{DisplayEvent::Kind::Scrolled, 5});
            ASSERT_TRUE(controller.state().topLine == 5);
            ASSERT_TRUE(controller.visibleContent() == "line0005\nline0006\nline0007");
            display.bus.broadcast(DisplayEvent{DisplayEvent::Kind::Resized, 2});
            ASSERT_TRUE(controller.state().visibleLineCount == 2);
            ASSERT_TRUE(controller.visibleContent() == "line0005\nline0006");

            // Top line is clamped so the viewport stays inside the file
            controller.scrollBy(100);
            ASSERT_TRUE(controller.state().topLine == 8);
            controller.scrollBy(-100);
            ASSERT_TRUE(controller.state().topLine == 0);
            controller.scrollBy(std::numeric_limits<int64_t>::max());
            ASSERT_TRUE(controller.state().topLine == 8);
            controller.scrollBy(std::numeric_limits<int64_t>::min());
            ASSERT_TRUE(controller.state().topLine == 0);

            controller.dispose();
            ASSERT_TRUE(controller.status() == ViewerStatus::Disposed);
            ASSERT_TRUE(display.bus.subscriberCount() == 0);
            ASSERT_TRUE(controller.cache().size() == 0);
            controller.scrollTo(4);
            ASSERT_TRUE(controller.state().topLine == 0);
        }

        // Exact line alignment away from the start of the file
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(1000));
            RecordingDisplay display;
            VirtualViewportController controller(info_for(*source, 1000), source, display, nullptr, nullptr,
                                                 tight_config(), logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(500, 3);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.visibleContent() == "line0500\nline0501\nline0502");

            controller.goToLine(100);
            ASSERT_TRUE(controller.state().topLine == 99);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.visibleContent() == "line0099\nline0100\nline0101");

            int loadsSoFar = source->calls;
            controller.resize(3);
            ASSERT_TRUE(source->calls == loadsSoFar);
            controller.refresh();
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.visibleContent() == "line0099\nline0100\nline0101");
        }

        // Uneven line lengths: overlapping segments read at different offsets
        // never combine into one screen
        {
            auto source = std::make_shared<MemorySource>(uneven_lines(20, 5000));
            RecordingDisplay display;
            ViewerConfig config;
            config.bufferLines = 50;
            config.maxCachedLines = 100000;
            // The prefix estimate undercounts the narrow lines: about 17 bytes per line
            VirtualViewportController controller(info_for(*source, 3000), source, display, nullptr, nullptr,
                                                 config, logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(1000, 25);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(rows_are_consecutive(controller.visibleContent()));

            controller.scrollTo(1100);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(rows_are_consecutive(controller.visibleContent()));
            int loadsSoFar = source->calls;

            // Rows 1040-1049 were cached by the first read, 1050-1064 by the second
            controller.scrollTo(1040);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(source->calls == loadsSoFar + 1);
            ASSERT_TRUE(rows_are_consecutive(controller.visibleContent()));
            ASSERT_TRUE(controller.visibleContent().find('\n') != std::string::npos);

            // Inside the window of the latest read the cache still serves
            loadsSoFar = source->calls;
            controller.scrollTo(1045);
            ASSERT_TRUE(controller.status() == ViewerStatus::Loaded);
            ASSERT_TRUE(source->calls == loadsSoFar);
            ASSERT_TRUE(rows_are_consecutive(controller.visibleContent()));

            for (const auto& text : display.shown) {
                ASSERT_TRUE(rows_are_consecutive(text));
            }
        }

        // Newest request wins: the first load is still running when the second starts
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(1000));
            source->blockFirst = true;
            RecordingDisplay display;
            VirtualViewportController controller(info_for(*source, 1000), source, display, nullptr, nullptr,
                                                 tight_config(), logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(0, 3);
            while (source->calls == 0) std::this_thread::sleep_for(1ms);
            controller.setViewport(700, 3);
            ASSERT_TRUE(controller.waitUntilSettled(3000ms));
            std::this_thread::sleep_for(20ms);
            controller.dispatchPending();
            ASSERT_TRUE(controller.status() == ViewerStatus::Loaded);
            ASSERT_TRUE(controller.visibleContent() == "line0700\nline0701\nline0702");
            for (const auto& text : display.shown) {
                ASSERT_TRUE(text.find("line0000") == std::string::npos);
            }
        }

        // A retryable failure falls back to a smaller segment
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(1000));
            source->failAbove = 20;
            RecordingDisplay display;
            auto metrics = std::make_shared<PerformanceMetrics>();
            ScriptedDialog dialog;
            VirtualViewportController controller(info_for(*source, 1000), source, display, nullptr, &dialog,
                                                 tight_config(), logger, metrics);
            controller.setViewport(500, 3);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.status() == ViewerStatus::Loaded);
            ASSERT_TRUE(controller.visibleContent() == "line0500");
            ASSERT_TRUE(source->calls == 2);
            ASSERT_TRUE(metrics->fallbacksUsed() == 1);
            ASSERT_TRUE(dialog.presented == 0);
        }

        // Both attempts fail: error state, dialog, Ignore keeps the error
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(1000));
            source->failuresLeft = 100;
            RecordingDisplay display;
            RecordingStatus status;
            ScriptedDialog dialog;
            VirtualViewportController controller(info_for(*source, 1000), source, display, &status, &dialog,
                                                 tight_config(), logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(10, 3);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            controller.dispatchPending();
            ASSERT_TRUE(controller.status() == ViewerStatus::Error);
            ASSERT_TRUE(source->calls == 2);
            ASSERT_TRUE(dialog.presented == 1);
            ASSERT_TRUE(dialog.last.title == "File Read Error");
            ASSERT_TRUE(dialog.last.canRetry);
            ASSERT_TRUE(controller.lastError().has_value());
            ASSERT_TRUE(status.labels.back() == "Load failed");
        }

        // Retry starts a fresh load that can succeed
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(1000));
            source->failuresLeft = 2;
            RecordingDisplay display;
            ScriptedDialog dialog;
            dialog.answer = ErrorChoice::Retry;
            VirtualViewportController controller(info_for(*source, 1000), source, display, nullptr, &dialog,
                                                 tight_config(), logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(10, 3);
            controller.waitUntilSettled(2000ms);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(dialog.presented == 1);
            ASSERT_TRUE(controller.status() == ViewerStatus::Loaded);
            ASSERT_TRUE(!controller.lastError().has_value());
            ASSERT_TRUE(controller.visibleContent() == "line0010\nline0011\nline0012");
            ASSERT_TRUE(source->calls == 3);
        }

        // Non-retryable failures skip the fallback
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(1000));
            source->failuresLeft = 1;
            source->failure = ErrorKind::OutOfRange;
            RecordingDisplay display;
            ScriptedDialog dialog;
            VirtualViewportController controller(info_for(*source, 1000), source, display, nullptr, &dialog,
                                                 tight_config(), logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(10, 3);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.status() == ViewerStatus::Error);
            ASSERT_TRUE(source->calls == 1);
            ASSERT_TRUE(!dialog.last.canRetry);
        }

        // Memory pressure releases the cache
        {
            auto source = std::make_shared<MemorySource>(numbered_lines(1000));
            RecordingDisplay display;
            ScriptedDialog dialog;
            VirtualViewportController controller(info_for(*source, 1000), source, display, nullptr, &dialog,
                                                 tight_config(), logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(0, 3);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.cache().size() > 0);
            source->failure = ErrorKind::MemoryPressure;
            source->failuresLeft = 2;
            controller.scrollTo(600);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.status() == ViewerStatus::Error);
            ASSERT_TRUE(controller.cache().size() == 0);
            ASSERT_TRUE(dialog.last.title == "Insufficient Memory");
        }

        // Empty file settles immediately with nothing to show
        {
            auto source = std::make_shared<MemorySource>(std::string());
            RecordingDisplay display;
            VirtualViewportController controller(info_for(*source, 0), source, display, nullptr, nullptr,
                                                 tight_config(), logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(0, 3);
            ASSERT_TRUE(controller.status() == ViewerStatus::Loaded);
            ASSERT_TRUE(controller.visibleContent().empty());
            ASSERT_TRUE(source->calls == 0);
        }

        // Reloading swaps the source and drops cached lines
        {
            auto first = std::make_shared<MemorySource>(numbered_lines(10));
            RecordingDisplay display;
            ViewerConfig config;
            config.defaultVisibleLines = 3;
            VirtualViewportController controller(info_for(*first, 10), first, display, nullptr, nullptr,
                                                 config, logger, std::make_shared<PerformanceMetrics>());
            controller.setViewport(0, 3);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            auto second = std::make_shared<MemorySource>("alpha\nbeta\ngamma\ndelta\n");
            controller.reloadFile(info_for(*second, 4), second);
            ASSERT_TRUE(controller.waitUntilSettled(2000ms));
            ASSERT_TRUE(controller.visibleContent() == "alpha\nbeta\ngamma");
            ASSERT_TRUE(controller.state().totalLines == 4);
        }

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All viewport controller tests passed" << std::endl;
    return 0;
}
