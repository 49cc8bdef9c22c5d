#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include "EventBroadcaster.hpp"
#include "Result.hpp"

// Interfaces the viewer core talks to. Front ends and tests supply the
// implementations.

struct DisplayEvent {
    enum class Kind {
        Scrolled,  // value = new top line
        Resized    // value = new visible line count
    };
    Kind kind;
    uint64_t value;
};

class DisplaySurface {
public:
    virtual ~DisplaySurface() = default;

    virtual void setVisibleContent(const std::string& text) = 0;
    virtual EventBroadcaster<DisplayEvent>& events() = 0;
};

class StatusSink {
public:
    virtual ~StatusSink() = default;

    virtual void reportProgress(int percent, const std::string& label) = 0;
};

enum class ErrorChoice {
    Retry,
    Ignore
};

class ErrorDialog {
public:
    virtual ~ErrorDialog() = default;

    // 'respond' may be called before present() returns or later from any thread.
    virtual void present(const RecoverableError& error, std::function<void(ErrorChoice)> respond) = 0;
};
