#include <iostream>
#include <string>
#include <spdlog/sinks/ringbuffer_sink.h>
#include "../src/ErrorRecoveryPolicy.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
        auto logger = std::make_shared<spdlog::logger>("recovery", sink);
        auto metrics = std::make_shared<PerformanceMetrics>();
        ErrorRecoveryPolicy policy(logger, metrics);

        int primaryCalls = 0;
        int fallbackCalls = 0;
        std::function<Result<int>()> succeed = [&]() -> Result<int> { ++primaryCalls; return 7; };
        std::function<Result<int>()> fallback = [&]() -> Result<int> { ++fallbackCalls; return 3; };

        // Primary success never touches the fallback
        auto ok = policy.run<int>("Read", succeed, fallback);
        ASSERT_TRUE(ok.result.ok() && ok.result.value() == 7);
        ASSERT_TRUE(ok.strategy == RecoveryStrategy::Primary);
        ASSERT_TRUE(ok.attempts == 1);
        ASSERT_TRUE(fallbackCalls == 0);

        // A retryable failure gets exactly one fallback attempt
        std::function<Result<int>()> ioFailure = [&]() -> Result<int> {
            ++primaryCalls;
            return make_error(ErrorKind::IO, "disk hiccup");
        };
        auto recovered = policy.run<int>("Read", ioFailure, fallback);
        ASSERT_TRUE(recovered.result.ok() && recovered.result.value() == 3);
        ASSERT_TRUE(recovered.strategy == RecoveryStrategy::Fallback);
        ASSERT_TRUE(recovered.attempts == 2);
        ASSERT_TRUE(fallbackCalls == 1);
        ASSERT_TRUE(metrics->fallbacksUsed() == 1);

        // Both fail: the fallback's error comes back, no third attempt
        std::function<Result<int>()> memoryFailure = [&]() -> Result<int> {
            ++fallbackCalls;
            return make_error(ErrorKind::MemoryPressure, "still too big");
        };
        auto exhausted = policy.run<int>("Read", ioFailure, memoryFailure);
        ASSERT_TRUE(!exhausted.result.ok());
        ASSERT_TRUE(exhausted.result.error().kind == ErrorKind::MemoryPressure);
        ASSERT_TRUE(exhausted.attempts == 2);
        ASSERT_TRUE(fallbackCalls == 2);
        bool loggedError = false;
        for (const auto& line : sink->last_formatted()) {
            if (line.find("failed after fallback") != std::string::npos) loggedError = true;
        }
        ASSERT_TRUE(loggedError);

        // Non-retryable failures are returned as they are
        std::function<Result<int>()> outOfRange = []() -> Result<int> {
            return make_error(ErrorKind::OutOfRange, "past the end");
        };
        auto direct = policy.run<int>("Read", outOfRange, fallback);
        ASSERT_TRUE(!direct.result.ok());
        ASSERT_TRUE(direct.result.error().kind == ErrorKind::OutOfRange);
        ASSERT_TRUE(direct.attempts == 1);
        ASSERT_TRUE(fallbackCalls == 2);

        // Surfacing
        auto io = policy.surface("Loading lines at 10", make_error(ErrorKind::IO, "disk hiccup"));
        ASSERT_TRUE(io.title == "File Read Error");
        ASSERT_TRUE(io.canRetry && io.canIgnore);
        ASSERT_TRUE(io.message.find("disk hiccup") != std::string::npos);
        ASSERT_TRUE(!io.suggestedActions.empty() && io.suggestedActions.front() == "Retry");

        auto memory = policy.surface("Loading", make_error(ErrorKind::MemoryPressure, "oom"));
        ASSERT_TRUE(memory.title == "Insufficient Memory");
        bool suggestsSmaller = false;
        for (const auto& action : memory.suggestedActions) {
            if (action == "Use a smaller view") suggestsSmaller = true;
        }
        ASSERT_TRUE(suggestsSmaller);

        auto range = policy.surface("Loading", make_error(ErrorKind::OutOfRange, "past the end"));
        ASSERT_TRUE(!range.canRetry);
        ASSERT_TRUE(range.canIgnore);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All error recovery tests passed" << std::endl;
    return 0;
}
