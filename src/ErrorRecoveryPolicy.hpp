#pragma once
#include <functional>
#include <memory>
#include <string>
#include <spdlog/logger.h>
#include "PerformanceMetrics.hpp"
#include "Result.hpp"
#include "ViewportCache.hpp"

enum class RecoveryStrategy {
    Primary,
    Fallback
};

template <typename T>
struct RecoveryOutcome {
    Result<T> result;
    RecoveryStrategy strategy;
    int attempts;
};

// Try primary, then at most one fallback for retryable failures, then give
// the failure back to the caller. Never loops.
class ErrorRecoveryPolicy {
public:
    explicit ErrorRecoveryPolicy(std::shared_ptr<spdlog::logger> logger,
                                 std::shared_ptr<PerformanceMetrics> metrics = nullptr);

    template <typename T>
    RecoveryOutcome<T> run(const std::string& operation,
                           const std::function<Result<T>()>& primary,
                           const std::function<Result<T>()>& fallback) const {
        Result<T> first = primary();
        if (first.ok() || !first.error().retryable()) {
            return RecoveryOutcome<T>{std::move(first), RecoveryStrategy::Primary, 1};
        }
        const Error& failure = first.error();
        logger_->warn("{} failed ({}): {}; trying fallback", operation, to_string(failure.kind), failure.message);
        if (failure.kind == ErrorKind::MemoryPressure) {
            reclaim_memory();
        }
        if (metrics_) metrics_->recordFallback();

        Result<T> second = fallback();
        if (!second.ok()) {
            logger_->error("{} failed after fallback ({}): {}", operation, to_string(second.error().kind),
                           second.error().message);
        }
        return RecoveryOutcome<T>{std::move(second), RecoveryStrategy::Fallback, 2};
    }

    // Shapes an exhausted failure for the error dialog.
    RecoverableError surface(const std::string& operation, const Error& error) const;

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PerformanceMetrics> metrics_;
};
