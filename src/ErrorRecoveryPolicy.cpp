#include "ErrorRecoveryPolicy.hpp"

ErrorRecoveryPolicy::ErrorRecoveryPolicy(std::shared_ptr<spdlog::logger> logger,
                                         std::shared_ptr<PerformanceMetrics> metrics)
    : logger_(std::move(logger)), metrics_(std::move(metrics)) {}

RecoverableError ErrorRecoveryPolicy::surface(const std::string& operation, const Error& error) const {
    RecoverableError out;
    out.error = error;
    out.message = operation + " failed: " + error.message;
    out.canRetry = error.retryable();
    out.canIgnore = true;

    switch (error.kind) {
        case ErrorKind::IO:
            out.title = "File Read Error";
            out.suggestedActions = {"Retry", "Use a smaller view", "Abort"};
            break;
        case ErrorKind::MemoryPressure:
            out.title = "Insufficient Memory";
            out.suggestedActions = {"Retry", "Use a smaller view", "Try scrolling to a different section",
                                    "Close other applications to free memory", "Abort"};
            break;
        case ErrorKind::NotFound:
            out.title = "File Not Found";
            out.suggestedActions = {"Check that the file still exists", "Abort"};
            break;
        case ErrorKind::Access:
            out.title = "Access Denied";
            out.suggestedActions = {"Check the file permissions", "Abort"};
            break;
        case ErrorKind::OutOfRange:
            out.title = "Invalid Position";
            out.suggestedActions = {"Go to a line inside the file", "Abort"};
            break;
        case ErrorKind::Cancelled:
            out.title = "Operation Cancelled";
            out.suggestedActions = {"Retry"};
            out.canRetry = true;
            break;
        case ErrorKind::InvalidArgument:
            out.title = "Invalid Request";
            out.suggestedActions = {"Abort"};
            break;
    }
    return out;
}
