#pragma once
#include <atomic>
#include <memory>

// Cooperative cancellation. A default-constructed token is never cancelled.
class CancelToken {
public:
    CancelToken() = default;

    bool cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancelSource {
public:
    CancelSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancelToken token() const { return CancelToken(flag_); }
    void cancel() { flag_->store(true, std::memory_order_release); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
