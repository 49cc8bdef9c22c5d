#include "ReadGate.hpp"
#include <chrono>

ReadGate::Permit& ReadGate::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        if (gate_) gate_->release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

ReadGate::Permit::~Permit() {
    if (gate_) gate_->release();
}

ReadGate::ReadGate(size_t permits) : available_(permits == 0 ? 1 : permits) {}

std::optional<ReadGate::Permit> ReadGate::acquire(const CancelToken& token) {
    std::unique_lock lock(mutex_);
    // Cancellation is not signalled through the condition variable, so poll it.
    while (available_ == 0) {
        if (token.cancelled()) return std::nullopt;
        cv_.wait_for(lock, std::chrono::milliseconds(20));
    }
    if (token.cancelled()) return std::nullopt;
    --available_;
    return Permit(this);
}

size_t ReadGate::available() const {
    std::lock_guard lock(mutex_);
    return available_;
}

void ReadGate::release() {
    {
        std::lock_guard lock(mutex_);
        ++available_;
    }
    cv_.notify_one();
}
