#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include "CancelToken.hpp"

// Counting gate that bounds how many segment reads run at once across every
// loader sharing it.
class ReadGate {
public:
    class Permit {
    public:
        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        ~Permit();

    private:
        friend class ReadGate;
        explicit Permit(ReadGate* gate) : gate_(gate) {}
        ReadGate* gate_;
    };

    explicit ReadGate(size_t permits);

    // Blocks until a permit is free. Returns nullopt if 'token' is cancelled
    // while waiting.
    std::optional<Permit> acquire(const CancelToken& token);

    size_t available() const;

private:
    void release();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t available_;
};
