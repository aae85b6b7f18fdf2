#pragma once

#include <atomic>

namespace sre_gateway {

// Set from any thread; polled by the process runner while a command runs.
class CancellationToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool IsCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace sre_gateway
