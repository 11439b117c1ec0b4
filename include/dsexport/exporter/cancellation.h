#pragma once

#include <atomic>

namespace dsexport::exporter {

// Session-wide stop signal. Set at most once, never cleared; observed at checkpoints only.
class CancellationFlag {
public:
    // Returns true only for the call that actually set the flag
    bool set() noexcept {
        bool expected = false;
        return flag_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    [[nodiscard]] bool isSet() const noexcept { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> flag_{false};
};

} // namespace dsexport::exporter
