#pragma once
// steady_clock timer for batch durations, plus an RAII exit action
#include <chrono>
#include <cstdint>
#include <exception>
#include <utility>

#include "logger.hpp"

namespace chatingest {

class Timer {
public:
    void start() noexcept { start_ = std::chrono::steady_clock::now(); }

    void stop() noexcept { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] int64_t elapsed_ms() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_{};
    std::chrono::steady_clock::time_point end_{};
};

// Runs the action when the scope ends, including unwinding by an exception.
// A throwing action is logged, never propagated out of the destructor.
template <typename F>
class ScopeExit {
public:
    explicit ScopeExit(F action) : action_(std::move(action)) {}

    ~ScopeExit() {
        try {
            action_();
        } catch (const std::exception& e) {
            LOG_ERR("[scope] Exit action failed: %s", e.what());
        }
    }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    F action_;
};

} // namespace chatingest
