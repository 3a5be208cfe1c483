// /////////////////////////////////////////////////////////////////////////////
/// @file TickTimer.hpp
/// @brief Fixed-period tick source with a coalescing accumulator.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include "cbb/core/Types.hpp"

#include <chrono>
#include <functional>

namespace cbb::playback {

/// @brief Emits one tick per period of accumulated time.
///
/// advance() fires at most one tick per call and keeps at most one more
/// tick pending: a consumer slower than the period sees ticks coalesce
/// instead of queueing up.
class TickTimer
{
public:
    using Duration = std::chrono::duration<core::f64>;

    /// @param period   Time between ticks; must be positive.
    /// @param realtime When false, run() advances one period per iteration
    ///                 and never sleeps.
    explicit TickTimer(std::chrono::milliseconds period, bool realtime = true);

    /// @brief Accumulate @p elapsed and report whether a tick is due.
    [[nodiscard]] bool advance(Duration elapsed) noexcept;

    /// @brief Drive @p onTick from a steady clock until requestStop().
    void run(const std::function<void()> &onTick);

    void requestStop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] core::u64 tickCount() const noexcept;
    [[nodiscard]] bool hasPending() const noexcept;
    [[nodiscard]] std::chrono::milliseconds period() const noexcept;

private:
    Duration period_;
    Duration accumulator_{0.0};
    bool realtime_;
    bool running_{false};
    core::u64 tickCount_{0};
};

} // namespace cbb::playback
