// /////////////////////////////////////////////////////////////////////////////
/// @file TickTimer.cpp
/// @brief TickTimer implementation, fixed period with a capped accumulator.
// /////////////////////////////////////////////////////////////////////////////

#include "cbb/playback/TickTimer.hpp"

#include "cbb/core/Assert.hpp"
#include "cbb/core/Log.hpp"

#include <algorithm>
#include <string>
#include <thread>

namespace cbb::playback {

TickTimer::TickTimer(std::chrono::milliseconds period, bool realtime)
    : period_{std::chrono::duration_cast<Duration>(period)}, realtime_{realtime}
{
    CBB_ASSERT(period.count() > 0);
}

bool TickTimer::advance(Duration elapsed) noexcept
{
    if (elapsed.count() > 0.0)
        accumulator_ += elapsed;

    // One tick now plus at most one pending.
    accumulator_ = std::min(accumulator_, period_ * 2.0);

    if (accumulator_ < period_)
        return false;

    accumulator_ -= period_;
    ++tickCount_;
    return true;
}

void TickTimer::run(const std::function<void()> &onTick)
{
    CBB_ASSERT(onTick);
    running_ = true;

    using Clock = std::chrono::steady_clock;
    auto previous = Clock::now();

    while (running_)
    {
        Duration frameTime = period_;
        if (realtime_)
        {
            const auto current = Clock::now();
            frameTime = current - previous;
            previous = current;
        }

        if (advance(frameTime))
        {
            onTick();
        }

        if (realtime_ && running_ && !hasPending())
        {
            std::this_thread::sleep_for(period_ - accumulator_);
        }
    }

    core::Log::info("playback", "timer stopped after " + std::to_string(tickCount_) + " tick(s)");
}

void TickTimer::requestStop() noexcept
{
    running_ = false;
}

bool TickTimer::isRunning() const noexcept
{
    return running_;
}

core::u64 TickTimer::tickCount() const noexcept
{
    return tickCount_;
}

bool TickTimer::hasPending() const noexcept
{
    return accumulator_ >= period_;
}

std::chrono::milliseconds TickTimer::period() const noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(period_);
}

} // namespace cbb::playback
