/**
 * @file PlaybackController.hpp
 * @brief Deterministic playback state machine over a bounded cursor.
 * @author MasterLaplace
 *
 * Drives a 1-based cursor over [1, B] where B is the shorter of the
 * series length and the configured duration bound.
 *
 *   Idle --start--> Running --pause--> Paused --start--> Running
 *   any  --reset--> Idle (cursor = 1)
 *
 * tick() advances the cursor by the current speed while Running and wraps
 * to 1 when the next position would pass B. There is no terminal state:
 * playback loops until paused or reset.
 *
 * Usage errors never fail: an unsupported speed falls back to 1 and a
 * seek outside the bounds is clamped.
 */

#pragma once

#include "cbb/core/Types.hpp"

#include <functional>
#include <string_view>
#include <vector>

namespace cbb::playback {

enum class PlaybackState : core::u8 {
    kIdle,
    kRunning,
    kPaused,
};

[[nodiscard]] std::string_view playbackStateName(PlaybackState state) noexcept;

/**
 * @brief Observer callback fired on state transitions.
 */
using StateChangeCallback = std::function<void(PlaybackState oldState, PlaybackState newState)>;

struct PlaybackBounds {
    core::usize lower = 1;
    core::usize upper = 1;
};

/**
 * @brief Speeds a controller accepts.
 */
struct SpeedPolicy {
    std::vector<core::u32> allowed = {1, 10, 50, 100};
    core::u32 initial = 1;
};

class PlaybackController {
public:
    /**
     * @param upperBound B; values below 1 are raised to 1.
     * @param policy     Allowed speeds and initial speed.
     */
    explicit PlaybackController(core::usize upperBound, SpeedPolicy policy = {});

    void onStateChange(StateChangeCallback callback);

    /// Idle or Paused to Running; no-op when Running.
    void start();

    /// Running to Paused; no-op otherwise.
    void pause();

    /// Any state to Idle, cursor back to 1.
    void reset();

    /**
     * @brief Advances the cursor by speed() if Running.
     * @return true if the tick was applied, even when the cursor wrapped
     *         back onto the same position.
     */
    bool tick() noexcept;

    /// Sets the speed, or 1 when @p speed is not allowed. State unchanged.
    void setSpeed(core::u32 speed);

    /// Moves the cursor, clamped to [1, B]. State unchanged.
    void seek(core::usize position);

    [[nodiscard]] core::usize currentCursor() const noexcept { return _cursor; }
    [[nodiscard]] PlaybackBounds bounds() const noexcept { return {1, _upper}; }
    [[nodiscard]] core::u32 speed() const noexcept { return _speed; }
    [[nodiscard]] PlaybackState state() const noexcept { return _state; }
    [[nodiscard]] bool running() const noexcept { return _state == PlaybackState::kRunning; }
    [[nodiscard]] const std::vector<core::u32> &allowedSpeeds() const noexcept { return _policy.allowed; }

private:
    void transition(PlaybackState newState);

    SpeedPolicy _policy;
    core::usize _upper;
    core::usize _cursor = 1;
    core::u32 _speed = 1;
    PlaybackState _state = PlaybackState::kIdle;
    std::vector<StateChangeCallback> _observers;
};

} // namespace cbb::playback
