/**
 * @file PlaybackController.cpp
 * @brief Implementation of the playback state machine.
 * @author MasterLaplace
 */

#include "cbb/playback/PlaybackController.hpp"

#include "cbb/core/Log.hpp"

#include <algorithm>
#include <string>

namespace cbb::playback {

namespace {

constexpr std::string_view kTag = "playback";

} // namespace

std::string_view playbackStateName(PlaybackState state) noexcept
{
    switch (state) {
        case PlaybackState::kIdle:    return "Idle";
        case PlaybackState::kRunning: return "Running";
        case PlaybackState::kPaused:  return "Paused";
    }
    return "Unknown";
}

PlaybackController::PlaybackController(core::usize upperBound, SpeedPolicy policy)
    : _policy(std::move(policy)), _upper(std::max<core::usize>(upperBound, 1))
{
    setSpeed(_policy.initial);
}

void PlaybackController::onStateChange(StateChangeCallback callback)
{
    _observers.push_back(std::move(callback));
}

void PlaybackController::start()
{
    if (_state != PlaybackState::kRunning)
        transition(PlaybackState::kRunning);
}

void PlaybackController::pause()
{
    if (_state == PlaybackState::kRunning)
        transition(PlaybackState::kPaused);
}

void PlaybackController::reset()
{
    _cursor = 1;
    if (_state != PlaybackState::kIdle)
        transition(PlaybackState::kIdle);
}

bool PlaybackController::tick() noexcept
{
    if (_state != PlaybackState::kRunning)
        return false;

    _cursor = (_cursor + _speed > _upper) ? 1 : _cursor + _speed;
    return true;
}

void PlaybackController::setSpeed(core::u32 speed)
{
    const auto &allowed = _policy.allowed;
    if (std::find(allowed.begin(), allowed.end(), speed) != allowed.end()) {
        _speed = speed;
        return;
    }
    core::Log::debug(kTag, "speed " + std::to_string(speed) + " not allowed, using 1");
    _speed = 1;
}

void PlaybackController::seek(core::usize position)
{
    const auto clamped = std::clamp<core::usize>(position, 1, _upper);
    if (clamped != position)
        core::Log::debug(kTag, "seek " + std::to_string(position) + " clamped to " + std::to_string(clamped));
    _cursor = clamped;
}

void PlaybackController::transition(PlaybackState newState)
{
    const auto oldState = _state;
    _state = newState;
    for (const auto &observer : _observers)
        observer(oldState, newState);
}

} // namespace cbb::playback
