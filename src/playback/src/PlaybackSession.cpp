/**
 * @file PlaybackSession.cpp
 * @brief Implementation of the per-consumer playback session.
 * @author MasterLaplace
 */

#include "cbb/playback/PlaybackSession.hpp"

#include "cbb/core/Log.hpp"

#include <algorithm>
#include <vector>

namespace cbb::playback {

struct PlaybackSession::Impl {
    std::shared_ptr<const InferencePipeline> pipeline;
    core::OwnerId owner;
    PlaybackController controller;
    std::optional<Snapshot> latest;
    std::vector<TickListener> listeners;
};

PlaybackSession::PlaybackSession(std::unique_ptr<Impl> impl) : _impl(std::move(impl)) {}
PlaybackSession::PlaybackSession(PlaybackSession &&) noexcept = default;
PlaybackSession &PlaybackSession::operator=(PlaybackSession &&) noexcept = default;
PlaybackSession::~PlaybackSession() = default;

core::Expected<PlaybackSession> PlaybackSession::create(
    std::shared_ptr<const InferencePipeline> pipeline,
    core::OwnerId owner,
    core::usize durationBound,
    SpeedPolicy speeds)
{
    const auto table = pipeline->table(owner);
    if (!table) {
        return core::makeError(core::ErrorCode::kNotFound, "owner " + std::to_string(owner) + " not loaded");
    }

    const core::usize upper = std::min(table->rows(), durationBound);
    auto impl = std::make_unique<Impl>(Impl{
        .pipeline = std::move(pipeline),
        .owner = owner,
        .controller = PlaybackController(upper, std::move(speeds)),
        .latest = std::nullopt,
        .listeners = {},
    });

    PlaybackSession session(std::move(impl));
    session.refresh();

    core::Log::info("playback", "session on owner " + std::to_string(owner) + ", bounds [1, "
        + std::to_string(upper) + "]");
    return session;
}

core::Expected<Snapshot> PlaybackSession::getSnapshot(core::usize cursor) const
{
    return _impl->pipeline->snapshot(_impl->owner, cursor);
}

void PlaybackSession::start()
{
    _impl->controller.start();
}

void PlaybackSession::pause()
{
    _impl->controller.pause();
    refresh();
}

void PlaybackSession::reset()
{
    _impl->controller.reset();
    refresh();
}

void PlaybackSession::setSpeed(core::u32 speed)
{
    _impl->controller.setSpeed(speed);
}

void PlaybackSession::seek(core::usize position)
{
    _impl->controller.seek(position);
    refresh();
}

void PlaybackSession::onTimer()
{
    if (!_impl->controller.tick())
        return;

    refresh();
    if (!_impl->latest)
        return;
    for (const auto &listener : _impl->listeners)
        listener(*_impl->latest);
}

void PlaybackSession::refresh()
{
    auto snapshot = getSnapshot(_impl->controller.currentCursor());
    if (!snapshot) {
        core::Log::warn("playback", snapshot.error().format() + ", keeping previous snapshot");
        return;
    }
    _impl->latest = std::move(*snapshot);
}

void PlaybackSession::onTick(TickListener listener)
{
    _impl->listeners.push_back(std::move(listener));
}

void PlaybackSession::onStateChange(StateChangeCallback callback)
{
    _impl->controller.onStateChange(std::move(callback));
}

core::OwnerId PlaybackSession::owner() const noexcept
{
    return _impl->owner;
}

core::usize PlaybackSession::currentCursor() const noexcept
{
    return _impl->controller.currentCursor();
}

PlaybackBounds PlaybackSession::bounds() const noexcept
{
    return _impl->controller.bounds();
}

core::u32 PlaybackSession::speed() const noexcept
{
    return _impl->controller.speed();
}

PlaybackState PlaybackSession::state() const noexcept
{
    return _impl->controller.state();
}

const std::optional<Snapshot> &PlaybackSession::latest() const noexcept
{
    return _impl->latest;
}

} // namespace cbb::playback
