/**
 * @file PlaybackSession.hpp
 * @brief One consumer's replay of one owner over a shared pipeline.
 * @author MasterLaplace
 *
 * A session owns its PlaybackController and the last valid snapshot.
 * Consumers either pull (getSnapshot, latest) or register tick listeners
 * that are pushed the refreshed snapshot on every onTimer() call.
 *
 * Within one onTimer() the cursor advance, feature lookup, classification
 * and rationale all complete before the call returns, so listeners never
 * observe a partially updated tick. A snapshot that cannot be built (for
 * instance an unusable row) is logged and the previous one is kept.
 */

#pragma once

#include "cbb/playback/InferencePipeline.hpp"
#include "cbb/playback/PlaybackController.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace cbb::playback {

using TickListener = std::function<void(const Snapshot &snapshot)>;

class PlaybackSession {
public:
    /**
     * @brief Binds @p owner of @p pipeline.
     *
     * @param durationBound Upper limit of the cursor; B is the smaller of
     *                      this and the owner's series length.
     * @return kNotFound if the pipeline has no table for @p owner.
     */
    [[nodiscard]] static core::Expected<PlaybackSession> create(
        std::shared_ptr<const InferencePipeline> pipeline,
        core::OwnerId owner,
        core::usize durationBound,
        SpeedPolicy speeds = {});

    PlaybackSession(PlaybackSession &&) noexcept;
    PlaybackSession &operator=(PlaybackSession &&) noexcept;
    ~PlaybackSession();

    PlaybackSession(const PlaybackSession &) = delete;
    PlaybackSession &operator=(const PlaybackSession &) = delete;

    /// Pull: snapshot at an arbitrary cursor, without touching session state.
    [[nodiscard]] core::Expected<Snapshot> getSnapshot(core::usize cursor) const;

    void start();
    void pause();
    void reset();
    void setSpeed(core::u32 speed);
    void seek(core::usize position);

    /**
     * @brief External periodic trigger: tick if running, refresh, notify.
     */
    void onTimer();

    void onTick(TickListener listener);
    void onStateChange(StateChangeCallback callback);

    [[nodiscard]] core::OwnerId owner() const noexcept;
    [[nodiscard]] core::usize currentCursor() const noexcept;
    [[nodiscard]] PlaybackBounds bounds() const noexcept;
    [[nodiscard]] core::u32 speed() const noexcept;
    [[nodiscard]] PlaybackState state() const noexcept;

    /// Last valid snapshot, empty until one could be built.
    [[nodiscard]] const std::optional<Snapshot> &latest() const noexcept;

private:
    struct Impl;
    explicit PlaybackSession(std::unique_ptr<Impl> impl);

    void refresh();

    std::unique_ptr<Impl> _impl;
};

} // namespace cbb::playback
