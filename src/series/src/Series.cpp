/**
 * @file Series.cpp
 * @brief Implementation of OwnerSeries and SeriesSet.
 * @author MasterLaplace
 */

#include "cbb/series/Series.hpp"

#include <algorithm>

namespace cbb::series {

// ─── OwnerSeries ─────────────────────────────────────────────────────────────

OwnerSeries::OwnerSeries(core::OwnerId owner,
                         std::shared_ptr<const std::vector<std::string>> channels,
                         std::vector<Sample> samples)
    : _owner(owner), _channels(std::move(channels)), _samples(std::move(samples))
{
}

core::Expected<OwnerSeries> OwnerSeries::create(
    core::OwnerId owner,
    std::shared_ptr<const std::vector<std::string>> channels,
    std::vector<Sample> samples)
{
    if (!channels) {
        return core::makeError(core::ErrorCode::kInvalidArgument, "series has no channel list");
    }

    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (samples[i].values.size() != channels->size()) {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                "owner " + std::to_string(owner) + ": sample " + std::to_string(i) + " has "
                    + std::to_string(samples[i].values.size()) + " values, expected "
                    + std::to_string(channels->size()));
        }
        if (i > 0 && samples[i].t <= samples[i - 1].t) {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                "owner " + std::to_string(owner) + ": timestamps not strictly increasing at t="
                    + std::to_string(samples[i].t));
        }
    }

    return OwnerSeries(owner, std::move(channels), std::move(samples));
}

std::optional<core::usize> OwnerSeries::channelIndex(std::string_view name) const noexcept
{
    const auto &names = *_channels;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name)
            return i;
    }
    return std::nullopt;
}

std::optional<core::usize> OwnerSeries::rowOf(core::Timestamp t) const noexcept
{
    const auto it = std::lower_bound(
        _samples.begin(), _samples.end(), t,
        [](const Sample &s, core::Timestamp value) { return s.t < value; });

    if (it == _samples.end() || it->t != t)
        return std::nullopt;
    return static_cast<core::usize>(it - _samples.begin());
}

std::vector<double> OwnerSeries::column(core::usize channel) const
{
    std::vector<double> out;
    out.reserve(_samples.size());
    for (const auto &s : _samples)
        out.push_back(s.values.at(channel));
    return out;
}

bool OwnerSeries::hasLabels() const noexcept
{
    return std::any_of(_samples.begin(), _samples.end(),
                       [](const Sample &s) { return s.label.has_value(); });
}

// ─── SeriesSet ───────────────────────────────────────────────────────────────

SeriesSet::SeriesSet(std::shared_ptr<const std::vector<std::string>> channels)
    : _channels(std::move(channels))
{
}

core::ExpectedVoid SeriesSet::add(OwnerSeries series)
{
    if (series.channels() != *_channels) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "owner " + std::to_string(series.owner()) + " has a different channel list");
    }

    const auto owner = series.owner();
    auto [it, inserted] = _series.emplace(owner, nullptr);
    if (!inserted) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "owner " + std::to_string(owner) + " added twice");
    }
    it->second = std::make_shared<const OwnerSeries>(std::move(series));
    return {};
}

std::shared_ptr<const OwnerSeries> SeriesSet::find(core::OwnerId owner) const
{
    const auto it = _series.find(owner);
    return it == _series.end() ? nullptr : it->second;
}

std::vector<core::OwnerId> SeriesSet::owners() const
{
    std::vector<core::OwnerId> out;
    out.reserve(_series.size());
    for (const auto &[owner, _] : _series)
        out.push_back(owner);
    return out;
}

core::usize SeriesSet::totalSamples() const noexcept
{
    core::usize total = 0;
    for (const auto &[_, s] : _series)
        total += s->size();
    return total;
}

} // namespace cbb::series
