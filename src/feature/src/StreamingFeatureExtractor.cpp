/**
 * @file StreamingFeatureExtractor.cpp
 * @brief Implementation of the incremental feature extractor.
 * @author MasterLaplace
 */

#include "cbb/feature/StreamingFeatureExtractor.hpp"

#include "cbb/core/Log.hpp"
#include "cbb/feature/RollingStatistics.hpp"

#include <algorithm>

namespace cbb::feature {

StreamingFeatureExtractor::StreamingFeatureExtractor(std::shared_ptr<const FeatureSchema> schema,
                                                     std::vector<std::string> channels,
                                                     std::vector<core::usize> channelOf)
    : _schema(std::move(schema)),
      _channels(std::move(channels)),
      _channelOf(std::move(channelOf)),
      _capacity(_schema->maxWarmup())
{
}

core::Expected<StreamingFeatureExtractor> StreamingFeatureExtractor::create(
    std::shared_ptr<const FeatureSchema> schema,
    std::vector<std::string> channels)
{
    CBB_TRY_VOID(schema->validateChannels(channels));

    std::vector<core::usize> channelOf;
    channelOf.reserve(schema->size());
    for (const auto &spec : schema->specs()) {
        const auto it = std::find(channels.begin(), channels.end(), spec.channel);
        channelOf.push_back(static_cast<core::usize>(it - channels.begin()));
    }

    return StreamingFeatureExtractor(std::move(schema), std::move(channels), std::move(channelOf));
}

StreamingFeatureExtractor::OwnerState StreamingFeatureExtractor::makeState() const
{
    OwnerState state;
    state.history.reserve(_channels.size());
    for (std::size_t i = 0; i < _channels.size(); ++i)
        state.history.emplace_back(_capacity);
    state.lastDefined.assign(_schema->size(), series::kMissing);
    return state;
}

core::Expected<FeatureVector> StreamingFeatureExtractor::push(core::OwnerId owner,
                                                              const series::Sample &sample)
{
    if (sample.values.size() != _channels.size()) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "sample has " + std::to_string(sample.values.size()) + " values, expected "
                + std::to_string(_channels.size()));
    }

    auto it = _owners.find(owner);
    if (it == _owners.end())
        it = _owners.emplace(owner, makeState()).first;
    auto &state = it->second;

    if (state.seen > 0 && sample.t <= state.lastT) {
        core::Log::warn("feature", "owner " + std::to_string(owner) + ": sample t="
            + std::to_string(sample.t) + " not after t=" + std::to_string(state.lastT)
            + ", rejected");
        return core::makeError(core::ErrorCode::kOutOfOrderSample,
            "owner " + std::to_string(owner) + ": t=" + std::to_string(sample.t)
                + " not after " + std::to_string(state.lastT));
    }

    for (std::size_t ch = 0; ch < _channels.size(); ++ch)
        state.history[ch].push_back(sample.values[ch]);
    state.lastT = sample.t;
    ++state.seen;

    std::vector<double> out(_schema->size());
    for (std::size_t c = 0; c < out.size(); ++c) {
        const auto &spec = _schema->spec(c);
        auto &buffer = state.history[_channelOf[c]];
        const std::span<const double> column(buffer.linearize(), buffer.size());

        const auto v = RollingStatistics::evaluate(spec.kind, column, column.size() - 1, spec.window);
        if (v)
            state.lastDefined[c] = *v;
        out[c] = state.lastDefined[c];
    }

    return FeatureVector(owner, sample.t, _schema, std::move(out));
}

void StreamingFeatureExtractor::resetOwner(core::OwnerId owner)
{
    _owners.erase(owner);
}

core::usize StreamingFeatureExtractor::samplesSeen(core::OwnerId owner) const noexcept
{
    const auto it = _owners.find(owner);
    return it == _owners.end() ? 0 : it->second.seen;
}

} // namespace cbb::feature
