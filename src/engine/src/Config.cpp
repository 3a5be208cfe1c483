// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation and reference defaults.
// /////////////////////////////////////////////////////////////////////////////

#include "cbb/engine/Config.hpp"

#include <algorithm>

namespace cbb::engine {

using explain::BulletRule;
using explain::Direction;
using explain::RuleCondition;
using explain::StateRules;
using feature::AggregationKind;
using model::CognitiveState;

// ─── Defaults ────────────────────────────────────────────────────────────────

std::vector<series::ChannelSpec> Config::defaultChannels()
{
    return {
        {"pupil_diameter_mm", series::ChannelRange{1.0, 10.0}},
        {"grip_force_newtons", series::ChannelRange{0.0, 100.0}},
        {"instrument_tremor_hz", series::ChannelRange{0.0, 50.0}},
    };
}

std::vector<feature::FeatureSpec> Config::defaultFeatures()
{
    return {
        {"tonic_pupil_level_30s", "pupil_diameter_mm", AggregationKind::kMean, 30},
        {"grip_force_variability_15s", "grip_force_newtons", AggregationKind::kStdDev, 15},
        {"tremor_trend_10s", "instrument_tremor_hz", AggregationKind::kMean, 10},
        {"phasic_pupil_change_5s", "pupil_diameter_mm", AggregationKind::kDelta, 5},
        {"pupil_diameter_lag_5s", "pupil_diameter_mm", AggregationKind::kLag, 5},
    };
}

explain::RuleTable Config::defaultRules()
{
    explain::RuleTable table;

    table.set(CognitiveState::kOptimal, StateRules{
        "Surgeon is in a state of low cognitive load with stable physiological and motor control.",
        {
            BulletRule{"pupil_diameter_mm", std::nullopt, "Stable Pupil Diameter ({value} mm)", 2},
            BulletRule{"grip_force_newtons", std::nullopt, "Consistent Grip Force ({value} N)", 1},
            BulletRule{"instrument_tremor_hz", std::nullopt, "Low Tremor ({value} Hz)", 2},
        }});

    table.set(CognitiveState::kHighLoad, StateRules{
        "Elevated cognitive demand detected. This is primarily driven by:",
        {
            BulletRule{"tonic_pupil_level_30s", std::nullopt, "Elevated Tonic Pupil Level ({value} mm)", 2},
            BulletRule{"phasic_pupil_change_5s", RuleCondition{Direction::kAbove, 0.1},
                       "Rapid Pupil Dilation Event ({value} mm change)", 3},
        }});

    table.set(CognitiveState::kFatigued, StateRules{
        "Signs of fatigue are present, indicated by a decline in fine motor control. Key drivers include:",
        {
            BulletRule{"tremor_trend_10s", std::nullopt, "Increased Instrument Tremor ({value} Hz)", 2},
            BulletRule{"grip_force_variability_15s", std::nullopt, "Elevated Grip Variability ({value} N)", 3},
            BulletRule{"tonic_pupil_level_30s", RuleCondition{Direction::kBelow, 3.2},
                       "Constricted pupil indicating reduced arousal", 2},
        }});

    table.set(CognitiveState::kAttentionalLapse, StateRules{
        "ALERT: High probability of an attentional lapse. The model detected:",
        {
            BulletRule{"grip_force_variability_15s", std::nullopt, "High Grip Force Variability ({value} N)", 3},
            BulletRule{"pupil_diameter_mm", std::nullopt, "Constricted Pupil Diameter ({value} mm)", 2},
            BulletRule{"instrument_tremor_hz", std::nullopt, "Elevated Tremor ({value} Hz)", 2},
        }});

    return table;
}

// ─── Builder ─────────────────────────────────────────────────────────────────

Config::Builder::Builder()
    : features_{defaultFeatures()}, rules_{defaultRules()}
{
    layout_.channels = defaultChannels();
}

Config::Builder& Config::Builder::inputPath(std::string path)
{
    inputPath_ = std::move(path);
    return *this;
}

Config::Builder& Config::Builder::modelPath(std::string path)
{
    modelPath_ = std::move(path);
    return *this;
}

Config::Builder& Config::Builder::ownerColumn(std::string name)
{
    layout_.ownerColumn = std::move(name);
    return *this;
}

Config::Builder& Config::Builder::timeColumn(std::string name)
{
    layout_.timeColumn = std::move(name);
    return *this;
}

Config::Builder& Config::Builder::labelColumn(std::optional<std::string> name)
{
    layout_.labelColumn = std::move(name);
    return *this;
}

Config::Builder& Config::Builder::channels(std::vector<series::ChannelSpec> channels)
{
    layout_.channels = std::move(channels);
    return *this;
}

Config::Builder& Config::Builder::features(std::vector<feature::FeatureSpec> features)
{
    features_ = std::move(features);
    return *this;
}

Config::Builder& Config::Builder::rules(explain::RuleTable table)
{
    rules_ = std::move(table);
    return *this;
}

Config::Builder& Config::Builder::stateRules(model::CognitiveState state, explain::StateRules rules)
{
    rules_.set(state, std::move(rules));
    return *this;
}

Config::Builder& Config::Builder::allowedSpeeds(std::vector<core::u32> speeds)
{
    speeds_.allowed = std::move(speeds);
    return *this;
}

Config::Builder& Config::Builder::defaultSpeed(core::u32 speed) noexcept
{
    speeds_.initial = speed;
    return *this;
}

Config::Builder& Config::Builder::durationBound(core::usize seconds) noexcept
{
    durationBound_ = seconds;
    return *this;
}

Config::Builder& Config::Builder::tickPeriod(std::chrono::milliseconds period) noexcept
{
    tickPeriod_ = period;
    return *this;
}

Config::Builder& Config::Builder::playbackOwner(std::optional<core::OwnerId> owner) noexcept
{
    playbackOwner_ = owner;
    return *this;
}

Config::Builder& Config::Builder::shortSeriesPolicy(feature::ShortSeriesPolicy policy) noexcept
{
    shortSeriesPolicy_ = policy;
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg.inputPath_         = inputPath_;
    cfg.modelPath_         = modelPath_;
    cfg.layout_            = layout_;
    cfg.features_          = features_;
    cfg.rules_             = rules_;
    cfg.speeds_            = speeds_;
    cfg.durationBound_     = durationBound_;
    cfg.tickPeriod_        = tickPeriod_;
    cfg.playbackOwner_     = playbackOwner_;
    cfg.shortSeriesPolicy_ = shortSeriesPolicy_;
    cfg.logLevel_          = logLevel_;
    return cfg;
}

// ─── Validation ──────────────────────────────────────────────────────────────

core::ExpectedVoid Config::validate() const
{
    const auto invalid = [](std::string what) {
        return core::makeError(core::ErrorCode::kInvalidConfig, std::move(what));
    };

    if (layout_.ownerColumn.empty() || layout_.timeColumn.empty())
        return invalid("owner and time columns must be named");
    if (layout_.channels.empty())
        return invalid("at least one channel is required");
    for (const auto &channel : layout_.channels) {
        if (channel.name.empty())
            return invalid("channel with empty name");
        if (channel.range && channel.range->min > channel.range->max)
            return invalid("channel '" + channel.name + "' has min > max");
    }
    if (features_.empty())
        return invalid("at least one feature is required");
    if (speeds_.allowed.empty())
        return invalid("playback.allowed_speeds is empty");
    if (std::find(speeds_.allowed.begin(), speeds_.allowed.end(), 0u) != speeds_.allowed.end())
        return invalid("playback.allowed_speeds contains 0");
    if (durationBound_ == 0)
        return invalid("playback.duration_bound must be at least 1");
    if (tickPeriod_.count() <= 0)
        return invalid("playback.tick_period_ms must be positive");

    if (std::find(speeds_.allowed.begin(), speeds_.allowed.end(), speeds_.initial) == speeds_.allowed.end()) {
        core::Log::warn("config", "default speed " + std::to_string(speeds_.initial)
            + " is not an allowed speed, playback will use 1");
    }
    return {};
}

} // namespace cbb::engine
