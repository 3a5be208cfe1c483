// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Monitor configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises every tuneable parameter of the inference pipeline. A
/// default-built Config reproduces the reference deployment: three
/// channels, five engineered features, the dashboard rationale rules and
/// a three-hour replay at 1 Hz.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include "cbb/core/Expected.hpp"
#include "cbb/core/Log.hpp"
#include "cbb/explain/RuleTable.hpp"
#include "cbb/feature/FeatureSchema.hpp"
#include "cbb/feature/WindowedFeatureExtractor.hpp"
#include "cbb/playback/PlaybackController.hpp"
#include "cbb/series/CsvSeriesReader.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cbb::engine {

inline constexpr core::usize kDefaultDurationBound = 10800;
inline constexpr std::chrono::milliseconds kDefaultTickPeriod{1000};

/// @brief Immutable monitor configuration.
class Config
{
public:
    /// @brief Fluent builder for Config, seeded with the defaults.
    class Builder
    {
    public:
        Builder();

        Builder& inputPath(std::string path);
        Builder& modelPath(std::string path);
        Builder& ownerColumn(std::string name);
        Builder& timeColumn(std::string name);
        Builder& labelColumn(std::optional<std::string> name);
        Builder& channels(std::vector<series::ChannelSpec> channels);
        Builder& features(std::vector<feature::FeatureSpec> features);
        Builder& rules(explain::RuleTable table);
        Builder& stateRules(model::CognitiveState state, explain::StateRules rules);
        Builder& allowedSpeeds(std::vector<core::u32> speeds);
        Builder& defaultSpeed(core::u32 speed) noexcept;
        Builder& durationBound(core::usize seconds) noexcept;
        Builder& tickPeriod(std::chrono::milliseconds period) noexcept;
        Builder& playbackOwner(std::optional<core::OwnerId> owner) noexcept;
        Builder& shortSeriesPolicy(feature::ShortSeriesPolicy policy) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const;

    private:
        std::string inputPath_;
        std::string modelPath_;
        series::CsvSeriesLayout layout_;
        std::vector<feature::FeatureSpec> features_;
        explain::RuleTable rules_;
        playback::SpeedPolicy speeds_;
        core::usize durationBound_{kDefaultDurationBound};
        std::chrono::milliseconds tickPeriod_{kDefaultTickPeriod};
        std::optional<core::OwnerId> playbackOwner_;
        feature::ShortSeriesPolicy shortSeriesPolicy_{feature::ShortSeriesPolicy::kFail};
        core::LogLevel logLevel_{core::LogLevel::kInfo};
    };

    [[nodiscard]] static std::vector<series::ChannelSpec> defaultChannels();
    [[nodiscard]] static std::vector<feature::FeatureSpec> defaultFeatures();
    [[nodiscard]] static explain::RuleTable defaultRules();

    /// @brief Checks cross-field consistency.
    /// @return kInvalidConfig naming the first offending field.
    [[nodiscard]] core::ExpectedVoid validate() const;

    [[nodiscard]] const std::string&                      inputPath()         const noexcept { return inputPath_; }
    [[nodiscard]] const std::string&                      modelPath()         const noexcept { return modelPath_; }
    [[nodiscard]] const series::CsvSeriesLayout&          layout()            const noexcept { return layout_; }
    [[nodiscard]] const std::vector<feature::FeatureSpec>& features()         const noexcept { return features_; }
    [[nodiscard]] const explain::RuleTable&               rules()             const noexcept { return rules_; }
    [[nodiscard]] const playback::SpeedPolicy&            speeds()            const noexcept { return speeds_; }
    [[nodiscard]] core::usize                             durationBound()     const noexcept { return durationBound_; }
    [[nodiscard]] std::chrono::milliseconds               tickPeriod()        const noexcept { return tickPeriod_; }
    [[nodiscard]] std::optional<core::OwnerId>            playbackOwner()     const noexcept { return playbackOwner_; }
    [[nodiscard]] feature::ShortSeriesPolicy              shortSeriesPolicy() const noexcept { return shortSeriesPolicy_; }
    [[nodiscard]] core::LogLevel                          logLevel()          const noexcept { return logLevel_; }

private:
    friend class Builder;

    Config() = default;

    std::string inputPath_;
    std::string modelPath_;
    series::CsvSeriesLayout layout_;
    std::vector<feature::FeatureSpec> features_;
    explain::RuleTable rules_;
    playback::SpeedPolicy speeds_;
    core::usize durationBound_{kDefaultDurationBound};
    std::chrono::milliseconds tickPeriod_{kDefaultTickPeriod};
    std::optional<core::OwnerId> playbackOwner_;
    feature::ShortSeriesPolicy shortSeriesPolicy_{feature::ShortSeriesPolicy::kFail};
    core::LogLevel logLevel_{core::LogLevel::kInfo};
};

} // namespace cbb::engine
