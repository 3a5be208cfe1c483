/**
 * @file TestConfig.cpp
 * @brief Unit tests for engine::Config and engine::ConfigLoader.
 */

#include <catch2/catch_test_macros.hpp>

#include "cbb/engine/ConfigLoader.hpp"

#include <filesystem>

namespace cbb::engine {

using model::CognitiveState;

namespace {

core::ErrorCode loadError(std::string_view document)
{
    const auto cfg = ConfigLoader::fromJson(document);
    REQUIRE_FALSE(cfg.has_value());
    return cfg.error().code();
}

} // namespace

TEST_CASE("Config defaults describe the reference deployment", "[engine][config]")
{
    const auto cfg = Config::Builder().build();

    REQUIRE(cfg.validate().has_value());
    REQUIRE(cfg.layout().channels.size() == 3);
    REQUIRE(cfg.layout().ownerColumn == "surgeon_id");
    REQUIRE(cfg.layout().labelColumn == std::optional<std::string>("cognitive_state"));
    REQUIRE(cfg.features().size() == 5);
    REQUIRE(cfg.features()[0].name == "tonic_pupil_level_30s");
    REQUIRE(cfg.speeds().allowed == std::vector<core::u32>{1, 10, 50, 100});
    REQUIRE(cfg.speeds().initial == 1);
    REQUIRE(cfg.durationBound() == 10800);
    REQUIRE(cfg.tickPeriod() == std::chrono::milliseconds(1000));
    REQUIRE(cfg.shortSeriesPolicy() == feature::ShortSeriesPolicy::kFail);
    REQUIRE_FALSE(cfg.playbackOwner().has_value());

    const auto &highLoad = cfg.rules().rules(CognitiveState::kHighLoad);
    REQUIRE(highLoad.bullets.size() == 2);
    REQUIRE(highLoad.bullets[1].condition.has_value());
    REQUIRE(highLoad.bullets[1].condition->direction == explain::Direction::kAbove);
    REQUIRE(highLoad.bullets[1].condition->threshold == 0.1);

    const auto schema = feature::FeatureSchema::create(cfg.features());
    REQUIRE(schema.has_value());
    REQUIRE(schema->maxWarmup() == 30);
}

TEST_CASE("Config::validate rejects inconsistent settings", "[engine][config]")
{
    const auto rejects = [](const Config::Builder &builder) {
        const auto result = builder.build().validate();
        return !result.has_value() && result.error().code() == core::ErrorCode::kInvalidConfig;
    };

    SECTION("no channel")
    {
        REQUIRE(rejects(Config::Builder().channels({})));
    }

    SECTION("inverted range")
    {
        REQUIRE(rejects(Config::Builder().channels({{"pupil", series::ChannelRange{5.0, 1.0}}})));
    }

    SECTION("no feature")
    {
        REQUIRE(rejects(Config::Builder().features({})));
    }

    SECTION("speed zero")
    {
        REQUIRE(rejects(Config::Builder().allowedSpeeds({0, 1})));
    }

    SECTION("duration bound zero")
    {
        REQUIRE(rejects(Config::Builder().durationBound(0)));
    }

    SECTION("empty owner column")
    {
        REQUIRE(rejects(Config::Builder().ownerColumn("")));
    }

    SECTION("a disallowed default speed only warns")
    {
        REQUIRE_FALSE(rejects(Config::Builder().defaultSpeed(7)));
    }
}

TEST_CASE("ConfigLoader overrides defaults key by key", "[engine][config]")
{
    const auto cfg = ConfigLoader::fromJson(R"({
        "input": "data/recording.csv",
        "model": "/abs/model.json",
        "columns": {"owner": "pilot", "time": "t", "label": null},
        "features": [{"name": "pupil_mean_3", "channel": "pupil_diameter_mm", "kind": "mean", "window": 3}],
        "playback": {"allowed_speeds": [1, 2], "default_speed": 2, "duration_bound": 60,
                     "tick_period_ms": 250, "owner": 7},
        "rationale": {"Fatigued": {"headline": "Tired.",
                      "rules": [{"source": "pupil_mean_3", "direction": "<", "threshold": 3.0,
                                 "template": "pupil {value}", "precision": 1}]}},
        "short_series_policy": "exclude",
        "log_level": "debug"
    })", "/etc/cbb");
    REQUIRE(cfg.has_value());

    REQUIRE(cfg->inputPath() == "/etc/cbb/data/recording.csv");
    REQUIRE(cfg->modelPath() == "/abs/model.json");
    REQUIRE(cfg->layout().ownerColumn == "pilot");
    REQUIRE(cfg->layout().timeColumn == "t");
    REQUIRE_FALSE(cfg->layout().labelColumn.has_value());
    REQUIRE(cfg->layout().channels.size() == 3);
    REQUIRE(cfg->features().size() == 1);
    REQUIRE(cfg->speeds().allowed == std::vector<core::u32>{1, 2});
    REQUIRE(cfg->speeds().initial == 2);
    REQUIRE(cfg->durationBound() == 60);
    REQUIRE(cfg->tickPeriod() == std::chrono::milliseconds(250));
    REQUIRE(cfg->playbackOwner() == std::optional<core::OwnerId>(7));
    REQUIRE(cfg->shortSeriesPolicy() == feature::ShortSeriesPolicy::kExclude);
    REQUIRE(cfg->logLevel() == core::LogLevel::kDebug);

    const auto &fatigued = cfg->rules().rules(CognitiveState::kFatigued);
    REQUIRE(fatigued.headline == "Tired.");
    REQUIRE(fatigued.bullets.size() == 1);
    REQUIRE(fatigued.bullets[0].condition->direction == explain::Direction::kBelow);
    REQUIRE(fatigued.bullets[0].precision == 1);

    // Untouched states keep their defaults.
    REQUIRE(cfg->rules().rules(CognitiveState::kOptimal).bullets.size() == 3);
}

TEST_CASE("ConfigLoader reports malformed documents", "[engine][config]")
{
    SECTION("not JSON")
    {
        REQUIRE(loadError("{ \"input\": ") == core::ErrorCode::kFileParseError);
    }

    SECTION("root is not an object")
    {
        REQUIRE(loadError("[1, 2]") == core::ErrorCode::kInvalidConfig);
    }

    SECTION("unknown aggregation kind")
    {
        REQUIRE(loadError(R"({"features": [{"name": "f", "channel": "pupil_diameter_mm",
                              "kind": "median", "window": 3}]})") == core::ErrorCode::kInvalidConfig);
    }

    SECTION("zero window")
    {
        REQUIRE(loadError(R"({"features": [{"name": "f", "channel": "pupil_diameter_mm",
                              "kind": "mean", "window": 0}]})") == core::ErrorCode::kInvalidConfig);
    }

    SECTION("direction without threshold")
    {
        REQUIRE(loadError(R"({"rationale": {"Optimal": {"headline": "ok",
                              "rules": [{"source": "x", "direction": "above", "template": "{value}"}]}}})")
                == core::ErrorCode::kInvalidConfig);
    }

    SECTION("unknown state")
    {
        REQUIRE(loadError(R"({"rationale": {"Drowsy": {"headline": "zzz"}}})") == core::ErrorCode::kInvalidConfig);
    }

    SECTION("wrong value type")
    {
        REQUIRE(loadError(R"({"playback": {"duration_bound": "long"}})") == core::ErrorCode::kInvalidConfig);
    }

    SECTION("unknown policy")
    {
        REQUIRE(loadError(R"({"short_series_policy": "skip"})") == core::ErrorCode::kInvalidConfig);
    }

    SECTION("missing file")
    {
        const auto cfg = ConfigLoader::fromFile("/nonexistent/monitor.json");
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code() == core::ErrorCode::kFileNotFound);
    }
}

#ifdef CBB_CONFIG_DIR
TEST_CASE("The shipped monitor configuration loads", "[engine][config]")
{
    const auto cfg = ConfigLoader::fromFile(std::string(CBB_CONFIG_DIR) + "/monitor.json");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->features().size() == 5);
    REQUIRE(std::filesystem::path(cfg->modelPath()).filename() == "model.json");
    REQUIRE(std::filesystem::path(cfg->modelPath()).is_absolute());
}
#endif

} // namespace cbb::engine
