// /////////////////////////////////////////////////////////////////////////////
/// @file ConfigLoader.cpp
/// @brief JSON configuration loader (nlohmann/json).
// /////////////////////////////////////////////////////////////////////////////

#include "cbb/engine/ConfigLoader.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace cbb::engine {

namespace {

constexpr std::string_view kTag = "config";

core::Unexpected invalid(std::string what)
{
    return core::makeError(core::ErrorCode::kInvalidConfig, std::move(what));
}

std::string resolvePath(const std::string& path, const std::string& baseDir)
{
    if (path.empty() || baseDir.empty() || std::filesystem::path(path).is_absolute())
        return path;
    return (std::filesystem::path(baseDir) / path).lexically_normal().string();
}

core::Expected<std::vector<series::ChannelSpec>> parseChannels(const json& node)
{
    if (!node.is_array())
        return invalid("'channels' must be an array");

    std::vector<series::ChannelSpec> out;
    for (const auto& jc : node) {
        series::ChannelSpec channel;
        channel.name = jc.at("name").get<std::string>();
        if (jc.contains("min") || jc.contains("max")) {
            series::ChannelRange range;
            range.min = jc.value("min", range.min);
            range.max = jc.value("max", range.max);
            channel.range = range;
        }
        out.push_back(std::move(channel));
    }
    return out;
}

core::Expected<std::vector<feature::FeatureSpec>> parseFeatures(const json& node)
{
    if (!node.is_array())
        return invalid("'features' must be an array");

    std::vector<feature::FeatureSpec> out;
    for (const auto& jf : node) {
        feature::FeatureSpec spec;
        spec.name = jf.at("name").get<std::string>();
        spec.channel = jf.at("channel").get<std::string>();

        const auto kindText = jf.at("kind").get<std::string>();
        const auto kind = feature::parseAggregationKind(kindText);
        if (!kind)
            return invalid("feature '" + spec.name + "': unknown kind '" + kindText + "'");
        spec.kind = *kind;

        const auto window = jf.at("window").get<core::i64>();
        if (window < 1)
            return invalid("feature '" + spec.name + "': window must be at least 1");
        spec.window = static_cast<core::usize>(window);

        out.push_back(std::move(spec));
    }
    return out;
}

core::Expected<explain::StateRules> parseStateRules(const json& node, std::string_view state)
{
    const std::string where(state);
    if (!node.is_object())
        return invalid("rationale." + where + " must be an object");

    explain::StateRules rules;
    rules.headline = node.at("headline").get<std::string>();

    for (const auto& jr : node.value("rules", json::array())) {
        explain::BulletRule rule;
        rule.source = jr.at("source").get<std::string>();
        rule.text = jr.at("template").get<std::string>();
        rule.precision = jr.value("precision", 2);

        const bool hasDirection = jr.contains("direction");
        if (hasDirection != jr.contains("threshold"))
            return invalid("rationale." + where + ": 'direction' and 'threshold' go together");

        if (hasDirection) {
            const auto text = jr.at("direction").get<std::string>();
            const auto direction = explain::parseDirection(text);
            if (!direction)
                return invalid("rationale." + where + ": unknown direction '" + text + "'");
            rule.condition = explain::RuleCondition{*direction, jr.at("threshold").get<double>()};
        }
        rules.bullets.push_back(std::move(rule));
    }
    return rules;
}

core::ExpectedVoid applyPlayback(const json& node, Config::Builder& builder)
{
    if (!node.is_object())
        return invalid("'playback' must be an object");

    if (node.contains("allowed_speeds"))
        builder.allowedSpeeds(node.at("allowed_speeds").get<std::vector<core::u32>>());
    if (node.contains("default_speed"))
        builder.defaultSpeed(node.at("default_speed").get<core::u32>());
    if (node.contains("duration_bound"))
        builder.durationBound(node.at("duration_bound").get<core::usize>());
    if (node.contains("tick_period_ms"))
        builder.tickPeriod(std::chrono::milliseconds(node.at("tick_period_ms").get<core::i64>()));
    if (node.contains("owner"))
        builder.playbackOwner(node.at("owner").get<core::OwnerId>());
    return {};
}

core::Expected<Config> parseDocument(const json& root, const std::string& baseDir)
{
    static const std::set<std::string> kKnownKeys = {
        "input", "model", "columns", "channels", "features", "playback",
        "rationale", "short_series_policy", "log_level",
    };
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!kKnownKeys.contains(it.key()))
            core::Log::warn(kTag, "unknown key '" + it.key() + "' ignored");
    }

    Config::Builder builder;

    if (root.contains("input"))
        builder.inputPath(resolvePath(root.at("input").get<std::string>(), baseDir));
    if (root.contains("model"))
        builder.modelPath(resolvePath(root.at("model").get<std::string>(), baseDir));

    if (root.contains("columns")) {
        const auto& columns = root.at("columns");
        if (columns.contains("owner"))
            builder.ownerColumn(columns.at("owner").get<std::string>());
        if (columns.contains("time"))
            builder.timeColumn(columns.at("time").get<std::string>());
        if (columns.contains("label")) {
            const auto& label = columns.at("label");
            builder.labelColumn(label.is_null() ? std::nullopt
                                                : std::optional<std::string>(label.get<std::string>()));
        }
    }

    if (root.contains("channels"))
        builder.channels(CBB_TRY(parseChannels(root.at("channels"))));
    if (root.contains("features"))
        builder.features(CBB_TRY(parseFeatures(root.at("features"))));
    if (root.contains("playback"))
        CBB_TRY_VOID(applyPlayback(root.at("playback"), builder));

    if (root.contains("rationale")) {
        const auto& rationale = root.at("rationale");
        if (!rationale.is_object())
            return invalid("'rationale' must be an object");
        for (auto it = rationale.begin(); it != rationale.end(); ++it) {
            const auto state = model::parseState(it.key());
            if (!state)
                return invalid("rationale: unknown state '" + it.key() + "'");
            builder.stateRules(*state, CBB_TRY(parseStateRules(it.value(), it.key())));
        }
    }

    if (root.contains("short_series_policy")) {
        const auto text = root.at("short_series_policy").get<std::string>();
        const auto policy = feature::parseShortSeriesPolicy(text);
        if (!policy)
            return invalid("unknown short_series_policy '" + text + "'");
        builder.shortSeriesPolicy(*policy);
    }

    if (root.contains("log_level")) {
        const auto text = root.at("log_level").get<std::string>();
        const auto level = core::parseLogLevel(text);
        if (!level)
            return invalid("unknown log_level '" + text + "'");
        builder.logLevel(*level);
    }

    auto config = builder.build();
    CBB_TRY_VOID(config.validate());
    return config;
}

} // namespace

core::Expected<Config> ConfigLoader::fromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return core::makeError(core::ErrorCode::kFileNotFound, path);

    std::stringstream buffer;
    buffer << file.rdbuf();

    const auto baseDir = std::filesystem::path(path).parent_path().string();
    auto config = fromJson(buffer.str(), baseDir);
    if (config)
        core::Log::info(kTag, "configuration loaded from " + path);
    return config;
}

core::Expected<Config> ConfigLoader::fromJson(std::string_view document, const std::string& baseDir)
{
    json root;
    try {
        root = json::parse(document);
    } catch (const json::parse_error& e) {
        return core::makeError(core::ErrorCode::kFileParseError, e.what());
    }

    if (!root.is_object())
        return invalid("configuration root must be an object");

    try {
        return parseDocument(root, baseDir);
    } catch (const json::exception& e) {
        return invalid(e.what());
    }
}

} // namespace cbb::engine
