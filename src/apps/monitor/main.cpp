// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Cognitive monitor entry-point.
///
/// Loads a recording and a trained classifier, then either exports the
/// engineered features (--featurize), evaluates the classifier against the
/// recording's labels (--evaluate), or replays one owner tick by tick on
/// the console.
// /////////////////////////////////////////////////////////////////////////////

#include "cbb/core/Log.hpp"
#include "cbb/engine/ConfigLoader.hpp"
#include "cbb/feature/FeatureTableWriter.hpp"
#include "cbb/model/Evaluation.hpp"
#include "cbb/model/ModelArtifact.hpp"
#include "cbb/playback/PlaybackSession.hpp"
#include "cbb/playback/TickTimer.hpp"

#include <charconv>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

using namespace cbb;

namespace {

constexpr std::string_view kTag = "monitor";

struct Options {
    std::optional<std::string> configPath;
    std::optional<core::OwnerId> owner;
    std::optional<core::u32> speed;
    std::optional<std::string> featurizePath;
    std::optional<core::LogLevel> logLevel;
    core::u64 ticks = 0;
    bool evaluate = false;
    bool realtime = true;
    bool help = false;
};

void printUsage(const char* argv0)
{
    std::printf("usage: %s --config <file> [--owner <id>] [--ticks <n>] [--speed <v>]\n"
                "       [--featurize <out.csv>] [--evaluate] [--no-sleep]\n"
                "       [--log-level debug|info|warn|error]\n",
                argv0);
}

template <typename T>
std::optional<T> parseNumber(const char* text)
{
    T value{};
    const auto* end = text + std::strlen(text);
    const auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    return value;
}

core::Expected<Options> parseArgs(int argc, char* argv[])
{
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;
        const auto missingValue = [&]() {
            return core::makeError(core::ErrorCode::kInvalidArgument, std::string(arg) + " needs a value");
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--evaluate") {
            opts.evaluate = true;
        } else if (arg == "--no-sleep") {
            opts.realtime = false;
        } else if (arg == "--config") {
            if (!hasValue)
                return missingValue();
            opts.configPath = argv[++i];
        } else if (arg == "--featurize") {
            if (!hasValue)
                return missingValue();
            opts.featurizePath = argv[++i];
        } else if (arg == "--owner") {
            if (!hasValue)
                return missingValue();
            opts.owner = parseNumber<core::OwnerId>(argv[++i]);
            if (!opts.owner)
                return core::makeError(core::ErrorCode::kInvalidArgument, "bad owner id");
        } else if (arg == "--ticks") {
            if (!hasValue)
                return missingValue();
            const auto ticks = parseNumber<core::u64>(argv[++i]);
            if (!ticks)
                return core::makeError(core::ErrorCode::kInvalidArgument, "bad tick count");
            opts.ticks = *ticks;
        } else if (arg == "--speed") {
            if (!hasValue)
                return missingValue();
            opts.speed = parseNumber<core::u32>(argv[++i]);
            if (!opts.speed)
                return core::makeError(core::ErrorCode::kInvalidArgument, "bad speed");
        } else if (arg == "--log-level") {
            if (!hasValue)
                return missingValue();
            opts.logLevel = core::parseLogLevel(argv[++i]);
            if (!opts.logLevel)
                return core::makeError(core::ErrorCode::kInvalidArgument, "bad log level");
        } else {
            return core::makeError(core::ErrorCode::kInvalidArgument, "unknown option " + std::string(arg));
        }
    }
    return opts;
}

std::string formatClock(core::Timestamp t)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld",
                  static_cast<long long>(t / 3600), static_cast<long long>((t / 60) % 60),
                  static_cast<long long>(t % 60));
    return buffer;
}

void render(const playback::Snapshot& snap, core::usize upper)
{
    const double progress = 100.0 * static_cast<double>(snap.cursor) / static_cast<double>(upper);
    std::printf("[%s] owner %lld  %-17s %5.1f%%  (%.0f%% of session)",
                formatClock(snap.t).c_str(), static_cast<long long>(snap.owner),
                std::string(model::stateDisplayName(snap.prediction.predicted)).c_str(),
                100.0 * snap.prediction.confidence(), progress);
    if (snap.label)
        std::printf("  actual: %s", snap.label->c_str());
    std::printf("\n  %s\n", snap.rationale.headline.c_str());
    for (const auto& bullet : snap.rationale.bullets)
        std::printf("    - %s\n", bullet.c_str());
}

void printReport(const model::EvaluationReport& report)
{
    const auto& m = report.matrix;
    std::printf("Evaluated rows: %zu (unlabelled %zu, unusable %zu)\n",
                report.rowsEvaluated, report.rowsUnlabelled, report.rowsUnusable);
    std::printf("Accuracy: %.4f  Kappa: %.4f\n\n", m.accuracy(), m.kappa());

    std::printf("%-18s", "actual \\ predicted");
    for (const auto p : model::kAllStates)
        std::printf(" %17s", std::string(model::stateDisplayName(p)).c_str());
    std::printf("\n");
    for (const auto a : model::kAllStates) {
        std::printf("%-18s", std::string(model::stateDisplayName(a)).c_str());
        for (const auto p : model::kAllStates)
            std::printf(" %17zu", m.count(a, p));
        std::printf("\n");
    }

    std::printf("\n%-18s %8s %11s %11s\n", "state", "support", "sensitivity", "specificity");
    for (const auto s : model::kAllStates) {
        std::printf("%-18s %8zu %11.4f %11.4f\n", std::string(model::stateDisplayName(s)).c_str(),
                    m.actualCount(s), m.sensitivity(s), m.specificity(s));
    }
}

int fail(const core::Error& error)
{
    core::Log::fatal(kTag, error.format());
    return 1;
}

} // namespace

int main(int argc, char* argv[])
{
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(argv[0]);
        return fail(opts.error());
    }
    if (opts->help) {
        printUsage(argv[0]);
        return 0;
    }
    if (!opts->configPath) {
        printUsage(argv[0]);
        return fail(core::Error(core::ErrorCode::kInvalidArgument, "--config is required"));
    }

    auto config = engine::ConfigLoader::fromFile(*opts->configPath);
    if (!config)
        return fail(config.error());

    core::Log::setMinLevel(opts->logLevel.value_or(config->logLevel()));

    if (config->inputPath().empty())
        return fail(core::Error(core::ErrorCode::kInvalidConfig, "'input' is not set"));

    series::CsvSeriesReader reader(config->layout());
    auto recording = reader.read(config->inputPath());
    if (!recording)
        return fail(recording.error());
    auto seriesSet = std::make_shared<const series::SeriesSet>(std::move(*recording));

    auto schema = feature::FeatureSchema::create(config->features());
    if (!schema)
        return fail(schema.error());
    auto schemaPtr = std::make_shared<const feature::FeatureSchema>(std::move(*schema));

    if (opts->featurizePath) {
        if (auto bound = schemaPtr->validateChannels(seriesSet->channels()); !bound)
            return fail(bound.error());

        const feature::WindowedFeatureExtractor extractor(schemaPtr);
        auto tables = extractor.extractAll(*seriesSet, config->shortSeriesPolicy());
        if (!tables)
            return fail(tables.error());

        auto written = feature::FeatureTableWriter::write(*opts->featurizePath, *tables);
        if (!written)
            return fail(written.error());
        return 0;
    }

    if (config->modelPath().empty())
        return fail(core::Error(core::ErrorCode::kInvalidConfig, "'model' is not set"));

    auto classifier = model::ModelArtifact::load(config->modelPath());
    if (!classifier)
        return fail(classifier.error());

    auto pipeline = playback::InferencePipeline::create(
        seriesSet, schemaPtr, config->shortSeriesPolicy(), *classifier, config->rules());
    if (!pipeline)
        return fail(pipeline.error());

    if (opts->evaluate) {
        auto report = model::evaluate((*pipeline)->classifier(), (*pipeline)->tables());
        if (!report)
            return fail(report.error());
        printReport(*report);
        return 0;
    }

    const auto owners = (*pipeline)->owners();
    const core::OwnerId owner = opts->owner.value_or(config->playbackOwner().value_or(owners.front()));

    auto session = playback::PlaybackSession::create(*pipeline, owner, config->durationBound(), config->speeds());
    if (!session)
        return fail(session.error());

    if (opts->speed)
        session->setSpeed(*opts->speed);

    const auto upper = session->bounds().upper;
    if (session->latest())
        render(*session->latest(), upper);

    playback::TickTimer timer(config->tickPeriod(), opts->realtime);
    session->onTick([&](const playback::Snapshot& snap) { render(snap, upper); });
    session->onStateChange([](playback::PlaybackState from, playback::PlaybackState to) {
        core::Log::debug(kTag, std::string(playback::playbackStateName(from)) + " -> "
            + std::string(playback::playbackStateName(to)));
    });

    core::Log::info(kTag, "replaying owner " + std::to_string(owner) + " at speed "
        + std::to_string(session->speed()) + "x");

    session->start();
    timer.run([&]() {
        session->onTimer();
        if (opts->ticks > 0 && timer.tickCount() >= opts->ticks)
            timer.requestStop();
    });

    return 0;
}
