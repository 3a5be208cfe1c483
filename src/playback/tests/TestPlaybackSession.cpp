/**
 * @file TestPlaybackSession.cpp
 * @brief Unit tests for playback::InferencePipeline and playback::PlaybackSession.
 */

#include <catch2/catch_test_macros.hpp>

#include "cbb/playback/PlaybackSession.hpp"

#include <cmath>
#include <limits>

namespace cbb::playback {

using model::CognitiveState;

namespace {

/// HighLoad when the first feature exceeds 3.5, Optimal otherwise.
class PupilClassifier final : public model::IStateClassifier {
public:
    explicit PupilClassifier(std::vector<std::string> names) : _schema{std::move(names)} {}

    const model::ModelSchema &schema() const noexcept override { return _schema; }

    model::Prediction predict(std::span<const double> features) const override
    {
        const bool high = features[0] > 3.5;
        return model::Prediction::fromProbabilities(
            high ? std::array<double, model::kStateCount>{0.2, 0.6, 0.1, 0.1}
                 : std::array<double, model::kStateCount>{0.7, 0.1, 0.1, 0.1});
    }

    Eigen::MatrixXd predictBatch(const Eigen::MatrixXd &rows) const override
    {
        Eigen::MatrixXd out(rows.rows(), static_cast<Eigen::Index>(model::kStateCount));
        for (Eigen::Index r = 0; r < rows.rows(); ++r) {
            std::vector<double> x(static_cast<std::size_t>(rows.cols()));
            for (Eigen::Index c = 0; c < rows.cols(); ++c)
                x[static_cast<std::size_t>(c)] = rows(r, c);
            const auto p = predict(x);
            for (std::size_t k = 0; k < model::kStateCount; ++k)
                out(r, static_cast<Eigen::Index>(k)) = p.probabilities[k];
        }
        return out;
    }

    std::string_view name() const noexcept override { return "pupil-threshold"; }

private:
    model::ModelSchema _schema;
};

const std::vector<std::string> kFeatureNames = {
    "pupil_mean_3", "pupil_sd_3", "pupil_lag_2", "pupil_delta_3", "grip_mean_2",
};

std::shared_ptr<const feature::FeatureSchema> makeSchema()
{
    using feature::AggregationKind;
    return std::make_shared<const feature::FeatureSchema>(*feature::FeatureSchema::create({
        {"pupil_mean_3", "pupil", AggregationKind::kMean, 3},
        {"pupil_sd_3", "pupil", AggregationKind::kStdDev, 3},
        {"pupil_lag_2", "pupil", AggregationKind::kLag, 2},
        {"pupil_delta_3", "pupil", AggregationKind::kDelta, 3},
        {"grip_mean_2", "grip", AggregationKind::kMean, 2},
    }));
}

explain::RuleTable makeRules()
{
    explain::RuleTable rules;
    rules.set(CognitiveState::kOptimal, {"Stable.", {{"pupil", std::nullopt, "Pupil {value} mm", 2}}});
    rules.set(CognitiveState::kHighLoad, {"Elevated demand:", {{"pupil_mean_3", std::nullopt, "Tonic {value} mm", 2}}});
    rules.set(CognitiveState::kFatigued, {"Fatigue:", {}});
    rules.set(CognitiveState::kAttentionalLapse, {"ALERT", {}});
    return rules;
}

series::OwnerSeries makeOwner(const std::shared_ptr<const std::vector<std::string>> &channels,
                              core::OwnerId owner, core::usize n, double pupilSlope, bool gripMissing = false)
{
    std::vector<series::Sample> samples;
    for (core::usize i = 1; i <= n; ++i) {
        const double pupil = 3.0 + pupilSlope * static_cast<double>(i);
        const double grip = gripMissing ? std::numeric_limits<double>::quiet_NaN()
                                        : 20.0 + static_cast<double>(i % 4);
        std::optional<std::string> label;
        if (owner == 1)
            label = i > 15 ? "HighLoad" : "Optimal";
        samples.push_back({static_cast<core::Timestamp>(i * 10), {pupil, grip}, label});
    }
    return *series::OwnerSeries::create(owner, channels, std::move(samples));
}

/// Owner 1: 30 rising samples, owner 2: 12 flat samples, owner 4: grip never recorded.
std::shared_ptr<const series::SeriesSet> makeRecording(bool withShortOwner = false)
{
    auto channels = std::make_shared<const std::vector<std::string>>(std::vector<std::string>{"pupil", "grip"});
    auto recording = std::make_shared<series::SeriesSet>(channels);
    REQUIRE(recording->add(makeOwner(channels, 1, 30, 0.05)).has_value());
    REQUIRE(recording->add(makeOwner(channels, 2, 12, 0.0)).has_value());
    REQUIRE(recording->add(makeOwner(channels, 4, 10, 0.0, true)).has_value());
    if (withShortOwner)
        REQUIRE(recording->add(makeOwner(channels, 3, 3, 0.0)).has_value());
    return recording;
}

std::shared_ptr<const InferencePipeline> makePipeline()
{
    auto pipeline = InferencePipeline::create(makeRecording(), makeSchema(), feature::ShortSeriesPolicy::kFail,
                                              std::make_shared<const PupilClassifier>(kFeatureNames), makeRules());
    REQUIRE(pipeline.has_value());
    return *pipeline;
}

core::ErrorCode createError(std::shared_ptr<const series::SeriesSet> recording,
                            std::shared_ptr<const model::IStateClassifier> classifier,
                            explain::RuleTable rules,
                            feature::ShortSeriesPolicy policy = feature::ShortSeriesPolicy::kFail)
{
    const auto pipeline = InferencePipeline::create(std::move(recording), makeSchema(), policy,
                                                    std::move(classifier), std::move(rules));
    REQUIRE_FALSE(pipeline.has_value());
    return pipeline.error().code();
}

} // namespace

TEST_CASE("InferencePipeline rejects inconsistent configurations", "[playback][pipeline]")
{
    const auto classifier = std::make_shared<const PupilClassifier>(kFeatureNames);

    SECTION("classifier trained on fewer features")
    {
        const auto narrow = std::make_shared<const PupilClassifier>(
            std::vector<std::string>(kFeatureNames.begin(), kFeatureNames.begin() + 4));
        REQUIRE(createError(makeRecording(), narrow, makeRules()) == core::ErrorCode::kSchemaMismatch);
    }

    SECTION("pipeline producing fewer features than the classifier declares")
    {
        using feature::AggregationKind;
        const auto fourFeatures = std::make_shared<const feature::FeatureSchema>(*feature::FeatureSchema::create({
            {"pupil_mean_3", "pupil", AggregationKind::kMean, 3},
            {"pupil_sd_3", "pupil", AggregationKind::kStdDev, 3},
            {"pupil_lag_2", "pupil", AggregationKind::kLag, 2},
            {"pupil_delta_3", "pupil", AggregationKind::kDelta, 3},
        }));
        const auto pipeline = InferencePipeline::create(makeRecording(), fourFeatures,
                                                        feature::ShortSeriesPolicy::kFail, classifier, makeRules());
        REQUIRE_FALSE(pipeline.has_value());
        REQUIRE(pipeline.error().code() == core::ErrorCode::kSchemaMismatch);
    }

    SECTION("schema mismatch is reported before rule errors")
    {
        const auto reordered = std::make_shared<const PupilClassifier>(std::vector<std::string>{
            "pupil_sd_3", "pupil_mean_3", "pupil_lag_2", "pupil_delta_3", "grip_mean_2"});
        REQUIRE(createError(makeRecording(), reordered, explain::RuleTable{}) == core::ErrorCode::kSchemaMismatch);
    }

    SECTION("rule referencing an unknown source")
    {
        auto rules = makeRules();
        rules.rules(CognitiveState::kFatigued).bullets.push_back({"heart_rate", std::nullopt, "{value}", 1});
        REQUIRE(createError(makeRecording(), classifier, rules) == core::ErrorCode::kInvalidRuleTable);
    }

    SECTION("recording without a feature channel")
    {
        auto channels = std::make_shared<const std::vector<std::string>>(std::vector<std::string>{"pupil"});
        auto recording = std::make_shared<series::SeriesSet>(channels);
        REQUIRE(recording->add(*series::OwnerSeries::create(1, channels, {{1, {3.0}, std::nullopt}})).has_value());
        REQUIRE(createError(recording, classifier, makeRules()) == core::ErrorCode::kInvalidFeatureSpec);
    }

    SECTION("short owner under the fail policy")
    {
        REQUIRE(createError(makeRecording(true), classifier, makeRules()) == core::ErrorCode::kWindowExceedsSeries);
    }
}

TEST_CASE("InferencePipeline excludes short owners on request", "[playback][pipeline]")
{
    const auto pipeline = InferencePipeline::create(makeRecording(true), makeSchema(),
                                                    feature::ShortSeriesPolicy::kExclude,
                                                    std::make_shared<const PupilClassifier>(kFeatureNames),
                                                    makeRules());
    REQUIRE(pipeline.has_value());
    REQUIRE((*pipeline)->owners() == std::vector<core::OwnerId>{1, 2, 4});
    REQUIRE((*pipeline)->table(3) == nullptr);
}

TEST_CASE("InferencePipeline snapshots are consistent and idempotent", "[playback][pipeline]")
{
    const auto pipeline = makePipeline();
    const auto table = pipeline->table(1);
    REQUIRE(table);

    for (core::usize cursor : {1u, 5u, 16u, 30u}) {
        const auto snap = pipeline->snapshot(1, cursor);
        REQUIRE(snap.has_value());

        const core::usize row = cursor - 1;
        REQUIRE(snap->owner == 1);
        REQUIRE(snap->cursor == cursor);
        REQUIRE(snap->t == table->timestamp(row));
        REQUIRE(snap->features == table->vectorAt(row));
        REQUIRE(snap->prediction == pipeline->classifier().predict(snap->features.values()));
        REQUIRE(snap->raw.size() == 2);
        REQUIRE(snap->label == table->label(row));

        REQUIRE(*pipeline->snapshot(1, cursor) == *snap);
    }

    SECTION("a masked raw channel does not break equality")
    {
        auto snap = *pipeline->snapshot(1, 5);
        snap.raw[1] = std::numeric_limits<double>::quiet_NaN();
        const Snapshot copy = snap;
        REQUIRE(copy == snap);

        auto other = snap;
        other.raw[1] = 21.0;
        REQUIRE_FALSE(other == snap);
    }

    SECTION("prediction follows the rising pupil")
    {
        // mean of 3.05, 3.10, 3.15
        const auto early = *pipeline->snapshot(1, 3);
        REQUIRE(early.prediction.predicted == CognitiveState::kOptimal);
        REQUIRE(early.rationale.headline == "Stable.");
        REQUIRE(early.rationale.bullets == std::vector<std::string>{"Pupil 3.15 mm"});

        const auto late = *pipeline->snapshot(1, 30);
        REQUIRE(late.prediction.predicted == CognitiveState::kHighLoad);
        REQUIRE(late.rationale.headline == "Elevated demand:");
        REQUIRE(late.rationale.bullets == std::vector<std::string>{"Tonic 4.45 mm"});
        REQUIRE(late.label == std::optional<std::string>("HighLoad"));
    }
}

TEST_CASE("InferencePipeline snapshot errors", "[playback][pipeline]")
{
    const auto pipeline = makePipeline();

    REQUIRE(pipeline->snapshot(99, 1).error().code() == core::ErrorCode::kNotFound);
    REQUIRE(pipeline->snapshot(2, 0).error().code() == core::ErrorCode::kOutOfRange);
    REQUIRE(pipeline->snapshot(2, 13).error().code() == core::ErrorCode::kOutOfRange);
    REQUIRE(pipeline->snapshot(2, 12).has_value());
    REQUIRE(pipeline->snapshot(4, 5).error().code() == core::ErrorCode::kRowUnusable);
}

TEST_CASE("PlaybackSession bounds the cursor by the shorter limit", "[playback][session]")
{
    const auto pipeline = makePipeline();

    const auto shortBound = PlaybackSession::create(pipeline, 1, 10);
    REQUIRE(shortBound.has_value());
    REQUIRE(shortBound->bounds().upper == 10);

    const auto longBound = PlaybackSession::create(pipeline, 1, 1000);
    REQUIRE(longBound.has_value());
    REQUIRE(longBound->bounds().upper == 30);
    REQUIRE(longBound->latest().has_value());
    REQUIRE(longBound->latest()->cursor == 1);

    const auto missing = PlaybackSession::create(pipeline, 99, 10);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code() == core::ErrorCode::kNotFound);
}

TEST_CASE("PlaybackSession pushes a snapshot per tick", "[playback][session]")
{
    const auto pipeline = makePipeline();
    auto session = PlaybackSession::create(pipeline, 1, 1000);
    REQUIRE(session.has_value());

    std::vector<Snapshot> received;
    session->onTick([&](const Snapshot &snap) { received.push_back(snap); });

    std::vector<PlaybackState> states;
    session->onStateChange([&](PlaybackState, PlaybackState to) { states.push_back(to); });

    SECTION("only while running")
    {
        session->onTimer();
        REQUIRE(received.empty());

        session->start();
        session->onTimer();
        REQUIRE(received.size() == 1);
        REQUIRE(received[0] == *session->getSnapshot(2));
        REQUIRE(*session->latest() == received[0]);

        session->pause();
        session->onTimer();
        REQUIRE(received.size() == 1);
        REQUIRE(session->currentCursor() == 2);
        REQUIRE(states == std::vector<PlaybackState>{PlaybackState::kRunning, PlaybackState::kPaused});
    }

    SECTION("speed, seek and wrap")
    {
        session->setSpeed(10);
        session->seek(9);
        REQUIRE(session->latest()->cursor == 9);

        session->start();
        session->onTimer();
        session->onTimer();
        session->onTimer();

        REQUIRE(received.size() == 3);
        REQUIRE(received[0].cursor == 19);
        REQUIRE(received[1].cursor == 29);
        REQUIRE(received[2].cursor == 1);

        session->reset();
        REQUIRE(session->state() == PlaybackState::kIdle);
        REQUIRE(session->currentCursor() == 1);
        REQUIRE(session->speed() == 10);
    }
}

TEST_CASE("PlaybackSession pushes on every tick when the speed exceeds the bound", "[playback][session]")
{
    const auto pipeline = makePipeline();
    auto session = PlaybackSession::create(pipeline, 1, 5);
    REQUIRE(session.has_value());

    std::vector<core::usize> cursors;
    session->onTick([&](const Snapshot &snap) { cursors.push_back(snap.cursor); });

    session->setSpeed(10);
    session->start();
    session->onTimer();
    session->onTimer();
    session->onTimer();

    REQUIRE(cursors == std::vector<core::usize>{1, 1, 1});
    REQUIRE(session->currentCursor() == 1);
}

TEST_CASE("PlaybackSession keeps the last valid snapshot", "[playback][session]")
{
    const auto pipeline = makePipeline();
    auto session = PlaybackSession::create(pipeline, 4, 10);
    REQUIRE(session.has_value());
    REQUIRE_FALSE(session->latest().has_value());

    int calls = 0;
    session->onTick([&](const Snapshot &) { ++calls; });
    session->start();
    session->onTimer();

    REQUIRE(session->currentCursor() == 2);
    REQUIRE(calls == 0);
    REQUIRE_FALSE(session->latest().has_value());
}

TEST_CASE("Sessions on one pipeline are independent", "[playback][session]")
{
    const auto pipeline = makePipeline();
    auto first = PlaybackSession::create(pipeline, 1, 1000);
    auto second = PlaybackSession::create(pipeline, 1, 1000);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    first->start();
    first->onTimer();
    first->onTimer();

    REQUIRE(first->currentCursor() == 3);
    REQUIRE(second->currentCursor() == 1);
    REQUIRE(second->state() == PlaybackState::kIdle);
}

} // namespace cbb::playback
