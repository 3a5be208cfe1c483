/**
 * @file TestFeatureSchema.cpp
 * @brief Unit tests for feature::FeatureSchema.
 */

#include <catch2/catch_test_macros.hpp>

#include "cbb/feature/FeatureSchema.hpp"

namespace cbb::feature {

TEST_CASE("warmup depends on the aggregation kind", "[feature][schema]")
{
    REQUIRE(warmup({"a", "x", AggregationKind::kMean, 30}) == 30);
    REQUIRE(warmup({"b", "x", AggregationKind::kStdDev, 15}) == 15);
    REQUIRE(warmup({"c", "x", AggregationKind::kLag, 5}) == 6);
    REQUIRE(warmup({"d", "x", AggregationKind::kDelta, 5}) == 6);
}

TEST_CASE("parseAggregationKind round-trips the names", "[feature][schema]")
{
    for (const auto kind : {AggregationKind::kMean, AggregationKind::kStdDev,
                            AggregationKind::kLag, AggregationKind::kDelta}) {
        REQUIRE(parseAggregationKind(aggregationKindName(kind)) == kind);
    }
    REQUIRE(parseAggregationKind("sd") == AggregationKind::kStdDev);
    REQUIRE_FALSE(parseAggregationKind("median").has_value());
}

TEST_CASE("FeatureSchema keeps declaration order", "[feature][schema]")
{
    auto schema = FeatureSchema::create({
        {"tonic", "pupil", AggregationKind::kMean, 30},
        {"phasic", "pupil", AggregationKind::kDelta, 5},
        {"grip_sd", "grip", AggregationKind::kStdDev, 15},
    });
    REQUIRE(schema.has_value());

    REQUIRE(schema->size() == 3);
    REQUIRE(schema->names() == std::vector<std::string>{"tonic", "phasic", "grip_sd"});
    REQUIRE(schema->indexOf("phasic") == 1u);
    REQUIRE_FALSE(schema->indexOf("missing").has_value());
    REQUIRE(schema->maxWarmup() == 30);

    REQUIRE(schema->validateChannels({"pupil", "grip"}).has_value());

    const auto unbound = schema->validateChannels({"pupil"});
    REQUIRE_FALSE(unbound.has_value());
    REQUIRE(unbound.error().code() == core::ErrorCode::kInvalidFeatureSpec);
}

TEST_CASE("FeatureSchema rejects invalid feature lists", "[feature][schema]")
{
    const auto rejects = [](std::vector<FeatureSpec> specs) {
        const auto result = FeatureSchema::create(std::move(specs));
        return !result.has_value() && result.error().code() == core::ErrorCode::kInvalidFeatureSpec;
    };

    REQUIRE(rejects({}));
    REQUIRE(rejects({{"", "x", AggregationKind::kMean, 3}}));
    REQUIRE(rejects({{"a", "", AggregationKind::kMean, 3}}));
    REQUIRE(rejects({{"a", "x", AggregationKind::kMean, 0}}));
    REQUIRE(rejects({{"a", "x", AggregationKind::kStdDev, 1}}));
    REQUIRE(rejects({{"a", "x", AggregationKind::kMean, 3}, {"a", "y", AggregationKind::kLag, 1}}));
}

} // namespace cbb::feature
