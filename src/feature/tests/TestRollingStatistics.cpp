/**
 * @file TestRollingStatistics.cpp
 * @brief Unit tests for feature::RollingStatistics.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "cbb/feature/RollingStatistics.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace cbb::feature {

using Catch::Matchers::WithinAbs;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

TEST_CASE("RollingStatistics::mean averages the trailing window", "[feature][statistics]")
{
    const std::vector<double> column = {1.0, 2.0, 3.0, 4.0, 5.0};

    SECTION("full window")
    {
        REQUIRE_THAT(*RollingStatistics::mean(column, 4, 5), WithinAbs(3.0, 1e-12));
    }

    SECTION("trailing part only")
    {
        REQUIRE_THAT(*RollingStatistics::mean(column, 4, 2), WithinAbs(4.5, 1e-12));
        REQUIRE_THAT(*RollingStatistics::mean(column, 2, 3), WithinAbs(2.0, 1e-12));
    }

    SECTION("window reaching before the first row is undefined")
    {
        REQUIRE_FALSE(RollingStatistics::mean(column, 3, 5).has_value());
    }

    SECTION("end past the column is undefined")
    {
        REQUIRE_FALSE(RollingStatistics::mean(column, 5, 1).has_value());
    }
}

TEST_CASE("RollingStatistics::sampleStdDev uses the n - 1 estimator", "[feature][statistics]")
{
    const std::vector<double> column = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};

    REQUIRE_THAT(*RollingStatistics::sampleStdDev(column, 7, 8), WithinAbs(std::sqrt(32.0 / 7.0), 1e-12));

    SECTION("window of one is undefined")
    {
        REQUIRE_FALSE(RollingStatistics::sampleStdDev(column, 7, 1).has_value());
    }
}

TEST_CASE("RollingStatistics is exact on a constant channel", "[feature][statistics]")
{
    for (const double c : {0.1, 3.7, 4.23}) {
        const std::vector<double> flat(40, c);
        for (const std::size_t w : {std::size_t{10}, std::size_t{15}, std::size_t{30}}) {
            CAPTURE(c, w);
            REQUIRE(*RollingStatistics::mean(flat, 39, w) == c);
            REQUIRE(*RollingStatistics::sampleStdDev(flat, 39, w) == 0.0);
            REQUIRE(*RollingStatistics::delta(flat, 39, w) == 0.0);
        }
    }
}

TEST_CASE("RollingStatistics::lag reads k rows back", "[feature][statistics]")
{
    const std::vector<double> column = {10.0, 11.0, 12.0, 13.0};

    REQUIRE(*RollingStatistics::lag(column, 3, 2) == 11.0);
    REQUIRE(*RollingStatistics::lag(column, 3, 0) == 13.0);
    REQUIRE_FALSE(RollingStatistics::lag(column, 1, 2).has_value());
}

TEST_CASE("RollingStatistics::delta compares to the preceding window mean", "[feature][statistics]")
{
    const std::vector<double> column = {1.0, 2.0, 3.0, 10.0};

    // 10 - mean(1, 2, 3)
    REQUIRE_THAT(*RollingStatistics::delta(column, 3, 3), WithinAbs(8.0, 1e-12));
    REQUIRE_FALSE(RollingStatistics::delta(column, 2, 3).has_value());
    REQUIRE_FALSE(RollingStatistics::delta(column, 0, 1).has_value());
}

TEST_CASE("RollingStatistics is undefined on a window holding a missing value", "[feature][statistics]")
{
    const std::vector<double> column = {1.0, kNaN, 3.0, 4.0, 5.0};

    REQUIRE_FALSE(RollingStatistics::mean(column, 2, 3).has_value());
    REQUIRE(RollingStatistics::mean(column, 4, 3).has_value());
    REQUIRE_FALSE(RollingStatistics::lag(column, 3, 2).has_value());
    REQUIRE_FALSE(RollingStatistics::delta(column, 1, 1).has_value());
    REQUIRE_FALSE(RollingStatistics::evaluate(AggregationKind::kStdDev, column, 3, 3).has_value());
}

} // namespace cbb::feature
