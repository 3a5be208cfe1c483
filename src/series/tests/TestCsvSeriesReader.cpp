/**
 * @file TestCsvSeriesReader.cpp
 * @brief Unit tests for series::CsvSeriesReader.
 */

#include <catch2/catch_test_macros.hpp>

#include "cbb/series/CsvSeriesReader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cbb::series {

namespace {

class TempCsvFile {
public:
    TempCsvFile(const std::string &name, const std::string &content)
        : _path(std::filesystem::temp_directory_path() / ("cbb_series_" + name + ".csv"))
    {
        std::ofstream ofs(_path);
        ofs << content;
    }

    ~TempCsvFile() { std::filesystem::remove(_path); }

    [[nodiscard]] std::string path() const { return _path.string(); }

private:
    std::filesystem::path _path;
};

CsvSeriesLayout twoChannelLayout()
{
    CsvSeriesLayout layout;
    layout.channels = {
        {"pupil_diameter_mm", ChannelRange{1.0, 10.0}},
        {"grip_force_newtons", std::nullopt},
    };
    return layout;
}

} // namespace

TEST_CASE("CsvSeriesReader groups rows per owner in timestamp order", "[series][csv]")
{
    TempCsvFile csv("grouped",
        "timestamp,surgeon_id,pupil_diameter_mm,grip_force_newtons,cognitive_state\n"
        "2,1,4.5,20.0,Optimal\n"
        "1,1,4.0,21.0,Optimal\n"
        "1,2,5.0,30.0,HighLoad\n"
        "3,1,4.2,22.0,Fatigued\n");

    CsvSeriesReader reader(twoChannelLayout());
    auto result = reader.read(csv.path());
    REQUIRE(result.has_value());

    const auto &set = *result;
    REQUIRE(set.size() == 2);
    REQUIRE(set.totalSamples() == 4);
    REQUIRE(set.owners() == std::vector<core::OwnerId>{1, 2});

    const auto first = set.find(1);
    REQUIRE(first);
    REQUIRE(first->size() == 3);
    REQUIRE(first->at(0).t == 1);
    REQUIRE(first->at(1).t == 2);
    REQUIRE(first->at(2).t == 3);
    REQUIRE(first->at(0).values[0] == 4.0);
    REQUIRE(first->at(2).label == "Fatigued");
    REQUIRE(first->hasLabels());
    REQUIRE(reader.report().labelled);
}

TEST_CASE("CsvSeriesReader fails on a missing required column", "[series][csv]")
{
    std::istringstream in("timestamp,surgeon_id,pupil_diameter_mm\n1,1,4.0\n");

    CsvSeriesReader reader(twoChannelLayout());
    const auto result = reader.parse(in, "memory");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kMissingColumn);
}

TEST_CASE("CsvSeriesReader rejects a missing file and an empty input", "[series][csv]")
{
    CsvSeriesReader reader(twoChannelLayout());

    SECTION("missing file")
    {
        const auto result = reader.read("/nonexistent/recording.csv");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kFileNotFound);
    }

    SECTION("header only")
    {
        std::istringstream in("timestamp,surgeon_id,pupil_diameter_mm,grip_force_newtons\n");
        const auto result = reader.parse(in, "memory");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kEmptyInput);
    }

    SECTION("nothing at all")
    {
        std::istringstream in("# comment only\n\n");
        const auto result = reader.parse(in, "memory");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kEmptyInput);
    }
}

TEST_CASE("CsvSeriesReader excludes malformed rows and keeps the rest", "[series][csv]")
{
    std::istringstream in(
        "timestamp,surgeon_id,pupil_diameter_mm,grip_force_newtons\n"
        "1,1,4.0,20.0\n"
        "2,1\n"
        "abc,1,4.0,20.0\n"
        "1e30,1,4.0,20.0\n"
        "4,-1e30,4.0,20.0\n"
        "3,1,4.1,20.5\n");

    CsvSeriesReader reader(twoChannelLayout());
    const auto result = reader.parse(in, "memory");
    REQUIRE(result.has_value());

    REQUIRE(reader.report().rowsRead == 6);
    REQUIRE(reader.report().rowsExcluded == 4);
    REQUIRE(result->find(1)->size() == 2);
}

TEST_CASE("CsvSeriesReader masks invalid and out-of-range values", "[series][csv]")
{
    std::istringstream in(
        "timestamp,surgeon_id,pupil_diameter_mm,grip_force_newtons\n"
        "1,1,0.5,NA\n"
        "2,1,oops,\n"
        "3,1,4.0,250.0\n");

    CsvSeriesReader reader(twoChannelLayout());
    const auto result = reader.parse(in, "memory");
    REQUIRE(result.has_value());

    const auto owner = result->find(1);
    REQUIRE(std::isnan(owner->at(0).values[0]));
    REQUIRE(std::isnan(owner->at(0).values[1]));
    REQUIRE(std::isnan(owner->at(1).values[0]));
    REQUIRE(std::isnan(owner->at(1).values[1]));
    REQUIRE(owner->at(2).values[0] == 4.0);
    // grip has no range, so a large value is kept.
    REQUIRE(owner->at(2).values[1] == 250.0);

    REQUIRE(reader.report().valuesMasked == 2);
    REQUIRE_FALSE(reader.report().labelled);
}

TEST_CASE("CsvSeriesReader keeps the first row of a duplicated timestamp", "[series][csv]")
{
    std::istringstream in(
        "timestamp,surgeon_id,pupil_diameter_mm,grip_force_newtons\n"
        "1,1,4.0,20.0\n"
        "1,1,9.0,90.0\n"
        "2,1,4.1,20.1\n");

    CsvSeriesReader reader(twoChannelLayout());
    const auto result = reader.parse(in, "memory");
    REQUIRE(result.has_value());

    const auto owner = result->find(1);
    REQUIRE(owner->size() == 2);
    REQUIRE(owner->at(0).values[0] == 4.0);
    REQUIRE(reader.report().duplicatesDropped == 1);
}

TEST_CASE("CsvSeriesReader accepts integral columns written as reals", "[series][csv]")
{
    std::istringstream in(
        "\"surgeon_id\",\"timestamp\",\"pupil_diameter_mm\",\"grip_force_newtons\"\n"
        "7.0,1.0,4.0,20.0\n");

    CsvSeriesReader reader(twoChannelLayout());
    const auto result = reader.parse(in, "memory");
    REQUIRE(result.has_value());
    REQUIRE(result->find(7));
}

TEST_CASE("splitCsvLine trims blanks and quotes", "[series][csv]")
{
    const auto fields = splitCsvLine(" a , \"b,c\" ,d\r");

    REQUIRE(fields.size() == 3);
    REQUIRE(fields[0] == "a");
    REQUIRE(fields[1] == "b,c");
    REQUIRE(fields[2] == "d");
}

TEST_CASE("OwnerSeries enforces strictly increasing timestamps", "[series]")
{
    auto channels = std::make_shared<const std::vector<std::string>>(std::vector<std::string>{"x"});

    SECTION("sorted input is accepted")
    {
        auto result = OwnerSeries::create(1, channels, {{1, {1.0}, {}}, {2, {2.0}, {}}});
        REQUIRE(result.has_value());
        REQUIRE(result->rowOf(2) == 1u);
        REQUIRE_FALSE(result->rowOf(3).has_value());
    }

    SECTION("a repeated timestamp is rejected")
    {
        const auto result = OwnerSeries::create(1, channels, {{1, {1.0}, {}}, {1, {2.0}, {}}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("a wrong value count is rejected")
    {
        const auto result = OwnerSeries::create(1, channels, {{1, {1.0, 2.0}, {}}});
        REQUIRE_FALSE(result.has_value());
    }
}

TEST_CASE("SeriesSet refuses a duplicate owner", "[series]")
{
    auto channels = std::make_shared<const std::vector<std::string>>(std::vector<std::string>{"x"});
    SeriesSet set(channels);

    REQUIRE(set.add(*OwnerSeries::create(1, channels, {{1, {1.0}, {}}})).has_value());
    const auto again = set.add(*OwnerSeries::create(1, channels, {{5, {1.0}, {}}}));

    REQUIRE_FALSE(again.has_value());
    REQUIRE(set.size() == 1);
    REQUIRE(set.find(2) == nullptr);
}

} // namespace cbb::series
