/**
 * @file CsvSeriesReader.cpp
 * @brief Implementation of the CSV recording loader.
 * @author MasterLaplace
 */

#include "cbb/series/CsvSeriesReader.hpp"

#include "cbb/core/Log.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>

namespace cbb::series {

namespace {

constexpr std::string_view kTag = "series";

std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s.remove_prefix(1);
        s.remove_suffix(1);
    }
    return s;
}

bool isMissingToken(std::string_view s) noexcept
{
    return s.empty() || s == "NA" || s == "NaN" || s == "nan";
}

std::optional<double> parseDouble(std::string_view s) noexcept
{
    double value = 0.0;
    const auto *end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value))
        return std::nullopt;
    return value;
}

std::optional<core::i64> parseInteger(std::string_view s) noexcept
{
    core::i64 value = 0;
    const auto *end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec == std::errc{} && ptr == end)
        return value;

    // Exporters sometimes write integral columns as "12.0".
    // -2^63 converts exactly; anything at or past +2^63 does not fit.
    constexpr double kLowest = static_cast<double>(std::numeric_limits<core::i64>::min());
    const auto asDouble = parseDouble(s);
    if (asDouble && std::trunc(*asDouble) == *asDouble && *asDouble >= kLowest && *asDouble < -kLowest)
        return static_cast<core::i64>(*asDouble);
    return std::nullopt;
}

std::optional<std::size_t> findColumn(const std::vector<std::string> &header, std::string_view name)
{
    const auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end())
        return std::nullopt;
    return static_cast<std::size_t>(it - header.begin());
}

} // namespace

std::vector<std::string> splitCsvLine(std::string_view line)
{
    std::vector<std::string> fields;
    std::size_t begin = 0;
    bool quoted = false;

    for (std::size_t i = 0; i <= line.size(); ++i) {
        if (i < line.size() && line[i] == '"') {
            quoted = !quoted;
            continue;
        }
        if (i == line.size() || (line[i] == ',' && !quoted)) {
            fields.emplace_back(trim(line.substr(begin, i - begin)));
            begin = i + 1;
        }
    }
    return fields;
}

CsvSeriesReader::CsvSeriesReader(CsvSeriesLayout layout)
    : _layout(std::move(layout))
{
}

core::Expected<SeriesSet> CsvSeriesReader::read(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return core::makeError(core::ErrorCode::kFileNotFound, path);
    }
    return parse(file, path);
}

core::Expected<SeriesSet> CsvSeriesReader::parse(std::istream &in, std::string_view sourceName)
{
    _report = CsvReadReport{};
    const std::string source(sourceName);

    if (_layout.channels.empty()) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "no channel declared for " + source);
    }

    std::string line;
    std::vector<std::string> header;
    while (std::getline(in, line)) {
        if (trim(line).empty() || line[0] == '#')
            continue;
        header = splitCsvLine(line);
        break;
    }
    if (header.empty()) {
        return core::makeError(core::ErrorCode::kEmptyInput, "CSV file is empty: " + source);
    }

    const auto ownerCol = findColumn(header, _layout.ownerColumn);
    if (!ownerCol) {
        return core::makeError(core::ErrorCode::kMissingColumn,
            "column '" + _layout.ownerColumn + "' not found in " + source);
    }
    const auto timeCol = findColumn(header, _layout.timeColumn);
    if (!timeCol) {
        return core::makeError(core::ErrorCode::kMissingColumn,
            "column '" + _layout.timeColumn + "' not found in " + source);
    }

    std::vector<std::size_t> channelCols;
    auto channelNames = std::make_shared<std::vector<std::string>>();
    for (const auto &channel : _layout.channels) {
        const auto col = findColumn(header, channel.name);
        if (!col) {
            return core::makeError(core::ErrorCode::kMissingColumn,
                "channel column '" + channel.name + "' not found in " + source);
        }
        channelCols.push_back(*col);
        channelNames->push_back(channel.name);
    }

    std::optional<std::size_t> labelCol;
    if (_layout.labelColumn) {
        labelCol = findColumn(header, *_layout.labelColumn);
        if (!labelCol) {
            core::Log::info(kTag, "no '" + *_layout.labelColumn + "' column in " + source
                + ", recording is unlabelled");
        }
    }
    _report.labelled = labelCol.has_value();

    std::size_t required = std::max(*ownerCol, *timeCol);
    for (const auto col : channelCols)
        required = std::max(required, col);

    std::map<core::OwnerId, std::vector<Sample>> grouped;
    std::size_t lineNo = 1;

    while (std::getline(in, line)) {
        ++lineNo;
        if (trim(line).empty() || line[0] == '#')
            continue;
        ++_report.rowsRead;

        const auto fields = splitCsvLine(line);
        if (fields.size() <= required) {
            ++_report.rowsExcluded;
            core::Log::warn(kTag, source + ":" + std::to_string(lineNo) + ": expected "
                + std::to_string(header.size()) + " fields, got " + std::to_string(fields.size())
                + ", row excluded");
            continue;
        }

        const auto owner = parseInteger(fields[*ownerCol]);
        const auto t = parseInteger(fields[*timeCol]);
        if (!owner || !t) {
            ++_report.rowsExcluded;
            core::Log::warn(kTag, source + ":" + std::to_string(lineNo)
                + ": unparsable owner or timestamp, row excluded");
            continue;
        }

        Sample sample;
        sample.t = *t;
        sample.values.reserve(channelCols.size());

        for (std::size_t c = 0; c < channelCols.size(); ++c) {
            const std::string &token = fields[channelCols[c]];
            if (isMissingToken(token)) {
                sample.values.push_back(kMissing);
                continue;
            }

            const auto value = parseDouble(token);
            const auto &range = _layout.channels[c].range;
            if (!value || (range && !range->contains(*value))) {
                ++_report.valuesMasked;
                core::Log::debug(kTag, source + ":" + std::to_string(lineNo) + ": "
                    + _layout.channels[c].name + " value '" + token + "' masked as missing");
                sample.values.push_back(kMissing);
                continue;
            }
            sample.values.push_back(*value);
        }

        if (labelCol && *labelCol < fields.size() && !isMissingToken(fields[*labelCol]))
            sample.label = fields[*labelCol];

        grouped[*owner].push_back(std::move(sample));
    }

    if (grouped.empty()) {
        return core::makeError(core::ErrorCode::kEmptyInput, "no usable row in " + source);
    }

    SeriesSet set(channelNames);
    for (auto &[owner, samples] : grouped) {
        std::stable_sort(samples.begin(), samples.end(),
                         [](const Sample &a, const Sample &b) { return a.t < b.t; });

        const auto last = std::unique(samples.begin(), samples.end(),
                                      [](const Sample &a, const Sample &b) { return a.t == b.t; });
        const auto dropped = static_cast<std::size_t>(samples.end() - last);
        if (dropped > 0) {
            _report.duplicatesDropped += dropped;
            core::Log::warn(kTag, "owner " + std::to_string(owner) + ": "
                + std::to_string(dropped) + " duplicate timestamp(s) dropped");
        }
        samples.erase(last, samples.end());

        auto ownerSeries = CBB_TRY(OwnerSeries::create(owner, channelNames, std::move(samples)));
        CBB_TRY_VOID(set.add(std::move(ownerSeries)));
    }

    if (_report.valuesMasked > 0) {
        core::Log::info(kTag, std::to_string(_report.valuesMasked)
            + " channel value(s) masked as missing in " + source);
    }
    core::Log::info(kTag, "loaded " + std::to_string(set.totalSamples()) + " samples for "
        + std::to_string(set.size()) + " owner(s) from " + source);

    return set;
}

} // namespace cbb::series
