/**
 * @file WindowedFeatureExtractor.cpp
 * @brief Implementation of the batch feature extractor.
 * @author MasterLaplace
 */

#include "cbb/feature/WindowedFeatureExtractor.hpp"

#include "cbb/core/Log.hpp"
#include "cbb/feature/RollingStatistics.hpp"

#include <map>

namespace cbb::feature {

namespace {

constexpr std::string_view kTag = "feature";
constexpr double kMissing = series::kMissing;

} // namespace

std::string_view shortSeriesPolicyName(ShortSeriesPolicy policy) noexcept
{
    switch (policy) {
        case ShortSeriesPolicy::kFail:    return "fail";
        case ShortSeriesPolicy::kExclude: return "exclude";
    }
    return "unknown";
}

std::optional<ShortSeriesPolicy> parseShortSeriesPolicy(std::string_view text) noexcept
{
    if (text == "fail")
        return ShortSeriesPolicy::kFail;
    if (text == "exclude")
        return ShortSeriesPolicy::kExclude;
    return std::nullopt;
}

WindowedFeatureExtractor::WindowedFeatureExtractor(std::shared_ptr<const FeatureSchema> schema)
    : _schema(std::move(schema))
{
}

core::Expected<std::vector<core::usize>> WindowedFeatureExtractor::bind(
    const series::OwnerSeries &series) const
{
    CBB_TRY_VOID(_schema->validateChannels(series.channels()));

    std::vector<core::usize> channelOf;
    channelOf.reserve(_schema->size());
    for (const auto &spec : _schema->specs()) {
        if (warmup(spec) > series.size()) {
            return core::makeError(core::ErrorCode::kWindowExceedsSeries,
                "owner " + std::to_string(series.owner()) + ": feature '" + spec.name + "' needs "
                    + std::to_string(warmup(spec)) + " samples, series has "
                    + std::to_string(series.size()));
        }
        channelOf.push_back(*series.channelIndex(spec.channel));
    }
    return channelOf;
}

core::Expected<FeatureTable> WindowedFeatureExtractor::extract(
    std::shared_ptr<const series::OwnerSeries> series) const
{
    const auto channelOf = CBB_TRY(bind(*series));

    const auto n = static_cast<Eigen::Index>(series->size());
    const auto f = static_cast<Eigen::Index>(_schema->size());

    Eigen::MatrixXd values(n, f);
    FeatureTable::Mask imputed = FeatureTable::Mask::Constant(n, f, false);

    std::map<core::usize, std::vector<double>> columns;
    core::usize filled = 0;

    for (Eigen::Index c = 0; c < f; ++c) {
        const auto &spec = _schema->spec(static_cast<core::usize>(c));
        const auto channel = channelOf[static_cast<std::size_t>(c)];
        auto it = columns.find(channel);
        if (it == columns.end())
            it = columns.emplace(channel, series->column(channel)).first;
        const std::span<const double> column = it->second;

        std::optional<double> last;
        Eigen::Index firstDefined = -1;

        for (Eigen::Index r = 0; r < n; ++r) {
            const auto v = RollingStatistics::evaluate(
                spec.kind, column, static_cast<std::size_t>(r), spec.window);
            if (v) {
                values(r, c) = *v;
                last = v;
                if (firstDefined < 0)
                    firstDefined = r;
            } else if (last) {
                values(r, c) = *last;
                imputed(r, c) = true;
                ++filled;
            } else {
                values(r, c) = kMissing;
            }
        }

        if (firstDefined < 0) {
            core::Log::warn(kTag, "owner " + std::to_string(series->owner()) + ": feature '"
                + spec.name + "' is never defined, rows are unusable");
            continue;
        }
        for (Eigen::Index r = 0; r < firstDefined; ++r) {
            values(r, c) = values(firstDefined, c);
            imputed(r, c) = true;
            ++filled;
        }
    }

    if (core::Log::enabled(core::LogLevel::kDebug)) {
        core::Log::debug(kTag, "owner " + std::to_string(series->owner()) + ": "
            + std::to_string(n) + " rows, " + std::to_string(filled) + " cell(s) filled");
    }

    return FeatureTable(std::move(series), _schema, std::move(values), std::move(imputed));
}

core::Expected<FeatureVector> WindowedFeatureExtractor::extractAt(
    const std::shared_ptr<const series::OwnerSeries> &series,
    core::usize position) const
{
    const auto channelOf = CBB_TRY(bind(*series));

    if (position < 1 || position > series->size()) {
        return core::makeError(core::ErrorCode::kOutOfRange,
            "position " + std::to_string(position) + " outside [1, "
                + std::to_string(series->size()) + "]");
    }

    const std::size_t row = position - 1;
    std::map<core::usize, std::vector<double>> columns;
    std::vector<double> out(_schema->size(), kMissing);

    for (std::size_t c = 0; c < out.size(); ++c) {
        const auto &spec = _schema->spec(c);
        auto it = columns.find(channelOf[c]);
        if (it == columns.end())
            it = columns.emplace(channelOf[c], series->column(channelOf[c])).first;
        const std::span<const double> column = it->second;

        if (auto v = RollingStatistics::evaluate(spec.kind, column, row, spec.window)) {
            out[c] = *v;
            continue;
        }

        // Last defined value before the position, else the first one after it.
        bool found = false;
        for (std::size_t r = row; r-- > 0;) {
            if (auto v = RollingStatistics::evaluate(spec.kind, column, r, spec.window)) {
                out[c] = *v;
                found = true;
                break;
            }
        }
        for (std::size_t r = row + 1; !found && r < column.size(); ++r) {
            if (auto v = RollingStatistics::evaluate(spec.kind, column, r, spec.window)) {
                out[c] = *v;
                found = true;
            }
        }
    }

    return FeatureVector(series->owner(), series->at(row).t, _schema, std::move(out));
}

core::Expected<std::vector<std::shared_ptr<const FeatureTable>>> WindowedFeatureExtractor::extractAll(
    const series::SeriesSet &set,
    ShortSeriesPolicy policy) const
{
    std::vector<std::shared_ptr<const FeatureTable>> tables;
    tables.reserve(set.size());

    for (const auto &[owner, recording] : set) {
        auto table = extract(recording);
        if (!table) {
            if (policy == ShortSeriesPolicy::kExclude
                && table.error().code() == core::ErrorCode::kWindowExceedsSeries) {
                core::Log::warn(kTag, table.error().message() + ", owner excluded");
                continue;
            }
            return std::unexpected(table.error());
        }
        tables.push_back(std::make_shared<const FeatureTable>(std::move(*table)));
    }

    if (tables.empty()) {
        return core::makeError(core::ErrorCode::kEmptyInput, "no owner left after feature extraction");
    }

    core::Log::info(kTag, "extracted " + std::to_string(_schema->size()) + " feature(s) for "
        + std::to_string(tables.size()) + " owner(s)");
    return tables;
}

} // namespace cbb::feature
