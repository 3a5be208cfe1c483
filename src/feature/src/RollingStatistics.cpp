/**
 * @file RollingStatistics.cpp
 * @brief Implementation of the causal rolling aggregations.
 * @author MasterLaplace
 */

#include "cbb/feature/RollingStatistics.hpp"

#include <cmath>

namespace cbb::feature {

namespace {

/// Window [end + 1 - window, end] must lie inside the column and hold no NaN.
bool windowUsable(std::span<const double> column, std::size_t end, std::size_t window) noexcept
{
    if (window == 0 || end >= column.size() || end + 1 < window)
        return false;
    for (std::size_t i = end + 1 - window; i <= end; ++i) {
        if (std::isnan(column[i]))
            return false;
    }
    return true;
}

} // namespace

std::optional<double> RollingStatistics::mean(
    std::span<const double> column,
    std::size_t end,
    std::size_t window) noexcept
{
    if (!windowUsable(column, end, window))
        return std::nullopt;

    // Summing offsets from the first value keeps a constant window at exactly that value.
    const std::size_t begin = end + 1 - window;
    const double anchor = column[begin];
    double offset = 0.0;
    for (std::size_t i = begin; i <= end; ++i)
        offset += column[i] - anchor;
    return anchor + offset / static_cast<double>(window);
}

std::optional<double> RollingStatistics::sampleStdDev(
    std::span<const double> column,
    std::size_t end,
    std::size_t window) noexcept
{
    if (window < 2)
        return std::nullopt;

    const auto m = mean(column, end, window);
    if (!m)
        return std::nullopt;

    double sumSq = 0.0;
    for (std::size_t i = end + 1 - window; i <= end; ++i) {
        const double d = column[i] - *m;
        sumSq += d * d;
    }
    return std::sqrt(sumSq / static_cast<double>(window - 1));
}

std::optional<double> RollingStatistics::lag(
    std::span<const double> column,
    std::size_t end,
    std::size_t k) noexcept
{
    if (end >= column.size() || end < k)
        return std::nullopt;

    const double v = column[end - k];
    if (std::isnan(v))
        return std::nullopt;
    return v;
}

std::optional<double> RollingStatistics::delta(
    std::span<const double> column,
    std::size_t end,
    std::size_t window) noexcept
{
    if (end >= column.size() || end == 0 || std::isnan(column[end]))
        return std::nullopt;

    const auto previous = mean(column, end - 1, window);
    if (!previous)
        return std::nullopt;
    return column[end] - *previous;
}

std::optional<double> RollingStatistics::evaluate(
    AggregationKind kind,
    std::span<const double> column,
    std::size_t end,
    std::size_t window) noexcept
{
    switch (kind) {
        case AggregationKind::kMean:   return mean(column, end, window);
        case AggregationKind::kStdDev: return sampleStdDev(column, end, window);
        case AggregationKind::kLag:    return lag(column, end, window);
        case AggregationKind::kDelta:  return delta(column, end, window);
    }
    return std::nullopt;
}

} // namespace cbb::feature
