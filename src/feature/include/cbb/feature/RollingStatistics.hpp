/**
 * @file RollingStatistics.hpp
 * @brief Causal windowed aggregations over a single channel column.
 * @author MasterLaplace
 *
 * Every function evaluates at row @p end (0-based) and reads only rows
 * [.., end]. A result is nullopt when the window reaches before row 0 or
 * contains a missing value (NaN). The same functions serve the batch and
 * the streaming extractor, which keeps both paths numerically identical.
 *
 * @see WindowedFeatureExtractor, StreamingFeatureExtractor
 */

#pragma once

#include "cbb/feature/FeatureSchema.hpp"

#include <cstddef>
#include <optional>
#include <span>

namespace cbb::feature {

/**
 * @brief Pure-function rolling aggregations.
 */
class RollingStatistics {
public:
    RollingStatistics() = delete;

    /**
     * @brief Mean of the @p window values ending at @p end.
     *
     * Accumulated relative to the first window value, so a constant
     * window returns that value exactly.
     */
    [[nodiscard]] static std::optional<double> mean(
        std::span<const double> column,
        std::size_t end,
        std::size_t window) noexcept;

    /**
     * @brief Sample standard deviation (n - 1) of the @p window values
     *        ending at @p end.
     *
     * Computed in two passes around the window mean so that a constant
     * window yields exactly zero. Requires @p window >= 2.
     */
    [[nodiscard]] static std::optional<double> sampleStdDev(
        std::span<const double> column,
        std::size_t end,
        std::size_t window) noexcept;

    /**
     * @brief Value @p k rows before @p end.
     */
    [[nodiscard]] static std::optional<double> lag(
        std::span<const double> column,
        std::size_t end,
        std::size_t k) noexcept;

    /**
     * @brief column[end] minus the mean of the @p window values ending at end - 1.
     */
    [[nodiscard]] static std::optional<double> delta(
        std::span<const double> column,
        std::size_t end,
        std::size_t window) noexcept;

    /**
     * @brief Dispatches on @p kind.
     */
    [[nodiscard]] static std::optional<double> evaluate(
        AggregationKind kind,
        std::span<const double> column,
        std::size_t end,
        std::size_t window) noexcept;
};

} // namespace cbb::feature
