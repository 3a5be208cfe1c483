/**
 * @file WindowedFeatureExtractor.hpp
 * @brief Batch causal feature extraction with an explicit edge-fill policy.
 * @author MasterLaplace
 *
 * Turns an OwnerSeries into a FeatureTable. Every aggregation reads only
 * samples at or before the evaluated position. Positions where a feature
 * is undefined are then filled:
 *   - before the first defined value: that first defined value;
 *   - after it: the last defined value before the position.
 * The second rule keeps the fill causal; the first is the only place where
 * a value crosses time backwards, and it is limited to the warm-up prefix
 * (or to a gap at the head of the series).
 *
 * extractAt() applies the same rule to a single position, so its result is
 * identical to the corresponding row of extract().
 *
 * @see RollingStatistics, StreamingFeatureExtractor
 */

#pragma once

#include "cbb/feature/FeatureTable.hpp"

#include <memory>
#include <vector>

namespace cbb::feature {

/**
 * @brief What extractAll() does with an owner shorter than a warm-up.
 */
enum class ShortSeriesPolicy : core::u8 {
    kFail,     ///< The configuration error propagates.
    kExclude,  ///< The owner is dropped with a warning.
};

[[nodiscard]] std::string_view shortSeriesPolicyName(ShortSeriesPolicy policy) noexcept;
[[nodiscard]] std::optional<ShortSeriesPolicy> parseShortSeriesPolicy(std::string_view text) noexcept;

/**
 * @brief Stateless batch extractor bound to one schema.
 */
class WindowedFeatureExtractor {
public:
    explicit WindowedFeatureExtractor(std::shared_ptr<const FeatureSchema> schema);

    /**
     * @brief Computes the full feature table of one owner.
     *
     * @return The table, kInvalidFeatureSpec if a channel is unknown, or
     *         kWindowExceedsSeries if the series is shorter than a warm-up.
     */
    [[nodiscard]] core::Expected<FeatureTable> extract(
        std::shared_ptr<const series::OwnerSeries> series) const;

    /**
     * @brief Computes the feature vector at the 1-based @p position only.
     */
    [[nodiscard]] core::Expected<FeatureVector> extractAt(
        const std::shared_ptr<const series::OwnerSeries> &series,
        core::usize position) const;

    /**
     * @brief Extracts every owner of @p set, applying @p policy to short series.
     */
    [[nodiscard]] core::Expected<std::vector<std::shared_ptr<const FeatureTable>>> extractAll(
        const series::SeriesSet &set,
        ShortSeriesPolicy policy = ShortSeriesPolicy::kFail) const;

    [[nodiscard]] const std::shared_ptr<const FeatureSchema> &schema() const noexcept { return _schema; }

private:
    [[nodiscard]] core::Expected<std::vector<core::usize>> bind(const series::OwnerSeries &series) const;

    std::shared_ptr<const FeatureSchema> _schema;
};

} // namespace cbb::feature
