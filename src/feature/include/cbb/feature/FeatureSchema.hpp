/**
 * @file FeatureSchema.hpp
 * @brief Declarative feature definitions and the ordered feature schema.
 * @author MasterLaplace
 *
 * A FeatureSpec derives one feature from one raw channel with a windowed
 * aggregation. The FeatureSchema fixes the feature order that every
 * FeatureVector, FeatureTable and classifier input follows.
 *
 * Warm-up is the earliest 1-based position at which the aggregation is
 * defined from observed samples alone:
 *   mean / stddev over w samples : w
 *   lag by k                     : k + 1
 *   delta over w                 : w + 1
 */

#pragma once

#include "cbb/core/Expected.hpp"
#include "cbb/core/Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbb::feature {

/**
 * @brief Windowed aggregation applied to a channel.
 */
enum class AggregationKind : core::u8 {
    kMean,    ///< Mean of the last w samples, t included.
    kStdDev,  ///< Sample standard deviation of the last w samples.
    kLag,     ///< Raw value k samples back.
    kDelta,   ///< x(t) minus the mean of the w samples ending at t-1.
};

[[nodiscard]] std::string_view aggregationKindName(AggregationKind kind) noexcept;

/**
 * @brief Parses "mean", "stddev" (or "sd"), "lag" and "delta".
 */
[[nodiscard]] std::optional<AggregationKind> parseAggregationKind(std::string_view text) noexcept;

/**
 * @brief One derived feature.
 */
struct FeatureSpec {
    std::string name;
    std::string channel;
    AggregationKind kind = AggregationKind::kMean;
    /// Window length for kMean, kStdDev and kDelta; lag k for kLag.
    core::usize window = 1;
};

/**
 * @brief Earliest 1-based position at which @p spec is defined.
 */
[[nodiscard]] core::usize warmup(const FeatureSpec &spec) noexcept;

/**
 * @brief Ordered, validated list of features.
 */
class FeatureSchema {
public:
    /**
     * @brief Validates and freezes a feature list.
     *
     * Fails with kInvalidFeatureSpec on an empty list, an empty or repeated
     * name, an empty channel, a zero window, or a stddev window below 2.
     */
    [[nodiscard]] static core::Expected<FeatureSchema> create(std::vector<FeatureSpec> specs);

    /**
     * @brief Checks that every referenced channel exists in @p channels.
     * @return kInvalidFeatureSpec naming the first unknown channel.
     */
    [[nodiscard]] core::ExpectedVoid validateChannels(const std::vector<std::string> &channels) const;

    [[nodiscard]] core::usize size() const noexcept { return _specs.size(); }
    [[nodiscard]] const std::vector<FeatureSpec> &specs() const noexcept { return _specs; }
    [[nodiscard]] const FeatureSpec &spec(core::usize index) const { return _specs.at(index); }
    [[nodiscard]] const std::vector<std::string> &names() const noexcept { return _names; }

    [[nodiscard]] std::optional<core::usize> indexOf(std::string_view name) const noexcept;

    /// Largest warm-up over all features.
    [[nodiscard]] core::usize maxWarmup() const noexcept { return _maxWarmup; }

private:
    explicit FeatureSchema(std::vector<FeatureSpec> specs);

    std::vector<FeatureSpec> _specs;
    std::vector<std::string> _names;
    core::usize _maxWarmup = 0;
};

} // namespace cbb::feature
