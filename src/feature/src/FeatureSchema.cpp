/**
 * @file FeatureSchema.cpp
 * @brief Implementation of FeatureSpec helpers and FeatureSchema.
 * @author MasterLaplace
 */

#include "cbb/feature/FeatureSchema.hpp"

#include <algorithm>
#include <unordered_set>

namespace cbb::feature {

std::string_view aggregationKindName(AggregationKind kind) noexcept
{
    switch (kind) {
        case AggregationKind::kMean:   return "mean";
        case AggregationKind::kStdDev: return "stddev";
        case AggregationKind::kLag:    return "lag";
        case AggregationKind::kDelta:  return "delta";
    }
    return "unknown";
}

std::optional<AggregationKind> parseAggregationKind(std::string_view text) noexcept
{
    if (text == "mean")
        return AggregationKind::kMean;
    if (text == "stddev" || text == "sd")
        return AggregationKind::kStdDev;
    if (text == "lag")
        return AggregationKind::kLag;
    if (text == "delta")
        return AggregationKind::kDelta;
    return std::nullopt;
}

core::usize warmup(const FeatureSpec &spec) noexcept
{
    switch (spec.kind) {
        case AggregationKind::kMean:
        case AggregationKind::kStdDev:
            return spec.window;
        case AggregationKind::kLag:
        case AggregationKind::kDelta:
            return spec.window + 1;
    }
    return spec.window;
}

FeatureSchema::FeatureSchema(std::vector<FeatureSpec> specs)
    : _specs(std::move(specs))
{
    _names.reserve(_specs.size());
    for (const auto &spec : _specs) {
        _names.push_back(spec.name);
        _maxWarmup = std::max(_maxWarmup, warmup(spec));
    }
}

core::Expected<FeatureSchema> FeatureSchema::create(std::vector<FeatureSpec> specs)
{
    if (specs.empty()) {
        return core::makeError(core::ErrorCode::kInvalidFeatureSpec, "feature list is empty");
    }

    std::unordered_set<std::string> seen;
    for (const auto &spec : specs) {
        if (spec.name.empty()) {
            return core::makeError(core::ErrorCode::kInvalidFeatureSpec, "feature with empty name");
        }
        if (!seen.insert(spec.name).second) {
            return core::makeError(core::ErrorCode::kInvalidFeatureSpec,
                "duplicate feature name '" + spec.name + "'");
        }
        if (spec.channel.empty()) {
            return core::makeError(core::ErrorCode::kInvalidFeatureSpec,
                "feature '" + spec.name + "' has no channel");
        }
        if (spec.window == 0) {
            return core::makeError(core::ErrorCode::kInvalidFeatureSpec,
                "feature '" + spec.name + "' has a zero window");
        }
        if (spec.kind == AggregationKind::kStdDev && spec.window < 2) {
            return core::makeError(core::ErrorCode::kInvalidFeatureSpec,
                "feature '" + spec.name + "': stddev needs a window of at least 2");
        }
    }

    return FeatureSchema(std::move(specs));
}

core::ExpectedVoid FeatureSchema::validateChannels(const std::vector<std::string> &channels) const
{
    for (const auto &spec : _specs) {
        if (std::find(channels.begin(), channels.end(), spec.channel) == channels.end()) {
            return core::makeError(core::ErrorCode::kInvalidFeatureSpec,
                "feature '" + spec.name + "' references unknown channel '" + spec.channel + "'");
        }
    }
    return {};
}

std::optional<core::usize> FeatureSchema::indexOf(std::string_view name) const noexcept
{
    for (std::size_t i = 0; i < _names.size(); ++i) {
        if (_names[i] == name)
            return i;
    }
    return std::nullopt;
}

} // namespace cbb::feature
