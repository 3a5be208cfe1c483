/**
 * @file RationaleEngine.hpp
 * @brief Turns a prediction and its inputs into a human-readable rationale.
 * @author MasterLaplace
 *
 * Rule sources are resolved once, at construction, against the feature
 * schema first and the raw channel list second. explain() is then a pure
 * lookup-and-format pass: same inputs, same rationale.
 *
 * @see RuleTable
 */

#pragma once

#include "cbb/core/Expected.hpp"
#include "cbb/explain/RuleTable.hpp"
#include "cbb/feature/FeatureVector.hpp"
#include "cbb/model/Prediction.hpp"

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace cbb::explain {

struct Rationale {
    std::string headline;
    std::vector<std::string> bullets;
    /// Indices, in the state's rule list, of the rules that fired.
    std::vector<core::usize> firedRules;

    bool operator==(const Rationale &) const = default;
};

class RationaleEngine {
public:
    /**
     * @brief Validates @p table and binds its sources.
     * @return kInvalidRuleTable if a state has no headline, a rule has an
     *         empty template or a negative precision, or a source is neither
     *         a feature of @p schema nor one of @p channels.
     */
    [[nodiscard]] static core::Expected<RationaleEngine> create(
        RuleTable table,
        std::shared_ptr<const feature::FeatureSchema> schema,
        std::vector<std::string> channels);

    /**
     * @brief Builds the rationale of @p prediction.
     * @param features Feature vector the prediction was made from.
     * @param raw      Raw channel values at the same timestamp.
     */
    [[nodiscard]] Rationale explain(const model::Prediction &prediction,
                                    const feature::FeatureVector &features,
                                    std::span<const double> raw) const;

    [[nodiscard]] const RuleTable &table() const noexcept { return _table; }

private:
    struct Binding {
        bool fromFeature = true;
        core::usize index = 0;
    };

    RationaleEngine(RuleTable table, std::array<std::vector<Binding>, model::kStateCount> bindings);

    RuleTable _table;
    std::array<std::vector<Binding>, model::kStateCount> _bindings;
};

/**
 * @brief Replaces every "{value}" in @p text by @p value with @p precision decimals.
 */
[[nodiscard]] std::string renderTemplate(std::string_view text, double value, int precision);

} // namespace cbb::explain
