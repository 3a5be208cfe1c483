/**
 * @file RationaleEngine.cpp
 * @brief Implementation of the rule-driven rationale generator.
 * @author MasterLaplace
 */

#include "cbb/explain/RationaleEngine.hpp"

#include "cbb/core/Assert.hpp"
#include "cbb/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace cbb::explain {

namespace {

constexpr std::string_view kPlaceholder = "{value}";

} // namespace

std::string renderTemplate(std::string_view text, double value, int precision)
{
    char number[64];
    std::snprintf(number, sizeof(number), "%.*f", precision, value);

    std::string out;
    out.reserve(text.size() + 16);
    std::size_t pos = 0;
    while (true) {
        const auto hit = text.find(kPlaceholder, pos);
        if (hit == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, hit - pos));
        out.append(number);
        pos = hit + kPlaceholder.size();
    }
    return out;
}

RationaleEngine::RationaleEngine(RuleTable table, std::array<std::vector<Binding>, model::kStateCount> bindings)
    : _table(std::move(table)), _bindings(std::move(bindings))
{
}

core::Expected<RationaleEngine> RationaleEngine::create(
    RuleTable table,
    std::shared_ptr<const feature::FeatureSchema> schema,
    std::vector<std::string> channels)
{
    std::array<std::vector<Binding>, model::kStateCount> bindings;

    for (const auto state : model::kAllStates) {
        const auto &rules = table.rules(state);
        const std::string stateName(model::stateName(state));

        if (rules.headline.empty()) {
            return core::makeError(core::ErrorCode::kInvalidRuleTable,
                "state " + stateName + " has no headline");
        }

        auto &bound = bindings[model::ordinal(state)];
        for (std::size_t i = 0; i < rules.bullets.size(); ++i) {
            const auto &rule = rules.bullets[i];
            const std::string where = stateName + " rule " + std::to_string(i);

            if (rule.text.empty()) {
                return core::makeError(core::ErrorCode::kInvalidRuleTable, where + " has an empty template");
            }
            if (rule.precision < 0 || rule.precision > 12) {
                return core::makeError(core::ErrorCode::kInvalidRuleTable,
                    where + ": precision " + std::to_string(rule.precision) + " outside [0, 12]");
            }

            if (const auto index = schema->indexOf(rule.source)) {
                bound.push_back({true, *index});
                continue;
            }
            const auto it = std::find(channels.begin(), channels.end(), rule.source);
            if (it == channels.end()) {
                return core::makeError(core::ErrorCode::kInvalidRuleTable,
                    where + ": source '" + rule.source + "' is neither a feature nor a channel");
            }
            bound.push_back({false, static_cast<core::usize>(it - channels.begin())});
        }
    }

    core::Log::debug("explain", "rule table bound");
    return RationaleEngine(std::move(table), std::move(bindings));
}

Rationale RationaleEngine::explain(const model::Prediction &prediction,
                                   const feature::FeatureVector &features,
                                   std::span<const double> raw) const
{
    const auto &rules = _table.rules(prediction.predicted);
    const auto &bound = _bindings[model::ordinal(prediction.predicted)];

    Rationale out;
    out.headline = rules.headline;

    for (std::size_t i = 0; i < rules.bullets.size(); ++i) {
        const auto &rule = rules.bullets[i];
        const auto &binding = bound[i];

        CBB_ASSERT(binding.fromFeature ? binding.index < features.size() : binding.index < raw.size());
        const double value = binding.fromFeature ? features[binding.index] : raw[binding.index];

        if (std::isnan(value))
            continue;
        if (rule.condition && !rule.condition->holds(value))
            continue;

        out.bullets.push_back(renderTemplate(rule.text, value, rule.precision));
        out.firedRules.push_back(i);
    }
    return out;
}

} // namespace cbb::explain
