/**
 * @file RuleTable.hpp
 * @brief Configurable headline and bullet rules per cognitive state.
 * @author MasterLaplace
 *
 * A bullet rule cites one source value (an engineered feature or a raw
 * channel) through a text template in which "{value}" is replaced by the
 * value printed with @c precision decimals. A rule with a condition fires
 * only when the value is strictly above (or below) its threshold.
 */

#pragma once

#include "cbb/model/CognitiveState.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbb::explain {

enum class Direction : core::u8 {
    kAbove,
    kBelow,
};

[[nodiscard]] std::string_view directionName(Direction direction) noexcept;
[[nodiscard]] std::optional<Direction> parseDirection(std::string_view text) noexcept;

struct RuleCondition {
    Direction direction = Direction::kAbove;
    double threshold = 0.0;

    [[nodiscard]] bool holds(double value) const noexcept
    {
        return direction == Direction::kAbove ? value > threshold : value < threshold;
    }
};

struct BulletRule {
    std::string source;
    std::optional<RuleCondition> condition;
    std::string text;
    int precision = 2;
};

struct StateRules {
    std::string headline;
    std::vector<BulletRule> bullets;
};

/**
 * @brief One StateRules entry per state of the fixed set.
 */
class RuleTable {
public:
    RuleTable() = default;

    RuleTable &set(model::CognitiveState state, StateRules rules)
    {
        _states[model::ordinal(state)] = std::move(rules);
        return *this;
    }

    [[nodiscard]] const StateRules &rules(model::CognitiveState state) const noexcept
    {
        return _states[model::ordinal(state)];
    }

    [[nodiscard]] StateRules &rules(model::CognitiveState state) noexcept
    {
        return _states[model::ordinal(state)];
    }

private:
    std::array<StateRules, model::kStateCount> _states;
};

} // namespace cbb::explain
