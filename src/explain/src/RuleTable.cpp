/**
 * @file RuleTable.cpp
 * @brief Rule direction helpers.
 * @author MasterLaplace
 */

#include "cbb/explain/RuleTable.hpp"

namespace cbb::explain {

std::string_view directionName(Direction direction) noexcept
{
    switch (direction) {
        case Direction::kAbove: return "above";
        case Direction::kBelow: return "below";
    }
    return "unknown";
}

std::optional<Direction> parseDirection(std::string_view text) noexcept
{
    if (text == "above" || text == ">")
        return Direction::kAbove;
    if (text == "below" || text == "<")
        return Direction::kBelow;
    return std::nullopt;
}

} // namespace cbb::explain
