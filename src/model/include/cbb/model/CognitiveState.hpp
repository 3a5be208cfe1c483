/**
 * @file CognitiveState.hpp
 * @brief The fixed set of cognitive states and their stable ordinals.
 * @author MasterLaplace
 *
 * Ordinals are part of the classifier contract: output column k of every
 * classifier is the probability of the state with ordinal k.
 */

#pragma once

#include "cbb/core/Types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace cbb::model {

enum class CognitiveState : core::u8 {
    kOptimal = 0,
    kHighLoad = 1,
    kFatigued = 2,
    kAttentionalLapse = 3,
};

inline constexpr core::usize kStateCount = 4;

inline constexpr std::array<CognitiveState, kStateCount> kAllStates = {
    CognitiveState::kOptimal,
    CognitiveState::kHighLoad,
    CognitiveState::kFatigued,
    CognitiveState::kAttentionalLapse,
};

[[nodiscard]] constexpr core::usize ordinal(CognitiveState state) noexcept
{
    return static_cast<core::usize>(state);
}

[[nodiscard]] constexpr std::optional<CognitiveState> stateFromOrdinal(core::usize value) noexcept
{
    if (value >= kStateCount)
        return std::nullopt;
    return static_cast<CognitiveState>(value);
}

/// Canonical identifier: "Optimal", "HighLoad", "Fatigued", "AttentionalLapse".
[[nodiscard]] constexpr std::string_view stateName(CognitiveState state) noexcept
{
    switch (state) {
        case CognitiveState::kOptimal:          return "Optimal";
        case CognitiveState::kHighLoad:         return "HighLoad";
        case CognitiveState::kFatigued:         return "Fatigued";
        case CognitiveState::kAttentionalLapse: return "AttentionalLapse";
    }
    return "Unknown";
}

/// Human-readable form: "High Load", "Attentional Lapse", ...
[[nodiscard]] constexpr std::string_view stateDisplayName(CognitiveState state) noexcept
{
    switch (state) {
        case CognitiveState::kOptimal:          return "Optimal";
        case CognitiveState::kHighLoad:         return "High Load";
        case CognitiveState::kFatigued:         return "Fatigued";
        case CognitiveState::kAttentionalLapse: return "Attentional Lapse";
    }
    return "Unknown";
}

/**
 * @brief Accepts either the canonical or the display name.
 */
[[nodiscard]] constexpr std::optional<CognitiveState> parseState(std::string_view text) noexcept
{
    for (const auto state : kAllStates) {
        if (text == stateName(state) || text == stateDisplayName(state))
            return state;
    }
    return std::nullopt;
}

} // namespace cbb::model
