/**
 * @file Prediction.hpp
 * @brief Class probabilities and the resulting predicted state.
 * @author MasterLaplace
 */

#pragma once

#include "cbb/model/CognitiveState.hpp"

#include <array>

namespace cbb::model {

/**
 * @brief Output of one classification.
 *
 * Probabilities are indexed by state ordinal and sum to 1. The predicted
 * state is the argmax; ties go to the lowest ordinal.
 */
struct Prediction {
    std::array<double, kStateCount> probabilities{};
    CognitiveState predicted = CognitiveState::kOptimal;

    [[nodiscard]] static Prediction fromProbabilities(const std::array<double, kStateCount> &p) noexcept
    {
        Prediction out;
        out.probabilities = p;
        core::usize best = 0;
        for (core::usize k = 1; k < kStateCount; ++k) {
            if (p[k] > p[best])
                best = k;
        }
        out.predicted = static_cast<CognitiveState>(best);
        return out;
    }

    [[nodiscard]] double probability(CognitiveState state) const noexcept
    {
        return probabilities[ordinal(state)];
    }

    [[nodiscard]] double confidence() const noexcept { return probability(predicted); }

    bool operator==(const Prediction &) const = default;
};

} // namespace cbb::model
