/**
 * @file Evaluation.hpp
 * @brief Hold-out evaluation of a classifier against labelled recordings.
 * @author MasterLaplace
 *
 * Reports the confusion matrix (rows: actual, columns: predicted), the
 * overall accuracy, Cohen's kappa and the per-class sensitivity and
 * specificity. Per-class figures matter for the lapse class, which is
 * rare in practice and hidden by a good overall accuracy.
 */

#pragma once

#include "cbb/feature/FeatureTable.hpp"
#include "cbb/model/IStateClassifier.hpp"

#include <array>
#include <memory>
#include <span>

namespace cbb::model {

class ConfusionMatrix {
public:
    void add(CognitiveState actual, CognitiveState predicted) noexcept;

    [[nodiscard]] core::usize count(CognitiveState actual, CognitiveState predicted) const noexcept;
    [[nodiscard]] core::usize total() const noexcept { return _total; }

    /// Row sum: how many samples truly are in @p state.
    [[nodiscard]] core::usize actualCount(CognitiveState state) const noexcept;
    /// Column sum: how many samples were predicted as @p state.
    [[nodiscard]] core::usize predictedCount(CognitiveState state) const noexcept;

    [[nodiscard]] double accuracy() const noexcept;

    /**
     * @brief Cohen's kappa; 0 when chance agreement is total.
     */
    [[nodiscard]] double kappa() const noexcept;

    /// TP / (TP + FN); 0 when the state never occurs.
    [[nodiscard]] double sensitivity(CognitiveState state) const noexcept;
    /// TN / (TN + FP); 0 when every sample is in the state.
    [[nodiscard]] double specificity(CognitiveState state) const noexcept;

private:
    std::array<std::array<core::usize, kStateCount>, kStateCount> _cells{};
    core::usize _total = 0;
};

struct EvaluationReport {
    ConfusionMatrix matrix;
    core::usize rowsEvaluated = 0;
    core::usize rowsUnlabelled = 0;
    core::usize rowsUnusable = 0;
};

/**
 * @brief Classifies every usable labelled row of @p tables.
 * @return kEmptyInput when no row could be evaluated.
 */
[[nodiscard]] core::Expected<EvaluationReport> evaluate(
    const IStateClassifier &classifier,
    std::span<const std::shared_ptr<const feature::FeatureTable>> tables);

} // namespace cbb::model
