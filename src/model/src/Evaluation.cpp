/**
 * @file Evaluation.cpp
 * @brief Implementation of the confusion matrix and hold-out evaluation.
 * @author MasterLaplace
 */

#include "cbb/model/Evaluation.hpp"

#include "cbb/core/Log.hpp"

#include <vector>

namespace cbb::model {

// ─── ConfusionMatrix ─────────────────────────────────────────────────────────

void ConfusionMatrix::add(CognitiveState actual, CognitiveState predicted) noexcept
{
    ++_cells[ordinal(actual)][ordinal(predicted)];
    ++_total;
}

core::usize ConfusionMatrix::count(CognitiveState actual, CognitiveState predicted) const noexcept
{
    return _cells[ordinal(actual)][ordinal(predicted)];
}

core::usize ConfusionMatrix::actualCount(CognitiveState state) const noexcept
{
    core::usize sum = 0;
    for (const auto p : kAllStates)
        sum += count(state, p);
    return sum;
}

core::usize ConfusionMatrix::predictedCount(CognitiveState state) const noexcept
{
    core::usize sum = 0;
    for (const auto a : kAllStates)
        sum += count(a, state);
    return sum;
}

double ConfusionMatrix::accuracy() const noexcept
{
    if (_total == 0)
        return 0.0;

    core::usize agree = 0;
    for (const auto s : kAllStates)
        agree += count(s, s);
    return static_cast<double>(agree) / static_cast<double>(_total);
}

double ConfusionMatrix::kappa() const noexcept
{
    if (_total == 0)
        return 0.0;

    const auto n = static_cast<double>(_total);
    double chance = 0.0;
    for (const auto s : kAllStates)
        chance += static_cast<double>(actualCount(s)) * static_cast<double>(predictedCount(s));
    chance /= n * n;

    if (chance >= 1.0)
        return 0.0;
    return (accuracy() - chance) / (1.0 - chance);
}

double ConfusionMatrix::sensitivity(CognitiveState state) const noexcept
{
    const auto positives = actualCount(state);
    if (positives == 0)
        return 0.0;
    return static_cast<double>(count(state, state)) / static_cast<double>(positives);
}

double ConfusionMatrix::specificity(CognitiveState state) const noexcept
{
    const auto negatives = _total - actualCount(state);
    if (negatives == 0)
        return 0.0;
    const auto falsePositives = predictedCount(state) - count(state, state);
    return static_cast<double>(negatives - falsePositives) / static_cast<double>(negatives);
}

// ─── evaluate ────────────────────────────────────────────────────────────────

core::Expected<EvaluationReport> evaluate(
    const IStateClassifier &classifier,
    std::span<const std::shared_ptr<const feature::FeatureTable>> tables)
{
    EvaluationReport report;

    for (const auto &table : tables) {
        std::vector<core::usize> rows;
        std::vector<CognitiveState> actual;

        for (core::usize r = 0; r < table->rows(); ++r) {
            if (!table->isUsable(r)) {
                ++report.rowsUnusable;
                continue;
            }
            const auto &label = table->label(r);
            const auto state = label ? parseState(*label) : std::nullopt;
            if (!state) {
                if (label) {
                    core::Log::debug("model", "owner " + std::to_string(table->owner())
                        + ": unknown label '" + *label + "' skipped");
                }
                ++report.rowsUnlabelled;
                continue;
            }
            rows.push_back(r);
            actual.push_back(*state);
        }

        if (rows.empty())
            continue;

        Eigen::MatrixXd input(static_cast<Eigen::Index>(rows.size()), table->values().cols());
        for (std::size_t i = 0; i < rows.size(); ++i)
            input.row(static_cast<Eigen::Index>(i)) = table->values().row(static_cast<Eigen::Index>(rows[i]));

        const Eigen::MatrixXd proba = classifier.predictBatch(input);

        for (std::size_t i = 0; i < rows.size(); ++i) {
            std::array<double, kStateCount> p{};
            for (std::size_t k = 0; k < kStateCount; ++k)
                p[k] = proba(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k));
            report.matrix.add(actual[i], Prediction::fromProbabilities(p).predicted);
        }
        report.rowsEvaluated += rows.size();
    }

    if (report.rowsEvaluated == 0) {
        return core::makeError(core::ErrorCode::kEmptyInput, "no labelled usable row to evaluate");
    }

    core::Log::info("model", "evaluated " + std::to_string(report.rowsEvaluated) + " row(s), accuracy "
        + std::to_string(report.matrix.accuracy()) + ", kappa " + std::to_string(report.matrix.kappa()));
    return report;
}

} // namespace cbb::model
