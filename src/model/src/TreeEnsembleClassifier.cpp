/**
 * @file TreeEnsembleClassifier.cpp
 * @brief Implementation of the boosted tree ensemble.
 * @author MasterLaplace
 */

#include "cbb/model/TreeEnsembleClassifier.hpp"

#include "cbb/core/Assert.hpp"

#include <algorithm>
#include <cmath>

namespace cbb::model {

TreeEnsembleClassifier::TreeEnsembleClassifier(ModelSchema schema, double baseScore, std::vector<Tree> trees)
    : _schema(std::move(schema)), _baseScore(baseScore), _trees(std::move(trees))
{
}

double TreeEnsembleClassifier::leafValue(const Tree &tree, std::span<const double> x) noexcept
{
    std::size_t i = 0;
    while (!tree.nodes[i].isLeaf()) {
        const auto &node = tree.nodes[i];
        const double v = x[static_cast<std::size_t>(node.splitFeature)];
        const core::i32 next = std::isnan(v) ? node.missing : (v < node.threshold ? node.yes : node.no);
        i = static_cast<std::size_t>(next);
    }
    return tree.nodes[i].leafValue;
}

std::array<double, kStateCount> TreeEnsembleClassifier::probabilities(std::span<const double> x) const
{
    std::array<double, kStateCount> margin;
    margin.fill(_baseScore);

    for (const auto &tree : _trees)
        margin[tree.classIndex] += leafValue(tree, x);

    const double top = *std::max_element(margin.begin(), margin.end());
    double sum = 0.0;
    for (auto &m : margin) {
        m = std::exp(m - top);
        sum += m;
    }
    for (auto &m : margin)
        m /= sum;
    return margin;
}

Prediction TreeEnsembleClassifier::predict(std::span<const double> features) const
{
    CBB_ASSERT(features.size() == _schema.featureNames.size());
    return Prediction::fromProbabilities(probabilities(features));
}

Eigen::MatrixXd TreeEnsembleClassifier::predictBatch(const Eigen::MatrixXd &rows) const
{
    CBB_ASSERT(static_cast<std::size_t>(rows.cols()) == _schema.featureNames.size());

    Eigen::MatrixXd out(rows.rows(), static_cast<Eigen::Index>(kStateCount));
    std::vector<double> x(static_cast<std::size_t>(rows.cols()));

    for (Eigen::Index r = 0; r < rows.rows(); ++r) {
        for (Eigen::Index c = 0; c < rows.cols(); ++c)
            x[static_cast<std::size_t>(c)] = rows(r, c);

        const auto p = probabilities(x);
        for (std::size_t k = 0; k < kStateCount; ++k)
            out(r, static_cast<Eigen::Index>(k)) = p[k];
    }
    return out;
}

} // namespace cbb::model
