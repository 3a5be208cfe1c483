/**
 * @file TreeEnsembleClassifier.hpp
 * @brief Gradient-boosted tree ensemble with a softmax output.
 * @author MasterLaplace
 *
 * Each tree contributes to the margin of one class. The margin of class k
 * is base_score plus the leaf values reached in every tree of class k;
 * probabilities are the softmax of the four margins.
 *
 * At a split node the sample goes to the @c yes child when
 * x[feature] < threshold, to @c no otherwise, and to @c missing when the
 * value is NaN.
 *
 * @see ModelArtifact
 */

#pragma once

#include "cbb/model/IStateClassifier.hpp"

#include <vector>

namespace cbb::model {

struct TreeNode {
    core::i32 splitFeature = -1; ///< -1 on a leaf.
    double threshold = 0.0;
    core::i32 yes = -1;
    core::i32 no = -1;
    core::i32 missing = -1;
    double leafValue = 0.0;

    [[nodiscard]] bool isLeaf() const noexcept { return splitFeature < 0; }
};

struct Tree {
    core::usize classIndex = 0;
    std::vector<TreeNode> nodes; ///< Node 0 is the root.
};

class TreeEnsembleClassifier final : public IStateClassifier {
public:
    /**
     * @brief Takes ownership of already validated trees.
     * @see ModelArtifact::parse for validation.
     */
    TreeEnsembleClassifier(ModelSchema schema, double baseScore, std::vector<Tree> trees);

    [[nodiscard]] const ModelSchema &schema() const noexcept override { return _schema; }
    [[nodiscard]] Prediction predict(std::span<const double> features) const override;
    [[nodiscard]] Eigen::MatrixXd predictBatch(const Eigen::MatrixXd &rows) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "tree-ensemble"; }

    [[nodiscard]] core::usize treeCount() const noexcept { return _trees.size(); }
    [[nodiscard]] double baseScore() const noexcept { return _baseScore; }

private:
    [[nodiscard]] std::array<double, kStateCount> probabilities(std::span<const double> x) const;
    [[nodiscard]] static double leafValue(const Tree &tree, std::span<const double> x) noexcept;

    ModelSchema _schema;
    double _baseScore;
    std::vector<Tree> _trees;
};

} // namespace cbb::model
