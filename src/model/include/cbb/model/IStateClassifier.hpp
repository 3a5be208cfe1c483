/**
 * @file IStateClassifier.hpp
 * @brief Abstract interface for cognitive-state classifiers.
 * @author MasterLaplace
 *
 * A classifier maps a feature vector laid out in schema().featureNames
 * order to a probability distribution over the fixed state set.
 * Implementations are immutable after loading and deterministic; they
 * may be shared between sessions.
 *
 * @see TreeEnsembleClassifier, SchemaGuard
 */

#pragma once

#include "cbb/model/Prediction.hpp"

#include <Eigen/Dense>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cbb::model {

/**
 * @brief Input/output contract a classifier was trained with.
 */
struct ModelSchema {
    std::vector<std::string> featureNames;
};

class IStateClassifier {
public:
    virtual ~IStateClassifier() = default;

    [[nodiscard]] virtual const ModelSchema &schema() const noexcept = 0;

    /**
     * @brief Classifies one feature vector.
     * @param features Values in schema().featureNames order.
     */
    [[nodiscard]] virtual Prediction predict(std::span<const double> features) const = 0;

    /**
     * @brief Classifies every row of @p rows.
     * @return rows.rows() x kStateCount probabilities, identical to predict()
     *         applied row by row.
     */
    [[nodiscard]] virtual Eigen::MatrixXd predictBatch(const Eigen::MatrixXd &rows) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace cbb::model
