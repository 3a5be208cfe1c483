/**
 * @file SchemaGuard.hpp
 * @brief Startup check that a classifier and a feature schema agree.
 * @author MasterLaplace
 */

#pragma once

#include "cbb/core/Expected.hpp"
#include "cbb/feature/FeatureSchema.hpp"
#include "cbb/model/IStateClassifier.hpp"

namespace cbb::model {

/**
 * @brief Feature names and order must match exactly.
 * @return kSchemaMismatch naming the count difference or the first
 *         differing position.
 */
[[nodiscard]] core::ExpectedVoid validateSchema(const ModelSchema &trained,
                                                const feature::FeatureSchema &features);

} // namespace cbb::model
