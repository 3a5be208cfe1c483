/**
 * @file SchemaGuard.cpp
 * @brief Implementation of the classifier / feature schema check.
 * @author MasterLaplace
 */

#include "cbb/model/SchemaGuard.hpp"

namespace cbb::model {

core::ExpectedVoid validateSchema(const ModelSchema &trained, const feature::FeatureSchema &features)
{
    const auto &expected = trained.featureNames;
    const auto &actual = features.names();

    if (expected.size() != actual.size()) {
        return core::makeError(core::ErrorCode::kSchemaMismatch,
            "classifier expects " + std::to_string(expected.size()) + " features, pipeline produces "
                + std::to_string(actual.size()));
    }

    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (expected[i] != actual[i]) {
            return core::makeError(core::ErrorCode::kSchemaMismatch,
                "feature " + std::to_string(i) + ": classifier expects '" + expected[i]
                    + "', pipeline produces '" + actual[i] + "'");
        }
    }
    return {};
}

} // namespace cbb::model
