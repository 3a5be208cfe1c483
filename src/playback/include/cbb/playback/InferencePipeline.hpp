/**
 * @file InferencePipeline.hpp
 * @brief Read-only composition of feature tables, classifier and rationale engine.
 * @author MasterLaplace
 *
 * create() runs every fatal check before any snapshot can be served:
 * channel binding, classifier schema, rule table, then feature
 * extraction. Once built, the pipeline never changes and may be shared by
 * any number of sessions.
 */

#pragma once

#include "cbb/explain/RationaleEngine.hpp"
#include "cbb/feature/WindowedFeatureExtractor.hpp"
#include "cbb/model/IStateClassifier.hpp"
#include "cbb/playback/Snapshot.hpp"

#include <map>
#include <memory>
#include <vector>

namespace cbb::playback {

class InferencePipeline {
public:
    /**
     * @brief Builds the pipeline and precomputes every owner's features.
     *
     * @return kInvalidFeatureSpec, kSchemaMismatch, kInvalidRuleTable or
     *         kWindowExceedsSeries on a configuration error.
     */
    [[nodiscard]] static core::Expected<std::shared_ptr<const InferencePipeline>> create(
        std::shared_ptr<const series::SeriesSet> recordings,
        std::shared_ptr<const feature::FeatureSchema> schema,
        feature::ShortSeriesPolicy policy,
        std::shared_ptr<const model::IStateClassifier> classifier,
        explain::RuleTable rules);

    /**
     * @brief Snapshot of @p owner at the 1-based position @p cursor.
     * @return kNotFound, kOutOfRange or kRowUnusable.
     */
    [[nodiscard]] core::Expected<Snapshot> snapshot(core::OwnerId owner, core::usize cursor) const;

    /// Feature table of @p owner, nullptr if the owner was not kept.
    [[nodiscard]] std::shared_ptr<const feature::FeatureTable> table(core::OwnerId owner) const;

    [[nodiscard]] const std::vector<std::shared_ptr<const feature::FeatureTable>> &tables() const noexcept
    {
        return _tables;
    }

    [[nodiscard]] std::vector<core::OwnerId> owners() const;
    [[nodiscard]] const model::IStateClassifier &classifier() const noexcept { return *_classifier; }
    [[nodiscard]] const feature::FeatureSchema &schema() const noexcept { return *_schema; }

private:
    InferencePipeline(std::shared_ptr<const feature::FeatureSchema> schema,
                      std::shared_ptr<const model::IStateClassifier> classifier,
                      explain::RationaleEngine rationale,
                      std::vector<std::shared_ptr<const feature::FeatureTable>> tables);

    std::shared_ptr<const feature::FeatureSchema> _schema;
    std::shared_ptr<const model::IStateClassifier> _classifier;
    explain::RationaleEngine _rationale;
    std::vector<std::shared_ptr<const feature::FeatureTable>> _tables;
    std::map<core::OwnerId, std::size_t> _index;
};

} // namespace cbb::playback
