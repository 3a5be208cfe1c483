/**
 * @file InferencePipeline.cpp
 * @brief Implementation of the inference pipeline.
 * @author MasterLaplace
 */

#include "cbb/playback/InferencePipeline.hpp"

#include "cbb/core/Log.hpp"
#include "cbb/model/SchemaGuard.hpp"

namespace cbb::playback {

InferencePipeline::InferencePipeline(std::shared_ptr<const feature::FeatureSchema> schema,
                                     std::shared_ptr<const model::IStateClassifier> classifier,
                                     explain::RationaleEngine rationale,
                                     std::vector<std::shared_ptr<const feature::FeatureTable>> tables)
    : _schema(std::move(schema)),
      _classifier(std::move(classifier)),
      _rationale(std::move(rationale)),
      _tables(std::move(tables))
{
    for (std::size_t i = 0; i < _tables.size(); ++i)
        _index.emplace(_tables[i]->owner(), i);
}

core::Expected<std::shared_ptr<const InferencePipeline>> InferencePipeline::create(
    std::shared_ptr<const series::SeriesSet> recordings,
    std::shared_ptr<const feature::FeatureSchema> schema,
    feature::ShortSeriesPolicy policy,
    std::shared_ptr<const model::IStateClassifier> classifier,
    explain::RuleTable rules)
{
    CBB_TRY_VOID(schema->validateChannels(recordings->channels()));
    CBB_TRY_VOID(model::validateSchema(classifier->schema(), *schema));
    auto rationale = CBB_TRY(explain::RationaleEngine::create(std::move(rules), schema, recordings->channels()));

    const feature::WindowedFeatureExtractor extractor(schema);
    auto tables = CBB_TRY(extractor.extractAll(*recordings, policy));

    core::Log::info("playback", "pipeline ready: " + std::to_string(tables.size()) + " owner(s), classifier "
        + std::string(classifier->name()));

    return std::shared_ptr<const InferencePipeline>(new InferencePipeline(
        std::move(schema), std::move(classifier), std::move(rationale), std::move(tables)));
}

core::Expected<Snapshot> InferencePipeline::snapshot(core::OwnerId owner, core::usize cursor) const
{
    const auto table = this->table(owner);
    if (!table) {
        return core::makeError(core::ErrorCode::kNotFound, "owner " + std::to_string(owner) + " not loaded");
    }
    if (cursor < 1 || cursor > table->rows()) {
        return core::makeError(core::ErrorCode::kOutOfRange,
            "cursor " + std::to_string(cursor) + " outside [1, " + std::to_string(table->rows()) + "]");
    }

    const core::usize row = cursor - 1;
    if (!table->isUsable(row)) {
        return core::makeError(core::ErrorCode::kRowUnusable,
            "owner " + std::to_string(owner) + ": row at cursor " + std::to_string(cursor)
                + " has undefined features");
    }

    auto features = table->vectorAt(row);
    const auto raw = table->rawValues(row);
    const auto prediction = _classifier->predict(features.values());
    auto rationale = _rationale.explain(prediction, features, raw);

    return Snapshot{
        .owner = owner,
        .cursor = cursor,
        .t = table->timestamp(row),
        .features = std::move(features),
        .prediction = prediction,
        .rationale = std::move(rationale),
        .raw = std::vector<double>(raw.begin(), raw.end()),
        .label = table->label(row),
    };
}

std::shared_ptr<const feature::FeatureTable> InferencePipeline::table(core::OwnerId owner) const
{
    const auto it = _index.find(owner);
    return it == _index.end() ? nullptr : _tables[it->second];
}

std::vector<core::OwnerId> InferencePipeline::owners() const
{
    std::vector<core::OwnerId> out;
    out.reserve(_index.size());
    for (const auto &[owner, _] : _index)
        out.push_back(owner);
    return out;
}

} // namespace cbb::playback
