/**
 * @file ModelArtifact.hpp
 * @brief Loader for trained tree-ensemble artifacts (JSON).
 * @author MasterLaplace
 *
 * Document layout:
 * @code
 * { "format": "cbb-tree-ensemble", "version": 1,
 *   "objective": "multi:softprob", "num_class": 4, "base_score": 0.5,
 *   "feature_names": ["tonic_pupil_level_30s", ...],
 *   "labels": {"Optimal": 0, "HighLoad": 1, "Fatigued": 2, "AttentionalLapse": 3},
 *   "trees": [ {"class": 0, "nodes": [
 *       {"id": 0, "split": 2, "threshold": 1.5, "yes": 1, "no": 2, "missing": 1},
 *       {"id": 1, "leaf": 0.3},
 *       {"id": 2, "leaf": -0.1} ]} ] }
 * @endcode
 *
 * Node ids are dense and equal to their position; children always have a
 * larger id than their parent, so every tree is acyclic. "missing"
 * defaults to "yes".
 */

#pragma once

#include "cbb/core/Expected.hpp"
#include "cbb/model/TreeEnsembleClassifier.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cbb::model {

class ModelArtifact {
public:
    ModelArtifact() = delete;

    static constexpr std::string_view kFormatTag = "cbb-tree-ensemble";
    static constexpr int kFormatVersion = 1;

    /**
     * @brief Reads and validates the artifact at @p path.
     * @return kFileNotFound, kArtifactMalformed or kLabelMappingMismatch on failure.
     */
    [[nodiscard]] static core::Expected<std::shared_ptr<const TreeEnsembleClassifier>> load(
        const std::string &path);

    /**
     * @brief Validates an in-memory artifact document.
     */
    [[nodiscard]] static core::Expected<std::shared_ptr<const TreeEnsembleClassifier>> parse(
        std::string_view document,
        std::string_view sourceName = "<memory>");
};

} // namespace cbb::model
