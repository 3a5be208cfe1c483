/**
 * @file Snapshot.hpp
 * @brief One consistent (features, prediction, rationale) tuple at a cursor.
 * @author MasterLaplace
 */

#pragma once

#include "cbb/explain/RationaleEngine.hpp"
#include "cbb/feature/FeatureVector.hpp"
#include "cbb/model/Prediction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cbb::playback {

/**
 * @brief Everything a consumer renders for one tick.
 *
 * All members are computed from the same row, so a snapshot is never a
 * mix of two cursors.
 */
struct Snapshot {
    core::OwnerId owner = 0;
    core::usize cursor = 1;
    core::Timestamp t = 0;
    feature::FeatureVector features;
    model::Prediction prediction;
    explain::Rationale rationale;
    std::vector<double> raw;
    /// Ground-truth state, when the recording is labelled.
    std::optional<std::string> label;

    /// Field-wise; raw values compare bitwise so masked channels match.
    bool operator==(const Snapshot &other) const
    {
        return owner == other.owner && cursor == other.cursor && t == other.t && features == other.features
            && prediction == other.prediction && rationale == other.rationale
            && feature::identicalValues(raw, other.raw) && label == other.label;
    }
};

} // namespace cbb::playback
