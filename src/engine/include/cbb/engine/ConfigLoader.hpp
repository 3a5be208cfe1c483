// /////////////////////////////////////////////////////////////////////////////
/// @file ConfigLoader.hpp
/// @brief Reads a Config from a JSON document.
///
/// Every key is optional and overrides the corresponding default:
/// @code
/// { "input": "data/recording.csv", "model": "model.json",
///   "columns":  {"owner": "surgeon_id", "time": "timestamp", "label": "cognitive_state"},
///   "channels": [{"name": "pupil_diameter_mm", "min": 1, "max": 10}],
///   "features": [{"name": "tonic_pupil_level_30s", "channel": "pupil_diameter_mm",
///                 "kind": "mean", "window": 30}],
///   "playback": {"allowed_speeds": [1, 10, 50, 100], "default_speed": 1,
///                "duration_bound": 10800, "tick_period_ms": 1000, "owner": 1},
///   "rationale": {"HighLoad": {"headline": "...",
///                 "rules": [{"source": "phasic_pupil_change_5s", "direction": "above",
///                            "threshold": 0.1, "template": "... {value} ...", "precision": 3}]}},
///   "short_series_policy": "fail", "log_level": "info" }
/// @endcode
///
/// Relative "input" and "model" paths are resolved against the directory
/// of the configuration file. A state listed under "rationale" replaces
/// that state's rules entirely; the other states keep their defaults.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include "cbb/engine/Config.hpp"

#include <string>
#include <string_view>

namespace cbb::engine {

class ConfigLoader final
{
public:
    ConfigLoader() = delete;

    /// @brief Load and validate the configuration at @p path.
    /// @return kFileNotFound, kFileParseError or kInvalidConfig on failure.
    [[nodiscard]] static core::Expected<Config> fromFile(const std::string& path);

    /// @brief Parse an in-memory document.
    /// @param baseDir Directory relative paths are resolved against.
    [[nodiscard]] static core::Expected<Config> fromJson(std::string_view document,
                                                         const std::string& baseDir = {});
};

} // namespace cbb::engine
