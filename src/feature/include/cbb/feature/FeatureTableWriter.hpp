/**
 * @file FeatureTableWriter.hpp
 * @brief CSV export of feature tables for offline training.
 * @author MasterLaplace
 *
 * Layout: owner_id, t, raw channels, features, then label when any table
 * is labelled. Unusable rows are skipped.
 */

#pragma once

#include "cbb/feature/FeatureTable.hpp"

#include <iosfwd>
#include <memory>
#include <span>
#include <string>

namespace cbb::feature {

class FeatureTableWriter {
public:
    FeatureTableWriter() = delete;

    /**
     * @brief Writes @p tables to @p path.
     * @return Number of rows written, or kIoError.
     */
    [[nodiscard]] static core::Expected<core::usize> write(
        const std::string &path,
        std::span<const std::shared_ptr<const FeatureTable>> tables);

    /**
     * @brief Writes @p tables to an open stream.
     */
    [[nodiscard]] static core::Expected<core::usize> write(
        std::ostream &out,
        std::span<const std::shared_ptr<const FeatureTable>> tables);
};

} // namespace cbb::feature
