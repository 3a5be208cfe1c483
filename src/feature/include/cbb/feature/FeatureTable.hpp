/**
 * @file FeatureTable.hpp
 * @brief Per-owner matrix of feature values with imputation bookkeeping.
 * @author MasterLaplace
 *
 * Row r holds the features at the r-th sample (0-based) of the owner's
 * series; columns follow the schema. Cells filled by the edge-fill policy
 * are flagged in the imputed mask. A row is usable when none of its cells
 * is missing after the fill. The table is read-only once built and is
 * shared between sessions.
 *
 * @see WindowedFeatureExtractor
 */

#pragma once

#include "cbb/feature/FeatureVector.hpp"
#include "cbb/series/Series.hpp"

#include <Eigen/Dense>

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace cbb::feature {

/**
 * @brief Immutable N x F feature matrix of one owner.
 */
class FeatureTable {
public:
    using Mask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;

    FeatureTable(std::shared_ptr<const series::OwnerSeries> series,
                 std::shared_ptr<const FeatureSchema> schema,
                 Eigen::MatrixXd values,
                 Mask imputed);

    [[nodiscard]] core::OwnerId owner() const noexcept { return _series->owner(); }
    [[nodiscard]] core::usize rows() const noexcept { return static_cast<core::usize>(_values.rows()); }
    [[nodiscard]] core::usize cols() const noexcept { return static_cast<core::usize>(_values.cols()); }

    [[nodiscard]] const series::OwnerSeries &ownerSeries() const noexcept { return *_series; }
    [[nodiscard]] const FeatureSchema &schema() const noexcept { return *_schema; }
    [[nodiscard]] const std::shared_ptr<const FeatureSchema> &schemaPtr() const noexcept { return _schema; }

    [[nodiscard]] const Eigen::MatrixXd &values() const noexcept { return _values; }
    [[nodiscard]] double value(core::usize row, core::usize col) const { return _values(row, col); }
    [[nodiscard]] bool isImputed(core::usize row, core::usize col) const { return _imputed(row, col); }
    [[nodiscard]] const Mask &imputed() const noexcept { return _imputed; }

    [[nodiscard]] bool isUsable(core::usize row) const { return _usable.at(row); }
    [[nodiscard]] core::usize usableRows() const noexcept { return _usableCount; }

    /// Timestamp of row @p row.
    [[nodiscard]] core::Timestamp timestamp(core::usize row) const { return _series->at(row).t; }

    /// Raw channel values of row @p row, series channel order.
    [[nodiscard]] std::span<const double> rawValues(core::usize row) const
    {
        return _series->at(row).values;
    }

    [[nodiscard]] const std::optional<std::string> &label(core::usize row) const
    {
        return _series->at(row).label;
    }

    /// Row holding timestamp @p t, if any.
    [[nodiscard]] std::optional<core::usize> rowOf(core::Timestamp t) const noexcept
    {
        return _series->rowOf(t);
    }

    /**
     * @brief Copies row @p row into a FeatureVector.
     */
    [[nodiscard]] FeatureVector vectorAt(core::usize row) const;

private:
    std::shared_ptr<const series::OwnerSeries> _series;
    std::shared_ptr<const FeatureSchema> _schema;
    Eigen::MatrixXd _values;
    Mask _imputed;
    std::vector<bool> _usable;
    core::usize _usableCount = 0;
};

} // namespace cbb::feature
