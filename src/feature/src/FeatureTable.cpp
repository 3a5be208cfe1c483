/**
 * @file FeatureTable.cpp
 * @brief Implementation of FeatureTable.
 * @author MasterLaplace
 */

#include "cbb/feature/FeatureTable.hpp"

#include "cbb/core/Assert.hpp"

namespace cbb::feature {

FeatureTable::FeatureTable(std::shared_ptr<const series::OwnerSeries> series,
                           std::shared_ptr<const FeatureSchema> schema,
                           Eigen::MatrixXd values,
                           Mask imputed)
    : _series(std::move(series)),
      _schema(std::move(schema)),
      _values(std::move(values)),
      _imputed(std::move(imputed))
{
    CBB_ASSERT(static_cast<core::usize>(_values.rows()) == _series->size());
    CBB_ASSERT(static_cast<core::usize>(_values.cols()) == _schema->size());
    CBB_ASSERT(_imputed.rows() == _values.rows() && _imputed.cols() == _values.cols());

    _usable.resize(rows());
    for (Eigen::Index r = 0; r < _values.rows(); ++r) {
        const bool usable = !_values.row(r).array().isNaN().any();
        _usable[static_cast<std::size_t>(r)] = usable;
        if (usable)
            ++_usableCount;
    }
}

FeatureVector FeatureTable::vectorAt(core::usize row) const
{
    CBB_VERIFY(row < rows());

    std::vector<double> values(cols());
    for (std::size_t c = 0; c < values.size(); ++c)
        values[c] = _values(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(c));

    return FeatureVector(owner(), timestamp(row), _schema, std::move(values));
}

} // namespace cbb::feature
