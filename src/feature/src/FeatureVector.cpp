/**
 * @file FeatureVector.cpp
 * @brief Implementation of FeatureVector.
 * @author MasterLaplace
 */

#include "cbb/feature/FeatureVector.hpp"

#include "cbb/core/Assert.hpp"

#include <algorithm>
#include <bit>
#include <cmath>

namespace cbb::feature {

FeatureVector::FeatureVector(core::OwnerId owner,
                             core::Timestamp t,
                             std::shared_ptr<const FeatureSchema> schema,
                             std::vector<double> values)
    : _owner(owner), _t(t), _schema(std::move(schema)), _values(std::move(values))
{
    CBB_ASSERT(_schema && _schema->size() == _values.size());
}

std::optional<double> FeatureVector::value(std::string_view name) const noexcept
{
    const auto index = _schema->indexOf(name);
    if (!index)
        return std::nullopt;
    return _values[*index];
}

bool FeatureVector::isComplete() const noexcept
{
    return std::none_of(_values.begin(), _values.end(), [](double v) { return std::isnan(v); });
}

bool FeatureVector::operator==(const FeatureVector &other) const noexcept
{
    return _owner == other._owner && _t == other._t && _schema->names() == other._schema->names()
        && identicalValues(_values, other._values);
}

bool identicalValues(std::span<const double> lhs, std::span<const double> rhs) noexcept
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](double a, double b) {
        return std::bit_cast<core::u64>(a) == std::bit_cast<core::u64>(b);
    });
}

} // namespace cbb::feature
