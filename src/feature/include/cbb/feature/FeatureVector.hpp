/**
 * @file FeatureVector.hpp
 * @brief Feature values of one owner at one timestamp, in schema order.
 * @author MasterLaplace
 */

#pragma once

#include "cbb/feature/FeatureSchema.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cbb::feature {

/**
 * @brief Immutable feature vector keyed by (owner, t).
 */
class FeatureVector {
public:
    FeatureVector(core::OwnerId owner,
                  core::Timestamp t,
                  std::shared_ptr<const FeatureSchema> schema,
                  std::vector<double> values);

    [[nodiscard]] core::OwnerId owner() const noexcept { return _owner; }
    [[nodiscard]] core::Timestamp t() const noexcept { return _t; }
    [[nodiscard]] const FeatureSchema &schema() const noexcept { return *_schema; }
    [[nodiscard]] const std::shared_ptr<const FeatureSchema> &schemaPtr() const noexcept { return _schema; }

    [[nodiscard]] core::usize size() const noexcept { return _values.size(); }
    [[nodiscard]] std::span<const double> values() const noexcept { return _values; }
    [[nodiscard]] double operator[](core::usize index) const { return _values.at(index); }

    /**
     * @brief Value of the feature named @p name, if the schema has it.
     */
    [[nodiscard]] std::optional<double> value(std::string_view name) const noexcept;

    /**
     * @brief True if no value is missing.
     */
    [[nodiscard]] bool isComplete() const noexcept;

    /// Same key, same schema names and bit-identical values (missing equals missing).
    [[nodiscard]] bool operator==(const FeatureVector &other) const noexcept;

private:
    core::OwnerId _owner;
    core::Timestamp _t;
    std::shared_ptr<const FeatureSchema> _schema;
    std::vector<double> _values;
};

/**
 * @brief Element-wise bit equality of two value rows.
 *
 * Unlike operator== on double, two NaN with the same bit pattern compare
 * equal, so rows holding missing values can still be checked for identity.
 */
[[nodiscard]] bool identicalValues(std::span<const double> lhs, std::span<const double> rhs) noexcept;

} // namespace cbb::feature
