/**
 * @file Series.hpp
 * @brief Owner-keyed raw time series: Sample, OwnerSeries, SeriesSet.
 * @author MasterLaplace
 *
 * A Sample is one time-indexed observation of every channel for one owner.
 * An OwnerSeries holds the samples of a single owner in strictly increasing
 * timestamp order and is immutable once built. A SeriesSet groups the owners
 * of one recording; owners never share mutable state, so each series can be
 * windowed independently.
 *
 * Missing channel values (malformed or out-of-range readings) are stored as
 * quiet NaN so that window computations can detect them.
 *
 * @see CsvSeriesReader
 */

#pragma once

#include "cbb/core/Expected.hpp"
#include "cbb/core/Types.hpp"

#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cbb::series {

/// @brief Marker stored for a missing channel value.
inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief Closed validity range of a raw channel.
 */
struct ChannelRange {
    double min = -std::numeric_limits<double>::infinity();
    double max = std::numeric_limits<double>::infinity();

    [[nodiscard]] bool contains(double v) const noexcept { return v >= min && v <= max; }
};

/**
 * @brief Declares a raw channel column and its optional validity range.
 */
struct ChannelSpec {
    std::string name;
    std::optional<ChannelRange> range;
};

/**
 * @brief One observation of every channel at second @c t.
 */
struct Sample {
    core::Timestamp t = 0;
    std::vector<double> values;
    std::optional<std::string> label;
};

/**
 * @brief Ordered, immutable series of one owner.
 */
class OwnerSeries {
public:
    /**
     * @brief Builds a series after checking its invariants.
     *
     * @param owner    Owner identifier
     * @param channels Channel names shared by every sample
     * @param samples  Samples sorted by strictly increasing t
     * @return The series, or kInvalidArgument if the samples are unsorted,
     *         duplicated, or have the wrong number of values
     */
    [[nodiscard]] static core::Expected<OwnerSeries> create(
        core::OwnerId owner,
        std::shared_ptr<const std::vector<std::string>> channels,
        std::vector<Sample> samples);

    [[nodiscard]] core::OwnerId owner() const noexcept { return _owner; }
    [[nodiscard]] core::usize size() const noexcept { return _samples.size(); }
    [[nodiscard]] bool empty() const noexcept { return _samples.empty(); }

    [[nodiscard]] const std::vector<Sample> &samples() const noexcept { return _samples; }
    [[nodiscard]] const Sample &at(core::usize row) const { return _samples.at(row); }

    [[nodiscard]] const std::vector<std::string> &channels() const noexcept { return *_channels; }
    [[nodiscard]] const std::shared_ptr<const std::vector<std::string>> &channelList() const noexcept
    {
        return _channels;
    }

    /**
     * @brief Index of a channel, or nullopt if the series has no such channel.
     */
    [[nodiscard]] std::optional<core::usize> channelIndex(std::string_view name) const noexcept;

    /**
     * @brief Row holding timestamp @p t (binary search), if any.
     */
    [[nodiscard]] std::optional<core::usize> rowOf(core::Timestamp t) const noexcept;

    /**
     * @brief Copies one channel into a contiguous column, row order.
     */
    [[nodiscard]] std::vector<double> column(core::usize channel) const;

    /**
     * @brief True if at least one sample carries a ground-truth label.
     */
    [[nodiscard]] bool hasLabels() const noexcept;

private:
    OwnerSeries(core::OwnerId owner,
                std::shared_ptr<const std::vector<std::string>> channels,
                std::vector<Sample> samples);

    core::OwnerId _owner;
    std::shared_ptr<const std::vector<std::string>> _channels;
    std::vector<Sample> _samples;
};

/**
 * @brief All owners of a recording, iterated in ascending owner id.
 */
class SeriesSet {
public:
    using Map = std::map<core::OwnerId, std::shared_ptr<const OwnerSeries>>;

    explicit SeriesSet(std::shared_ptr<const std::vector<std::string>> channels);

    /**
     * @brief Adds a series. Fails if the owner is already present or the
     *        channel list differs from the set's.
     */
    [[nodiscard]] core::ExpectedVoid add(OwnerSeries series);

    [[nodiscard]] std::shared_ptr<const OwnerSeries> find(core::OwnerId owner) const;
    [[nodiscard]] std::vector<core::OwnerId> owners() const;

    [[nodiscard]] core::usize size() const noexcept { return _series.size(); }
    [[nodiscard]] bool empty() const noexcept { return _series.empty(); }
    [[nodiscard]] core::usize totalSamples() const noexcept;

    [[nodiscard]] const std::vector<std::string> &channels() const noexcept { return *_channels; }

    [[nodiscard]] Map::const_iterator begin() const noexcept { return _series.begin(); }
    [[nodiscard]] Map::const_iterator end() const noexcept { return _series.end(); }

private:
    std::shared_ptr<const std::vector<std::string>> _channels;
    Map _series;
};

} // namespace cbb::series
