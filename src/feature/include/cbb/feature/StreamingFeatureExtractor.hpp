/**
 * @file StreamingFeatureExtractor.hpp
 * @brief Incremental, per-sample feature extraction.
 * @author MasterLaplace
 *
 * Keeps a bounded history per owner and channel in a
 * boost::circular_buffer sized to the schema's largest warm-up, which is
 * exactly the number of samples any aggregation looks back over.
 *
 * From a feature's first defined value on, push() returns the same value
 * as the batch extractor; on gap-free input that is every position at or
 * past the warm-up. Before that first value the streaming path cannot look
 * ahead, so the value is missing (NaN).
 *
 * @see WindowedFeatureExtractor
 */

#pragma once

#include "cbb/feature/FeatureVector.hpp"
#include "cbb/series/Series.hpp"

#include <boost/circular_buffer.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cbb::feature {

/**
 * @brief Stateful streaming extractor; one instance serves many owners.
 */
class StreamingFeatureExtractor {
public:
    /**
     * @brief Binds @p schema to the channel layout of incoming samples.
     * @return kInvalidFeatureSpec if a feature references an unknown channel.
     */
    [[nodiscard]] static core::Expected<StreamingFeatureExtractor> create(
        std::shared_ptr<const FeatureSchema> schema,
        std::vector<std::string> channels);

    /**
     * @brief Appends one sample of @p owner and returns its feature vector.
     *
     * @return kOutOfOrderSample if @p sample.t is not after the owner's last
     *         timestamp (history untouched), kInvalidArgument on a wrong
     *         number of channel values.
     */
    [[nodiscard]] core::Expected<FeatureVector> push(core::OwnerId owner, const series::Sample &sample);

    /// Forgets the history of @p owner.
    void resetOwner(core::OwnerId owner);

    /// Forgets every owner.
    void reset() noexcept { _owners.clear(); }

    [[nodiscard]] core::usize samplesSeen(core::OwnerId owner) const noexcept;
    [[nodiscard]] core::usize historyCapacity() const noexcept { return _capacity; }

private:
    struct OwnerState {
        std::vector<boost::circular_buffer<double>> history;
        std::vector<double> lastDefined;
        core::Timestamp lastT = 0;
        core::usize seen = 0;
    };

    StreamingFeatureExtractor(std::shared_ptr<const FeatureSchema> schema,
                              std::vector<std::string> channels,
                              std::vector<core::usize> channelOf);

    [[nodiscard]] OwnerState makeState() const;

    std::shared_ptr<const FeatureSchema> _schema;
    std::vector<std::string> _channels;
    std::vector<core::usize> _channelOf;
    core::usize _capacity;
    std::map<core::OwnerId, OwnerState> _owners;
};

} // namespace cbb::feature
