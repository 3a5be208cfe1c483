/**
 * @file CsvSeriesReader.hpp
 * @brief Loads a recording from a headered CSV file into a SeriesSet.
 * @author MasterLaplace
 *
 * The first non-comment line is the header. Columns are matched by name,
 * so their order in the file is free and unused columns are ignored.
 * Rows are grouped per owner and sorted by timestamp.
 *
 * Recovery is row-local: a row whose owner or timestamp cannot be parsed,
 * or that has too few fields, is excluded with a warning. A channel value
 * that is empty, "NA", unparsable or outside its configured range is
 * stored as missing. A repeated (owner, t) keeps the first row in file
 * order. Missing file, missing required column and empty input are fatal.
 *
 * @see Series
 */

#pragma once

#include "cbb/series/Series.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbb::series {

/**
 * @brief Column mapping of the input file.
 */
struct CsvSeriesLayout {
    std::string ownerColumn = "surgeon_id";
    std::string timeColumn = "timestamp";
    /// Ground-truth label column; absent from the file is not an error.
    std::optional<std::string> labelColumn = "cognitive_state";
    std::vector<ChannelSpec> channels;
};

/**
 * @brief Counters filled by the last read.
 */
struct CsvReadReport {
    core::usize rowsRead = 0;
    core::usize rowsExcluded = 0;
    core::usize duplicatesDropped = 0;
    core::usize valuesMasked = 0;
    bool labelled = false;
};

/**
 * @brief CSV recording loader.
 */
class CsvSeriesReader {
public:
    explicit CsvSeriesReader(CsvSeriesLayout layout);

    /**
     * @brief Reads and groups the file at @p path.
     * @return The recording, or kFileNotFound, kMissingColumn, kEmptyInput.
     */
    [[nodiscard]] core::Expected<SeriesSet> read(const std::string &path);

    /**
     * @brief Same as read(), from an already opened stream.
     * @param sourceName Used in log and error messages only.
     */
    [[nodiscard]] core::Expected<SeriesSet> parse(std::istream &in, std::string_view sourceName);

    [[nodiscard]] const CsvReadReport &report() const noexcept { return _report; }
    [[nodiscard]] const CsvSeriesLayout &layout() const noexcept { return _layout; }

private:
    CsvSeriesLayout _layout;
    CsvReadReport _report;
};

/**
 * @brief Splits one CSV line, trimming blanks and surrounding double quotes.
 */
[[nodiscard]] std::vector<std::string> splitCsvLine(std::string_view line);

} // namespace cbb::series
