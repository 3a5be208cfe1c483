/**
 * @file FeatureTableWriter.cpp
 * @brief Implementation of the feature CSV export.
 * @author MasterLaplace
 */

#include "cbb/feature/FeatureTableWriter.hpp"

#include "cbb/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <ostream>

namespace cbb::feature {

namespace {

std::string formatNumber(double v)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.6g", v);
    return buffer;
}

} // namespace

core::Expected<core::usize> FeatureTableWriter::write(
    const std::string &path,
    std::span<const std::shared_ptr<const FeatureTable>> tables)
{
    std::ofstream file(path);
    if (!file.is_open()) {
        return core::makeError(core::ErrorCode::kIoError, "cannot open " + path + " for writing");
    }

    const auto rows = CBB_TRY(write(file, tables));
    file.flush();
    if (!file) {
        return core::makeError(core::ErrorCode::kIoError, "write failed on " + path);
    }

    core::Log::info("feature", "exported " + std::to_string(rows) + " row(s) to " + path);
    return rows;
}

core::Expected<core::usize> FeatureTableWriter::write(
    std::ostream &out,
    std::span<const std::shared_ptr<const FeatureTable>> tables)
{
    if (tables.empty()) {
        return core::makeError(core::ErrorCode::kInvalidArgument, "nothing to export");
    }

    const auto &first = *tables.front();
    const bool labelled = std::any_of(tables.begin(), tables.end(),
                                      [](const auto &t) { return t->ownerSeries().hasLabels(); });

    out << "owner_id,t";
    for (const auto &channel : first.ownerSeries().channels())
        out << ',' << channel;
    for (const auto &name : first.schema().names())
        out << ',' << name;
    if (labelled)
        out << ",label";
    out << '\n';

    core::usize written = 0;
    for (const auto &table : tables) {
        if (table->schema().names() != first.schema().names()) {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                "owner " + std::to_string(table->owner()) + " uses a different feature schema");
        }

        for (core::usize r = 0; r < table->rows(); ++r) {
            if (!table->isUsable(r))
                continue;

            out << table->owner() << ',' << table->timestamp(r);
            for (const double v : table->rawValues(r))
                out << ',' << (std::isnan(v) ? std::string("NA") : formatNumber(v));
            for (core::usize c = 0; c < table->cols(); ++c)
                out << ',' << formatNumber(table->value(r, c));
            if (labelled)
                out << ',' << table->label(r).value_or("NA");
            out << '\n';
            ++written;
        }
    }

    if (!out) {
        return core::makeError(core::ErrorCode::kIoError, "stream write failed");
    }
    return written;
}

} // namespace cbb::feature
