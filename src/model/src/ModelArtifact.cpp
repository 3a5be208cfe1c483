/**
 * @file ModelArtifact.cpp
 * @brief Implementation of the tree-ensemble artifact loader.
 * @author MasterLaplace
 */

#include "cbb/model/ModelArtifact.hpp"

#include "cbb/core/Log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace cbb::model {

namespace {

constexpr std::string_view kTag = "model";

core::Unexpected malformed(std::string_view source, const std::string &what)
{
    return core::makeError(core::ErrorCode::kArtifactMalformed, std::string(source) + ": " + what);
}

core::ExpectedVoid checkLabels(const json &labels, std::string_view source)
{
    if (!labels.is_object()) {
        return malformed(source, "'labels' must be an object");
    }
    if (labels.size() != kStateCount) {
        return core::makeError(core::ErrorCode::kLabelMappingMismatch,
            std::string(source) + ": expected " + std::to_string(kStateCount) + " labels, found "
                + std::to_string(labels.size()));
    }

    for (auto it = labels.begin(); it != labels.end(); ++it) {
        const std::string &name = it.key();
        const json &value = it.value();
        const auto state = parseState(name);
        if (!state) {
            return core::makeError(core::ErrorCode::kLabelMappingMismatch,
                std::string(source) + ": unknown state '" + name + "'");
        }
        if (!value.is_number_integer() || value.get<core::i64>() != static_cast<core::i64>(ordinal(*state))) {
            return core::makeError(core::ErrorCode::kLabelMappingMismatch,
                std::string(source) + ": state '" + name + "' must map to "
                    + std::to_string(ordinal(*state)) + ", artifact says " + value.dump());
        }
    }
    return {};
}

core::Expected<Tree> parseTree(const json &node, std::size_t index, std::size_t featureCount,
                               std::string_view source)
{
    const std::string where = "tree " + std::to_string(index);

    Tree tree;
    const auto classIndex = node.at("class").get<core::i64>();
    if (classIndex < 0 || classIndex >= static_cast<core::i64>(kStateCount)) {
        return malformed(source, where + ": class " + std::to_string(classIndex) + " out of range");
    }
    tree.classIndex = static_cast<core::usize>(classIndex);

    const auto &nodes = node.at("nodes");
    if (!nodes.is_array() || nodes.empty()) {
        return malformed(source, where + ": 'nodes' must be a non-empty array");
    }

    const auto n = static_cast<core::i64>(nodes.size());
    tree.nodes.reserve(nodes.size());

    for (core::i64 i = 0; i < n; ++i) {
        const auto &jn = nodes[static_cast<std::size_t>(i)];
        if (jn.at("id").get<core::i64>() != i) {
            return malformed(source, where + ": node ids must be dense, expected " + std::to_string(i));
        }

        TreeNode out;
        if (jn.contains("leaf")) {
            out.leafValue = jn.at("leaf").get<double>();
            tree.nodes.push_back(out);
            continue;
        }

        const auto split = jn.at("split").get<core::i64>();
        if (split < 0 || split >= static_cast<core::i64>(featureCount)) {
            return malformed(source, where + ", node " + std::to_string(i) + ": split feature "
                + std::to_string(split) + " out of range");
        }
        out.splitFeature = static_cast<core::i32>(split);
        out.threshold = jn.at("threshold").get<double>();

        const auto yes = jn.at("yes").get<core::i64>();
        const auto no = jn.at("no").get<core::i64>();
        const auto missing = jn.value("missing", yes);
        for (const auto child : {yes, no, missing}) {
            if (child <= i || child >= n) {
                return malformed(source, where + ", node " + std::to_string(i) + ": child "
                    + std::to_string(child) + " out of range");
            }
        }
        out.yes = static_cast<core::i32>(yes);
        out.no = static_cast<core::i32>(no);
        out.missing = static_cast<core::i32>(missing);
        tree.nodes.push_back(out);
    }

    return tree;
}

} // namespace

core::Expected<std::shared_ptr<const TreeEnsembleClassifier>> ModelArtifact::load(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return core::makeError(core::ErrorCode::kFileNotFound, path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path);
}

core::Expected<std::shared_ptr<const TreeEnsembleClassifier>> ModelArtifact::parse(
    std::string_view document,
    std::string_view sourceName)
{
    json root;
    try {
        root = json::parse(document);
    } catch (const json::parse_error &e) {
        return malformed(sourceName, e.what());
    }

    if (!root.is_object()) {
        return malformed(sourceName, "document root must be an object");
    }

    try {
        if (root.value("format", std::string{}) != kFormatTag) {
            return malformed(sourceName, "format tag is not '" + std::string(kFormatTag) + "'");
        }
        if (root.value("version", 0) != kFormatVersion) {
            return malformed(sourceName, "unsupported version " + root.value("version", json()).dump());
        }
        if (root.contains("objective") && root.at("objective").get<std::string>() != "multi:softprob") {
            return malformed(sourceName, "unsupported objective '" + root.at("objective").get<std::string>() + "'");
        }
        if (root.at("num_class").get<core::i64>() != static_cast<core::i64>(kStateCount)) {
            return malformed(sourceName, "num_class must be " + std::to_string(kStateCount));
        }

        ModelSchema schema;
        schema.featureNames = root.at("feature_names").get<std::vector<std::string>>();
        if (schema.featureNames.empty()) {
            return malformed(sourceName, "'feature_names' is empty");
        }

        CBB_TRY_VOID(checkLabels(root.at("labels"), sourceName));

        const auto &jtrees = root.at("trees");
        if (!jtrees.is_array() || jtrees.empty()) {
            return malformed(sourceName, "'trees' must be a non-empty array");
        }

        std::vector<Tree> trees;
        trees.reserve(jtrees.size());
        for (std::size_t i = 0; i < jtrees.size(); ++i)
            trees.push_back(CBB_TRY(parseTree(jtrees[i], i, schema.featureNames.size(), sourceName)));

        const double baseScore = root.value("base_score", 0.5);

        core::Log::info(kTag, "loaded " + std::to_string(trees.size()) + " tree(s) over "
            + std::to_string(schema.featureNames.size()) + " feature(s) from " + std::string(sourceName));

        return std::make_shared<const TreeEnsembleClassifier>(std::move(schema), baseScore, std::move(trees));
    } catch (const json::exception &e) {
        return malformed(sourceName, e.what());
    }
}

} // namespace cbb::model
