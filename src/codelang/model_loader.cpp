#include <codelang/model_loader.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace codelang {

using json = nlohmann::json;

namespace {

Error malformed(const std::string& message) {
    return Error(ErrorCode::MALFORMED_MODEL, message);
}

bool is_id(const json& j) {
    return j.is_number_unsigned() &&
           j.get<uint64_t>() <= std::numeric_limits<uint32_t>::max();
}

Result<Vocabulary> parse_vocabulary(const json& section) {
    if (!section.is_array()) {
        return malformed("\"vocabulary\" must be an array");
    }

    std::vector<Vocabulary::Entry> entries;
    entries.reserve(section.size());

    for (size_t i = 0; i < section.size(); ++i) {
        const json& entry = section[i];
        if (!entry.is_array() || entry.size() != 2 ||
            !entry[0].is_string() || !is_id(entry[1])) {
            return malformed("Vocabulary entry " + std::to_string(i) +
                             " is not a [token, id] pair");
        }
        entries.emplace_back(entry[0].get<std::string>(), entry[1].get<FeatureId>());
    }

    return Vocabulary::create(std::move(entries));
}

Result<LabelTable> parse_labels(const json& section) {
    if (!section.is_array()) {
        return malformed("\"labels\" must be an array");
    }

    std::vector<LabelTable::Entry> entries;
    entries.reserve(section.size());

    for (size_t i = 0; i < section.size(); ++i) {
        const json& entry = section[i];
        if (!entry.is_array() || entry.size() != 2 ||
            !is_id(entry[0]) || !entry[1].is_string()) {
            return malformed("Label entry " + std::to_string(i) +
                             " is not an [id, symbol] pair");
        }
        entries.emplace_back(entry[0].get<LabelId>(), entry[1].get<std::string>());
    }

    return LabelTable::create(std::move(entries));
}

// Append the subtree rooted at `j` to `nodes` in pre-order
Result<void> flatten(const json& j, std::vector<Node>& nodes, size_t depth) {
    if (depth > ModelLoader::MAX_TREE_DEPTH) {
        return malformed("Tree deeper than " + std::to_string(ModelLoader::MAX_TREE_DEPTH));
    }
    if (!j.is_array()) {
        return malformed("Tree node is not an array");
    }
    if (nodes.size() >= std::numeric_limits<NodeIndex>::max()) {
        return malformed("Tree has too many nodes");
    }

    if (j.size() == 2) {
        if (!is_id(j[0]) || !j[1].is_number()) {
            return malformed("Leaf must be [label_id, weight]");
        }
        nodes.push_back(LeafNode{j[0].get<LabelId>(), j[1].get<double>()});
        return Ok();
    }

    if (j.size() == 4) {
        if (!is_id(j[0]) || !j[1].is_number()) {
            return malformed("Internal node must be [feature_id, threshold, left, right]");
        }

        const auto self = static_cast<NodeIndex>(nodes.size());
        nodes.push_back(InternalNode{j[0].get<FeatureId>(), j[1].get<double>(), 0, 0});

        const auto left = static_cast<NodeIndex>(nodes.size());
        auto result = flatten(j[2], nodes, depth + 1);
        if (!result.ok()) return result;

        const auto right = static_cast<NodeIndex>(nodes.size());
        result = flatten(j[3], nodes, depth + 1);
        if (!result.ok()) return result;

        auto& internal = std::get<InternalNode>(nodes[self]);
        internal.left = left;
        internal.right = right;
        return Ok();
    }

    return malformed("Tree node has " + std::to_string(j.size()) +
                     " fields, expected 2 (leaf) or 4 (internal)");
}

Result<DecisionTree> parse_tree(const json& j) {
    std::vector<Node> nodes;
    auto result = flatten(j, nodes, 1);
    if (!result.ok()) {
        return result.error();
    }
    return DecisionTree::create(std::move(nodes));
}

Result<std::vector<DecisionTree>> parse_forest(const json& section) {
    if (!section.is_array()) {
        return malformed("\"forest\" must be an array");
    }

    std::vector<DecisionTree> trees;
    trees.reserve(section.size());

    for (size_t i = 0; i < section.size(); ++i) {
        auto tree = parse_tree(section[i]);
        if (!tree.ok()) {
            return malformed("Tree " + std::to_string(i) + ": " + tree.error().message());
        }
        trees.push_back(std::move(tree).value());
    }

    return trees;
}

}  // namespace

ModelLoader::ModelLoader(Logger& logger)
    : logger_(logger) {}

Result<ModelHandle> ModelLoader::parse(const std::string& json_text) const {
    try {
        auto root = json::parse(json_text);

        if (!root.is_object()) {
            return malformed("Model root must be an object");
        }
        for (const char* section : {"vocabulary", "forest", "labels"}) {
            if (!root.contains(section)) {
                return malformed(std::string("Missing \"") + section + "\" section");
            }
        }

        auto vocabulary = parse_vocabulary(root["vocabulary"]);
        if (!vocabulary.ok()) return vocabulary.error();

        auto labels = parse_labels(root["labels"]);
        if (!labels.ok()) return labels.error();

        auto trees = parse_forest(root["forest"]);
        if (!trees.ok()) return trees.error();

        auto forest = Forest::create(std::move(trees).value(), labels.value().size());
        if (!forest.ok()) return forest.error();

        auto model = Model::create(std::move(vocabulary).value(),
                                   std::move(forest).value(),
                                   std::move(labels).value());
        if (!model.ok()) return model.error();

        const Model& m = *model.value();
        size_t nodes = 0;
        std::vector<bool> reachable(m.labels().size(), false);
        for (const auto& tree : m.forest().trees()) {
            nodes += tree.node_count();
            for (const auto& node : tree.nodes()) {
                if (const auto* leaf = std::get_if<LeafNode>(&node)) {
                    reachable[leaf->label] = true;
                }
            }
        }

        std::ostringstream ss;
        ss << "Loaded model: " << m.vocabulary().size() << " tokens, "
           << m.forest().size() << " trees (" << nodes << " nodes), "
           << m.labels().size() << " labels";
        logger_.debug(ss.str());

        for (LabelId id = 0; id < reachable.size(); ++id) {
            if (!reachable[id]) {
                logger_.warning("Label '" + m.labels().symbols()[id] +
                                "' is not reachable from any tree");
            }
        }

        return model;
    } catch (const json::exception& e) {
        return malformed(std::string("Invalid model JSON: ") + e.what());
    }
}

Result<ModelHandle> ModelLoader::load_file(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error(ErrorCode::NOT_FOUND, "Model file not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open model file: " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Failed to read model file: " + path.string());
    }

    logger_.debug("Reading model from " + path.string());
    return parse(ss.str());
}

}  // namespace codelang
