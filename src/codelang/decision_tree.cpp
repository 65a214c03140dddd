#include <codelang/decision_tree.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace codelang {

Result<DecisionTree> DecisionTree::create(std::vector<Node> nodes) {
    if (nodes.empty()) {
        return Error(ErrorCode::MALFORMED_MODEL, "Decision tree has no nodes");
    }

    const size_t count = nodes.size();
    for (size_t i = 0; i < count; ++i) {
        if (const auto* internal = std::get_if<InternalNode>(&nodes[i])) {
            if (internal->left <= i || internal->left >= count ||
                internal->right <= i || internal->right >= count) {
                return Error(ErrorCode::MALFORMED_MODEL,
                             "Node " + std::to_string(i) + " has an invalid child index");
            }
            if (!std::isfinite(internal->threshold)) {
                return Error(ErrorCode::MALFORMED_MODEL,
                             "Node " + std::to_string(i) + " has a non-finite threshold");
            }
        } else {
            const auto& leaf = std::get<LeafNode>(nodes[i]);
            if (!std::isfinite(leaf.weight)) {
                return Error(ErrorCode::MALFORMED_MODEL,
                             "Leaf " + std::to_string(i) + " has a non-finite weight");
            }
        }
    }

    return DecisionTree(std::move(nodes));
}

Vote DecisionTree::evaluate(const FrequencyVector& vector) const {
    NodeIndex index = 0;

    while (const auto* internal = std::get_if<InternalNode>(&nodes_[index])) {
        double value = vector.get(internal->feature);
        index = (value <= internal->threshold) ? internal->left : internal->right;
    }

    const auto& leaf = std::get<LeafNode>(nodes_[index]);
    return Vote{leaf.label, leaf.weight};
}

size_t DecisionTree::leaf_count() const {
    return static_cast<size_t>(
        std::count_if(nodes_.begin(), nodes_.end(),
                      [](const Node& n) { return std::holds_alternative<LeafNode>(n); }));
}

size_t DecisionTree::depth() const {
    if (nodes_.empty()) {
        return 0;
    }

    // Children follow parents, so one forward pass settles every depth
    std::vector<size_t> level(nodes_.size(), 0);
    level[0] = 1;
    size_t deepest = 1;

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (level[i] == 0) {
            continue;  // unreachable node
        }
        deepest = std::max(deepest, level[i]);
        if (const auto* internal = std::get_if<InternalNode>(&nodes_[i])) {
            level[internal->left] = std::max(level[internal->left], level[i] + 1);
            level[internal->right] = std::max(level[internal->right], level[i] + 1);
        }
    }

    return deepest;
}

}  // namespace codelang
