#pragma once

#include <codelang/core_types.hpp>
#include <codelang/frequency_vector.hpp>
#include <codelang/result.hpp>

#include <variant>
#include <vector>

namespace codelang {

// Threshold test: value <= threshold descends left, otherwise right
struct InternalNode {
    FeatureId feature = INVALID_FEATURE_ID;
    double threshold = 0.0;
    NodeIndex left = 0;
    NodeIndex right = 0;
};

// Terminal vote of a tree
struct LeafNode {
    LabelId label = INVALID_LABEL_ID;
    double weight = 0.0;
};

using Node = std::variant<InternalNode, LeafNode>;

// Outcome of evaluating one tree
struct Vote {
    LabelId label = INVALID_LABEL_ID;
    double weight = 0.0;
};

/**
 * A pretrained binary decision tree stored as a flat node array.
 *
 * Node 0 is the root. Children always sit after their parent, which
 * rules out cycles and guarantees evaluation terminates.
 */
class DecisionTree {
public:
    /**
     * Validate and adopt a node array.
     *
     * Fails with MALFORMED_MODEL if the array is empty, a child index
     * is out of range or does not point forward, or a number is not
     * finite.
     */
    static Result<DecisionTree> create(std::vector<Node> nodes);

    // Walk from the root to a leaf
    Vote evaluate(const FrequencyVector& vector) const;

    const std::vector<Node>& nodes() const { return nodes_; }
    size_t node_count() const { return nodes_.size(); }
    size_t leaf_count() const;

    // Number of nodes on the longest root-to-leaf path
    size_t depth() const;

private:
    explicit DecisionTree(std::vector<Node> nodes) : nodes_(std::move(nodes)) {}

    std::vector<Node> nodes_;
};

}  // namespace codelang
