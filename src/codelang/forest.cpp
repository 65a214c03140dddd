#include <codelang/forest.hpp>

#include <algorithm>
#include <string>

namespace codelang {

// ============================================================================
// VoteTally
// ============================================================================

VoteTally::VoteTally(size_t label_count)
    : totals_(label_count, 0.0), seen_(label_count, false) {}

void VoteTally::add(const Vote& vote) {
    if (vote.label >= totals_.size()) {
        return;
    }
    if (!seen_[vote.label]) {
        seen_[vote.label] = true;
        order_.push_back(vote.label);
    }
    totals_[vote.label] += vote.weight;
}

double VoteTally::total(LabelId label) const {
    if (label >= totals_.size()) {
        return 0.0;
    }
    return totals_[label];
}

LabelId VoteTally::winner() const {
    LabelId best = INVALID_LABEL_ID;
    double best_total = 0.0;

    for (LabelId label : order_) {
        if (best == INVALID_LABEL_ID || totals_[label] > best_total) {
            best = label;
            best_total = totals_[label];
        }
    }

    return best;
}

std::vector<std::pair<LabelId, double>> VoteTally::ranked() const {
    std::vector<std::pair<LabelId, double>> result;
    result.reserve(order_.size());
    for (LabelId label : order_) {
        result.emplace_back(label, totals_[label]);
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return result;
}

// ============================================================================
// Forest
// ============================================================================

Result<Forest> Forest::create(std::vector<DecisionTree> trees, size_t label_count) {
    if (trees.empty()) {
        return Error(ErrorCode::MALFORMED_MODEL, "Forest has no trees");
    }

    for (size_t t = 0; t < trees.size(); ++t) {
        for (const auto& node : trees[t].nodes()) {
            const auto* leaf = std::get_if<LeafNode>(&node);
            if (leaf && leaf->label >= label_count) {
                return Error(ErrorCode::MALFORMED_MODEL,
                             "Tree " + std::to_string(t) + " votes for unknown label " +
                             std::to_string(leaf->label));
            }
        }
    }

    return Forest(std::move(trees), label_count);
}

VoteTally Forest::tally(const FrequencyVector& vector) const {
    VoteTally votes(label_count_);
    for (const auto& tree : trees_) {
        votes.add(tree.evaluate(vector));
    }
    return votes;
}

LabelId Forest::predict(const FrequencyVector& vector) const {
    return tally(vector).winner();
}

}  // namespace codelang
