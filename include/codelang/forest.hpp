#pragma once

#include <codelang/core_types.hpp>
#include <codelang/decision_tree.hpp>
#include <codelang/frequency_vector.hpp>
#include <codelang/result.hpp>

#include <utility>
#include <vector>

namespace codelang {

// ============================================================================
// Vote Tally - accumulated leaf weights per label
// ============================================================================

class VoteTally {
public:
    explicit VoteTally(size_t label_count);

    void add(const Vote& vote);

    double total(LabelId label) const;

    /**
     * Label with the strictly greatest total.
     *
     * Labels are scanned in the order they first received a vote and
     * the best is replaced only by a strictly greater total, so ties go
     * to the label first reached in forest order.
     *
     * INVALID_LABEL_ID if nothing was added.
     */
    LabelId winner() const;

    // (label, total) by descending total, ties in first-seen order
    std::vector<std::pair<LabelId, double>> ranked() const;

    // Labels in the order they first received a vote
    const std::vector<LabelId>& order() const { return order_; }

private:
    std::vector<double> totals_;   // indexed by label id
    std::vector<bool> seen_;
    std::vector<LabelId> order_;
};

// ============================================================================
// Forest - ordered ensemble of decision trees
// ============================================================================

class Forest {
public:
    /**
     * @param trees Trees in ensemble order (order decides ties)
     * @param label_count Size of the label id space leaves vote into
     */
    static Result<Forest> create(std::vector<DecisionTree> trees, size_t label_count);

    // Run every tree and accumulate its vote
    VoteTally tally(const FrequencyVector& vector) const;

    // Winning label of tally()
    LabelId predict(const FrequencyVector& vector) const;

    const std::vector<DecisionTree>& trees() const { return trees_; }
    size_t size() const { return trees_.size(); }
    size_t label_count() const { return label_count_; }

private:
    Forest(std::vector<DecisionTree> trees, size_t label_count)
        : trees_(std::move(trees)), label_count_(label_count) {}

    std::vector<DecisionTree> trees_;
    size_t label_count_ = 0;
};

}  // namespace codelang
