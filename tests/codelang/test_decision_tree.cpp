#include <gtest/gtest.h>
#include <codelang/decision_tree.hpp>

#include <limits>

using namespace codelang;

namespace {

// root: f0 <= 10 ? leaf(0, 0.5) : (f1 <= 0 ? leaf(1, 0.7) : leaf(2, 0.9))
std::vector<Node> sample_nodes() {
    return {
        InternalNode{0, 10.0, 1, 2},
        LeafNode{0, 0.5},
        InternalNode{1, 0.0, 3, 4},
        LeafNode{1, 0.7},
        LeafNode{2, 0.9},
    };
}

}  // namespace

TEST(DecisionTreeTest, ThresholdEqualGoesLeft) {
    auto tree = DecisionTree::create(sample_nodes());
    ASSERT_TRUE(tree.ok()) << tree.error().to_string();

    FrequencyVector vector(2);
    vector.add(0, 10.0);

    Vote vote = tree.value().evaluate(vector);
    EXPECT_EQ(vote.label, 0u);
    EXPECT_DOUBLE_EQ(vote.weight, 0.5);
}

TEST(DecisionTreeTest, AboveThresholdGoesRight) {
    auto tree = DecisionTree::create(sample_nodes());
    ASSERT_TRUE(tree.ok());

    FrequencyVector absent_f1(2);
    absent_f1.add(0, 10.5);
    EXPECT_EQ(tree.value().evaluate(absent_f1).label, 1u);

    FrequencyVector present_f1(2);
    present_f1.add(0, 50.0);
    present_f1.add(1, 0.25);
    Vote vote = tree.value().evaluate(present_f1);
    EXPECT_EQ(vote.label, 2u);
    EXPECT_DOUBLE_EQ(vote.weight, 0.9);
}

TEST(DecisionTreeTest, MissingFeatureReadsAsZero) {
    auto tree = DecisionTree::create(sample_nodes());
    ASSERT_TRUE(tree.ok());

    FrequencyVector empty(0);
    EXPECT_EQ(tree.value().evaluate(empty).label, 0u);
}

TEST(DecisionTreeTest, SingleLeafTree) {
    auto tree = DecisionTree::create({LeafNode{3, 1.25}});
    ASSERT_TRUE(tree.ok());

    Vote vote = tree.value().evaluate(FrequencyVector(4));
    EXPECT_EQ(vote.label, 3u);
    EXPECT_DOUBLE_EQ(vote.weight, 1.25);
    EXPECT_EQ(tree.value().depth(), 1u);
}

TEST(DecisionTreeTest, Shape) {
    auto tree = DecisionTree::create(sample_nodes());
    ASSERT_TRUE(tree.ok());

    EXPECT_EQ(tree.value().node_count(), 5u);
    EXPECT_EQ(tree.value().leaf_count(), 3u);
    EXPECT_EQ(tree.value().depth(), 3u);
}

TEST(DecisionTreeTest, RejectsEmptyTree) {
    auto tree = DecisionTree::create({});
    ASSERT_FALSE(tree.ok());
    EXPECT_EQ(tree.error_code(), ErrorCode::MALFORMED_MODEL);
}

TEST(DecisionTreeTest, RejectsBackwardChild) {
    std::vector<Node> nodes = {
        InternalNode{0, 0.0, 1, 2},
        InternalNode{0, 0.0, 0, 2},  // points back at the root
        LeafNode{0, 1.0},
    };
    EXPECT_EQ(DecisionTree::create(nodes).error_code(), ErrorCode::MALFORMED_MODEL);
}

TEST(DecisionTreeTest, RejectsChildOutOfRange) {
    std::vector<Node> nodes = {
        InternalNode{0, 0.0, 1, 5},
        LeafNode{0, 1.0},
    };
    EXPECT_EQ(DecisionTree::create(nodes).error_code(), ErrorCode::MALFORMED_MODEL);
}

TEST(DecisionTreeTest, RejectsNonFiniteNumbers) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    std::vector<Node> bad_threshold = {
        InternalNode{0, nan, 1, 2}, LeafNode{0, 1.0}, LeafNode{1, 1.0},
    };
    EXPECT_EQ(DecisionTree::create(bad_threshold).error_code(), ErrorCode::MALFORMED_MODEL);

    std::vector<Node> bad_weight = {LeafNode{0, inf}};
    EXPECT_EQ(DecisionTree::create(bad_weight).error_code(), ErrorCode::MALFORMED_MODEL);
}
