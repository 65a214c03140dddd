#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace codelang {

// Vocabulary-assigned handle for a token, indexes frequency vectors
using FeatureId = uint32_t;

// Classifier output handle, resolved through the label table
using LabelId = uint32_t;

// Index of a node inside a decision tree's flat node array
using NodeIndex = uint32_t;

constexpr FeatureId INVALID_FEATURE_ID = std::numeric_limits<FeatureId>::max();
constexpr LabelId INVALID_LABEL_ID = std::numeric_limits<LabelId>::max();

// Total mass of a frequency vector when every token is recognized
constexpr double FREQUENCY_SCALE = 1000.0;

// Separator placed between the two singles of a bigram token
constexpr char BIGRAM_SEPARATOR = ' ';

}  // namespace codelang
