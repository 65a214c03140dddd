#pragma once

#include <codelang/core_types.hpp>
#include <codelang/result.hpp>
#include <codelang/vocabulary.hpp>

#include <string>
#include <vector>

namespace codelang {

/**
 * Per-call token frequencies over vocabulary ids.
 *
 * Dense: one slot per vocabulary entry. Each recognized token adds
 * FREQUENCY_SCALE / T to its slot, where T counts every token
 * (recognized or not), so the total is FREQUENCY_SCALE times the
 * recognized fraction.
 */
class FrequencyVector {
public:
    explicit FrequencyVector(size_t dimension = 0);

    // 0.0 for ids outside the vector
    double get(FeatureId id) const;

    void add(FeatureId id, double amount);

    double total() const;
    size_t dimension() const { return values_.size(); }

    // Number of ids with a non-zero entry
    size_t non_zero() const;

    size_t token_count() const { return token_count_; }
    size_t recognized_count() const { return recognized_count_; }

    const std::vector<double>& values() const { return values_; }

private:
    friend Result<FrequencyVector> vectorize(const std::vector<std::string>& tokens,
                                             const Vocabulary& vocabulary);

    std::vector<double> values_;
    size_t token_count_ = 0;
    size_t recognized_count_ = 0;
};

/**
 * Build the frequency vector of a token stream.
 *
 * An empty stream has no defined increment and is rejected with
 * EMPTY_INPUT.
 */
Result<FrequencyVector> vectorize(const std::vector<std::string>& tokens,
                                  const Vocabulary& vocabulary);

}  // namespace codelang
