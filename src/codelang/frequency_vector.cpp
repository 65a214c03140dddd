#include <codelang/frequency_vector.hpp>

#include <algorithm>
#include <numeric>

namespace codelang {

FrequencyVector::FrequencyVector(size_t dimension)
    : values_(dimension, 0.0) {}

double FrequencyVector::get(FeatureId id) const {
    if (id >= values_.size()) {
        return 0.0;
    }
    return values_[id];
}

void FrequencyVector::add(FeatureId id, double amount) {
    if (id >= values_.size() || amount <= 0.0) {
        return;
    }
    values_[id] += amount;
}

double FrequencyVector::total() const {
    return std::accumulate(values_.begin(), values_.end(), 0.0);
}

size_t FrequencyVector::non_zero() const {
    return static_cast<size_t>(
        std::count_if(values_.begin(), values_.end(),
                      [](double v) { return v > 0.0; }));
}

Result<FrequencyVector> vectorize(const std::vector<std::string>& tokens,
                                  const Vocabulary& vocabulary) {
    if (tokens.empty()) {
        return Error(ErrorCode::EMPTY_INPUT, "Text contains no tokens");
    }

    FrequencyVector vector(vocabulary.size());
    vector.token_count_ = tokens.size();

    const double increment = FREQUENCY_SCALE / static_cast<double>(tokens.size());

    for (const auto& token : tokens) {
        auto id = vocabulary.lookup(token);
        if (!id) {
            continue;
        }
        vector.values_[*id] += increment;
        ++vector.recognized_count_;
    }

    return vector;
}

}  // namespace codelang
