#pragma once

#include <codelang/core_types.hpp>
#include <codelang/result.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codelang {

/**
 * Static token -> feature id table from the trained model.
 *
 * Ids are unique and dense over 0..size()-1. Immutable once created.
 */
class Vocabulary {
public:
    using Entry = std::pair<std::string, FeatureId>;

    Vocabulary() = default;

    /**
     * Build a vocabulary, rejecting duplicate tokens, duplicate ids
     * and id gaps with MALFORMED_MODEL.
     */
    static Result<Vocabulary> create(std::vector<Entry> entries);

    std::optional<FeatureId> lookup(const std::string& token) const;

    // Token for an id (empty string if out of range)
    const std::string& token(FeatureId id) const;

    size_t size() const { return tokens_.size(); }
    bool empty() const { return tokens_.empty(); }
    bool contains(FeatureId id) const { return id < tokens_.size(); }

private:
    std::unordered_map<std::string, FeatureId> ids_;
    std::vector<std::string> tokens_;  // indexed by id
};

}  // namespace codelang
