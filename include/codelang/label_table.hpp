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
 * Fixed bijection between classifier label ids and language symbols
 * ("python", "go", ...). Ids are dense over 0..size()-1.
 */
class LabelTable {
public:
    using Entry = std::pair<LabelId, std::string>;

    LabelTable() = default;

    // Rejects empty tables, duplicate ids or symbols and id gaps
    static Result<LabelTable> create(std::vector<Entry> entries);

    // UNKNOWN_LABEL if the id is not in the table
    Result<std::string> resolve(LabelId id) const;

    std::optional<LabelId> find(const std::string& symbol) const;

    const std::vector<std::string>& symbols() const { return symbols_; }
    size_t size() const { return symbols_.size(); }
    bool contains(LabelId id) const { return id < symbols_.size(); }

private:
    std::vector<std::string> symbols_;  // indexed by id
    std::unordered_map<std::string, LabelId> ids_;
};

}  // namespace codelang
