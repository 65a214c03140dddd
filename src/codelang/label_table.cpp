#include <codelang/label_table.hpp>

namespace codelang {

Result<LabelTable> LabelTable::create(std::vector<Entry> entries) {
    if (entries.empty()) {
        return Error(ErrorCode::MALFORMED_MODEL, "Label table is empty");
    }

    LabelTable table;
    table.symbols_.resize(entries.size());
    table.ids_.reserve(entries.size());

    std::vector<bool> seen(entries.size(), false);

    for (auto& [id, symbol] : entries) {
        if (id >= entries.size()) {
            return Error(ErrorCode::MALFORMED_MODEL,
                         "Label id " + std::to_string(id) + " outside dense range");
        }
        if (seen[id]) {
            return Error(ErrorCode::MALFORMED_MODEL,
                         "Duplicate label id " + std::to_string(id));
        }
        if (symbol.empty()) {
            return Error(ErrorCode::MALFORMED_MODEL,
                         "Label " + std::to_string(id) + " has an empty symbol");
        }
        if (table.ids_.count(symbol) > 0) {
            return Error(ErrorCode::MALFORMED_MODEL,
                         "Duplicate label symbol '" + symbol + "'");
        }

        seen[id] = true;
        table.ids_.emplace(symbol, id);
        table.symbols_[id] = std::move(symbol);
    }

    return table;
}

Result<std::string> LabelTable::resolve(LabelId id) const {
    if (id >= symbols_.size()) {
        return Error(ErrorCode::UNKNOWN_LABEL,
                     "No language for label id " + std::to_string(id));
    }
    return symbols_[id];
}

std::optional<LabelId> LabelTable::find(const std::string& symbol) const {
    auto it = ids_.find(symbol);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace codelang
