#include <codelang/vocabulary.hpp>

namespace codelang {

namespace {

const std::string EMPTY_TOKEN;

}  // namespace

Result<Vocabulary> Vocabulary::create(std::vector<Entry> entries) {
    Vocabulary vocab;
    vocab.ids_.reserve(entries.size());
    vocab.tokens_.resize(entries.size());

    std::vector<bool> seen(entries.size(), false);

    for (auto& [token, id] : entries) {
        if (id >= entries.size()) {
            return Error(ErrorCode::MALFORMED_MODEL,
                         "Vocabulary id " + std::to_string(id) +
                         " outside dense range 0.." + std::to_string(entries.size() - 1));
        }
        if (seen[id]) {
            return Error(ErrorCode::MALFORMED_MODEL,
                         "Duplicate vocabulary id " + std::to_string(id));
        }
        if (vocab.ids_.count(token) > 0) {
            return Error(ErrorCode::MALFORMED_MODEL,
                         "Duplicate vocabulary token '" + token + "'");
        }

        seen[id] = true;
        vocab.ids_.emplace(token, id);
        vocab.tokens_[id] = std::move(token);
    }

    return vocab;
}

std::optional<FeatureId> Vocabulary::lookup(const std::string& token) const {
    auto it = ids_.find(token);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& Vocabulary::token(FeatureId id) const {
    if (id >= tokens_.size()) {
        return EMPTY_TOKEN;
    }
    return tokens_[id];
}

}  // namespace codelang
