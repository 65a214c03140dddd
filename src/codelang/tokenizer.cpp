#include <codelang/tokenizer.hpp>
#include <codelang/core_types.hpp>

namespace codelang {

bool Tokenizer::is_word_char(char c) {
    // ASCII only; bytes of multi-byte UTF-8 sequences are symbol bytes
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '_';
}

bool Tokenizer::is_space_char(char c) {
    return c == ' ' || c == '\t' || c == '\n' ||
           c == '\r' || c == '\v' || c == '\f';
}

std::vector<std::string> Tokenizer::singles(const std::string& text) const {
    std::vector<std::string> result;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        char c = text[i];

        if (is_space_char(c)) {
            ++i;
            continue;
        }

        size_t end = i + 1;
        if (is_word_char(c)) {
            while (end < n && is_word_char(text[end])) {
                ++end;
            }
        } else {
            while (end < n && !is_word_char(text[end]) && !is_space_char(text[end])) {
                ++end;
            }
        }

        result.emplace_back(text, i, end - i);
        i = end;
    }

    return result;
}

std::vector<std::string> Tokenizer::pairs(const std::vector<std::string>& singles) const {
    std::vector<std::string> result;
    if (singles.size() < 2) {
        return result;
    }

    result.reserve(singles.size() - 1);
    for (size_t i = 0; i + 1 < singles.size(); ++i) {
        std::string pair;
        pair.reserve(singles[i].size() + 1 + singles[i + 1].size());
        pair += singles[i];
        pair += BIGRAM_SEPARATOR;
        pair += singles[i + 1];
        result.push_back(std::move(pair));
    }

    return result;
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> tokens = singles(text);
    std::vector<std::string> bigrams = pairs(tokens);

    tokens.reserve(tokens.size() + bigrams.size());
    for (auto& bigram : bigrams) {
        tokens.push_back(std::move(bigram));
    }

    return tokens;
}

}  // namespace codelang
